// Copyright (C) 2015 Acrosync LLC
//
// Unless explicitly acquired and licensed from Licensor under another
// license, the contents of this file are subject to the Reciprocal Public
// License ("RPL") Version 1.5, or subsequent versions as allowed by the RPL,
// and You may not copy or use this file in either source code or executable
// form, except in compliance with the terms and conditions of the RPL.
//
// All software distributed under the RPL is provided strictly on an "AS
// IS" basis, WITHOUT WARRANTY OF ANY KIND, EITHER EXPRESS OR IMPLIED, AND
// LICENSOR HEREBY DISCLAIMS ALL SUCH WARRANTIES, INCLUDING WITHOUT
// LIMITATION, ANY WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
// PURPOSE, QUIET ENJOYMENT, OR NON-INFRINGEMENT. See the RPL for specific
// language governing rights and limitations under the RPL. 

#ifndef INCLUDED_REPLICA_FDIO_H
#define INCLUDED_REPLICA_FDIO_H

#include <replica/replica_io.h>

namespace replica
{

// Implementation of the IO interface on top of a pair of file descriptors.  The subsystem endpoint uses
// stdin/stdout, which sshd connects to the client's channel; the tests use the two ends of a socketpair.
class FdIO : public IO
{
public:
    // If 'ownsDescriptors' is true the descriptors are closed by 'closeChannel' and by the destructor.
    FdIO(int readDescriptor, int writeDescriptor, bool ownsDescriptors = false);
    ~FdIO();

    // The channel already exists; this only switches the descriptors into non-blocking mode.
    virtual void createChannel(const char *subsystem);
    virtual void closeChannel();

    virtual int read(char *buffer, int size);
    virtual int write(const char *buffer, int size);
    virtual void flush();
    virtual bool isClosed();
    virtual bool isReadable(int timeoutInMilliSeconds);
    virtual bool isWritable(int timeoutInMilliSeconds);

private:
    // NOT IMPLEMENTED
    FdIO(const FdIO&);
    FdIO& operator=(const FdIO&);

    int d_readDescriptor;
    int d_writeDescriptor;
    bool d_ownsDescriptors;
    bool d_isClosed;
};

} // namespace replica

#endif // INCLUDED_REPLICA_FDIO_H
