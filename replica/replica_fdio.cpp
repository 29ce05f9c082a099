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

#include <replica/replica_fdio.h>

#include <replica/replica_log.h>
#include <replica/replica_socketutil.h>

namespace replica
{

FdIO::FdIO(int readDescriptor, int writeDescriptor, bool ownsDescriptors)
    : IO()
    , d_readDescriptor(readDescriptor)
    , d_writeDescriptor(writeDescriptor)
    , d_ownsDescriptors(ownsDescriptors)
    , d_isClosed(false)
{
}

FdIO::~FdIO()
{
    closeChannel();
}

void FdIO::createChannel(const char *subsystem)
{
    LOG_DEBUG(FDIO_CHANNEL) << "Serving '" << (subsystem ? subsystem : "") << "' on descriptors "
                            << d_readDescriptor << "/" << d_writeDescriptor << LOG_END

    if (!SocketUtil::setNonBlocking(d_readDescriptor) || !SocketUtil::setNonBlocking(d_writeDescriptor)) {
        RAISE_CHANNEL(FDIO_CHANNEL) << "Failed to set up the channel descriptors" << LOG_END
    }
}

void FdIO::closeChannel()
{
    if (d_isClosed) {
        return;
    }
    d_isClosed = true;

    if (d_ownsDescriptors) {
        SocketUtil::close(d_readDescriptor);
        if (d_writeDescriptor != d_readDescriptor) {
            SocketUtil::close(d_writeDescriptor);
        }
    }
}

int FdIO::read(char *buffer, int size)
{
    if (d_isClosed) {
        return -1;
    }

    int rc = SocketUtil::read(d_readDescriptor, buffer, size);
    if (rc < 0) {
        d_isClosed = true;
    }
    return rc;
}

int FdIO::write(const char *buffer, int size)
{
    if (d_isClosed) {
        return -1;
    }

    int rc = SocketUtil::write(d_writeDescriptor, buffer, size);
    if (rc < 0) {
        d_isClosed = true;
    }
    return rc;
}

void FdIO::flush()
{
}

bool FdIO::isClosed()
{
    return d_isClosed;
}

bool FdIO::isReadable(int timeoutInMilliSeconds)
{
    return !d_isClosed && SocketUtil::isReadable(d_readDescriptor, timeoutInMilliSeconds);
}

bool FdIO::isWritable(int timeoutInMilliSeconds)
{
    return !d_isClosed && SocketUtil::isWritable(d_writeDescriptor, timeoutInMilliSeconds);
}

} // namespace replica
