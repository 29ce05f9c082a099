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

#ifndef INCLUDED_REPLICA_SSHIO_H
#define INCLUDED_REPLICA_SSHIO_H

#include <replica/replica_io.h>

#include <functional>
#include <string>

struct _LIBSSH2_SESSION;
struct _LIBSSH2_CHANNEL;

namespace replica
{

// Implementation of the IO interface on top of an SSH session.  The channel runs a named subsystem on the server.
class SSHIO : public IO
{
public:
    SSHIO();
    ~SSHIO();

    static bool startup();
    static void cleanup();

    // Connect to the first reachable server in 'serverList' and authenticate, by 'keyFile' if it is not empty
    // (with 'password' as the passphrase) or else by password.  If 'hostKey' is given the server's SHA1
    // fingerprint must match it.
    void connect(const char *serverList, int port, const char *user, const char *password, const char *keyFile,
                 const char *hostKey);

    // Open a channel and start 'subsystem' on it.
    virtual void createChannel(const char *subsystem);
    virtual void closeChannel();

    void closeSession();

    virtual int read(char *buffer, int size);
    virtual int write(const char *buffer, int size);
    virtual void flush();
    virtual bool isClosed();
    virtual bool isReadable(int timeoutInMilliSeconds);
    virtual bool isWritable(int timeoutInMilliSeconds);

    std::string getLastError();

    // Called with the server name and the fingerprint of a host key that was not given to 'connect'.  Return
    // false to reject the server.
    std::function<bool (const char *server, const char *fingerPrint)> hostKeyOut;

private:
    // NOT IMPLEMENTED
    SSHIO(const SSHIO&);
    SSHIO& operator=(const SSHIO&);

    // Return -1 if the channel failed and 0 if it is merely not ready.
    int checkError(int rc);

    int d_socket;
    _LIBSSH2_SESSION *d_session;
    _LIBSSH2_CHANNEL *d_channel;
};

} // namespace replica

#endif // INCLUDED_REPLICA_SSHIO_H
