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

#ifndef INCLUDED_REPLICA_SOCKETUTIL_H
#define INCLUDED_REPLICA_SOCKETUTIL_H

#include <sstream>

namespace replica
{

struct SocketUtil
{
    // Connect to 'host:port' and return a non-blocking socket, or -1 with the reason written to 'error'.
    static int create(const char *host, int port, std::stringstream *error);

    static void close(int socket);

    // Put an existing descriptor into non-blocking mode.
    static bool setNonBlocking(int socket);

    // Return the number of bytes, 0 if the operation would block, or -1 if the descriptor is closed or failed.
    static int read(int socket, char *buffer, int size);
    static int write(int socket, const char *buffer, int size);

    static bool isReadable(int socket, int timeoutInMilliSeconds);
    static bool isWritable(int socket, int timeoutInMilliSeconds);
};

} // namespace replica
#endif //INCLUDED_REPLICA_SOCKETUTIL_H
