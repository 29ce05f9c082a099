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

#include <sys/socket.h>
#include <sys/types.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <unistd.h>
#include <netdb.h>
#include <errno.h>
#include <fcntl.h>
#include <string.h>

#include <replica/replica_socketutil.h>
#include <replica/replica_util.h>

#include <replica/replica_log.h>

namespace replica
{

int SocketUtil::create(const char *host, int port, std::stringstream *error)
{
    struct addrinfo hints;
    ::memset(&hints, 0, sizeof(hints));
    hints.ai_family = PF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::stringstream service;
    service << port;

    struct addrinfo *info = 0;
    int result = getaddrinfo(host, service.str().c_str(), &hints, &info);
    if (result != 0) {
        *error << "Failed to resolve the host '" << host << "': " << gai_strerror(result);
        return -1;
    }

    struct addrinfo *ptr = info;
    for (; ptr != 0; ptr = ptr->ai_next) {
        if (ptr->ai_family == AF_INET || ptr->ai_family == AF_INET6) {
            break;
        }
    }

    if (!ptr) {
        freeaddrinfo(info);
        *error << "Failed to resolve the host '" << host << "' into an ip address";
        return -1;
    }

    sockaddr_storage addr;
    socklen_t addrlen = ptr->ai_addrlen;
    ::memcpy(&addr, ptr->ai_addr, ptr->ai_addrlen);
    int family = ptr->ai_family;
    freeaddrinfo(info);

    int sock = socket(family, SOCK_STREAM, IPPROTO_TCP);
    if (sock == -1) {
        *error << "Failed to create the socket: " << strerror(errno);
        return -1;
    }

    setNonBlocking(sock);

    result = connect(sock, reinterpret_cast<sockaddr*>(&addr), addrlen);
    if (result != 0 && errno != EINPROGRESS) {
        *error << "Failed to connect to '" << host << ":" << port << "': " << strerror(errno);
        ::close(sock);
        return -1;
    }

    fd_set fdset;
    struct timeval tv;
    FD_ZERO(&fdset);
    FD_SET(sock, &fdset);
    tv.tv_sec = 10;
    tv.tv_usec = 0;

    result = select(sock + 1, NULL, &fdset, NULL, &tv);

    if (result < 0) {
        *error << "Failed to connect to '" << host << ":" << port << "': " << strerror(errno);
        ::close(sock);
        return -1;
    } else if (result == 0) {
        *error << "Failed to connect to '" << host << ":" << port << "': connection timeout";
        ::close(sock);
        return -1;
    }

    int socketError = 0;
    socklen_t length = sizeof(socketError);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &socketError, &length) != 0 || socketError != 0) {
        *error << "Failed to connect to '" << host << ":" << port << "': " << strerror(socketError);
        ::close(sock);
        return -1;
    }

    return sock;
}

void SocketUtil::close(int socket)
{
    ::close(socket);
}

bool SocketUtil::setNonBlocking(int socket)
{
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1 || fcntl(socket, F_SETFL, flags | O_NONBLOCK) == -1) {
        LOG_ERROR(SOCKET_NONBLOCK) << "Failed to enable nonblocking mode: " << Util::getLastError() << LOG_END
        return false;
    }
    return true;
}

int SocketUtil::read(int socket, char *buffer, int size)
{
    int rc = static_cast<int>(::read(socket, buffer, size));
    if (rc == -1) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_ERROR(SOCKET_READ) << "Error reading from socket: " << Util::getLastError() << LOG_END
            return -1;
        } else {
            return 0;
        }
    } else if (rc == 0) {
        LOG_DEBUG(SOCKET_READ) << "Socket was closed by the other end" << LOG_END
        return -1;
    }
    return rc;
}

int SocketUtil::write(int socket, const char *buffer, int size)
{
    int rc = static_cast<int>(::write(socket, buffer, size));
    if (rc == -1) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_ERROR(SOCKET_WRITE) << "Error writing to socket: " << Util::getLastError() << LOG_END
            return -1;
        } else {
            return 0;
        }
    } else if (rc == 0) {
        LOG_ERROR(SOCKET_WRITE) << "Socket was closed unexpectedly" << LOG_END
        return -1;
    }
    return rc;
}

bool SocketUtil::isReadable(int socket, int timeoutInMilliSeconds)
{
    struct timeval tv;
    tv.tv_sec = timeoutInMilliSeconds / 1000;
    tv.tv_usec = (timeoutInMilliSeconds % 1000) * 1000;

    fd_set readFDs;
    FD_ZERO(&readFDs);
    FD_SET(socket, &readFDs);

    return select(socket + 1, &readFDs, 0, 0, &tv) > 0;
}

bool SocketUtil::isWritable(int socket, int timeoutInMilliSeconds)
{
    struct timeval tv;
    tv.tv_sec = timeoutInMilliSeconds / 1000;
    tv.tv_usec = (timeoutInMilliSeconds % 1000) * 1000;

    fd_set writeFDs;
    FD_ZERO(&writeFDs);
    FD_SET(socket, &writeFDs);

    return select(socket + 1, 0, &writeFDs, 0, &tv) > 0;
}

} // namespace replica
