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

#include <replica/replica_sshio.h>

#include <replica/replica_log.h>
#include <replica/replica_socketutil.h>
#include <replica/replica_timeutil.h>
#include <replica/replica_util.h>

#include <libssh2.h>

#include <vector>
#include <sstream>

#include <cstdlib>
#include <cstring>

namespace replica
{

namespace {

const char *g_password = 0;

void keyboardCallback(const char *name, int nameLength,
                      const char *instruction, int instructionLength, int numPrompts,
                      const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                      LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                      void **abstract)
{
    (void)name;
    (void)nameLength;
    (void)instruction;
    (void)instructionLength;
    if (numPrompts == 1) {
        responses[0].text = ::strdup(g_password);
        responses[0].length = ::strlen(g_password);
    }
    (void)prompts;
    (void)abstract;
}

} // unnamed namespace

bool SSHIO::startup()
{
    return 0 == libssh2_init(0);
}

void SSHIO::cleanup()
{
    libssh2_exit();
}

SSHIO::SSHIO()
    : IO()
    , hostKeyOut()
    , d_socket(-1)
    , d_session(0)
    , d_channel(0)
{
}

SSHIO::~SSHIO()
{
    closeSession();
}

void SSHIO::connect(const char *serverList, int port, const char *user, const char *password, const char *keyFile,
                    const char *hostKey)
{
    closeSession();

    std::vector<std::string> servers;
    Util::tokenize(serverList, &servers, ";, \t");

    if (servers.size() == 0) {
        RAISE_CHANNEL(SSH_INIT) << "No server specified" << LOG_END
    }

    unsigned int i;
    for (i = 0; i < servers.size(); ++i) {
        std::stringstream error;
        d_socket = SocketUtil::create(servers[i].c_str(), port, &error);
        if (d_socket != -1) {
            break;
        }
        if (hostKey || i == servers.size() - 1) {
            RAISE_CHANNEL(SOCKET_CONNECT) << error.str() << LOG_END
        }
        LOG_ERROR(SOCKET_CONNECT) << error.str() << LOG_END
    }

    d_session = libssh2_session_init();
    if (!d_session) {
        RAISE_CHANNEL(SSH_INIT) << "Failed to create a libssh2 session" << LOG_END
    }

    libssh2_session_set_blocking(d_session, 1);
    libssh2_session_set_timeout(d_session, 100000);

    int rc = libssh2_session_handshake(d_session, d_socket);
    if (rc != 0) {
        RAISE_CHANNEL(SSH_START) << "Failed to establish an SSH session to '" << servers[i] << ":" << port
                                 << "': " << getLastError() << LOG_END
    }

    if (hostKeyOut || hostKey) {
        const char *fingerPrint = libssh2_hostkey_hash(d_session, LIBSSH2_HOSTKEY_HASH_SHA1);
        if (!fingerPrint) {
            RAISE_CHANNEL(SSH_HOSTKEY) << "Unable to obtain the host key of '" << servers[i] << "'" << LOG_END
        }

        std::string hash;
        const char *hex = "0123456789ABCDEF";
        for (unsigned int j = 0; j < 20; ++j) {
            unsigned char c = fingerPrint[j];
            if (j != 0) {
                hash += ":";
            }
            hash += hex[c / 16];
            hash += hex[c % 16];
        }

        if (hostKey) {
            if (hash != hostKey) {
                RAISE_CHANNEL(SSH_HOSTKEY) << hash << " : new host key for server '" << servers[i] << "'" << LOG_END
            }
        } else if (!hostKeyOut(servers[i].c_str(), hash.c_str())) {
            RAISE_CHANNEL(SSH_HOSTKEY) << "New host key for server '" << servers[i] << "' is not accepted" << LOG_END
        }
    }

    const char *methods = libssh2_userauth_list(d_session, user, ::strlen(user));
    if (methods == NULL) {
        RAISE_CHANNEL(SSH_AUTH) << "User '" << user << "' is not allowed to log in to '" << servers[i] << "'"
                                << LOG_END
    }

    if (keyFile != 0 && *keyFile != 0) {
        if (::strstr(methods, "publickey") == NULL) {
            RAISE_CHANNEL(SSH_AUTH) << "Public key authorization is not permitted by the server" << LOG_END
        }

        rc = libssh2_userauth_publickey_fromfile(d_session, user, NULL, keyFile, password);
        if (rc != 0) {
            RAISE_CHANNEL(SSH_AUTH) << "Authentication by public key failed: " << getLastError() << LOG_END
        }
    } else if (::strstr(methods, "password") != NULL) {
        rc = libssh2_userauth_password(d_session, user, password);
        if (rc != 0) {
            RAISE_CHANNEL(SSH_AUTH) << "Invalid username or password: " << getLastError() << LOG_END
        }
    } else if (::strstr(methods, "keyboard-interactive") != NULL) {
        g_password = password;
        rc = libssh2_userauth_keyboard_interactive(d_session, user, &keyboardCallback);
        g_password = 0;
        if (rc != 0) {
            RAISE_CHANNEL(SSH_AUTH) << "Invalid username/password: " << getLastError() << LOG_END
        }
    } else {
        RAISE_CHANNEL(SSH_AUTH) << "Authentication by password not supported" << LOG_END
    }

    libssh2_keepalive_config(d_session, 1, 5);
    LOG_INFO(SSH_CONNECT) << "Connected to '" << servers[i] << ":" << port << "' as '" << user << "'" << LOG_END
}

void SSHIO::createChannel(const char *subsystem)
{
    closeChannel();

    if (!d_session) {
        RAISE_CHANNEL(SSH_NO_SESSION) << "No SSH session available" << LOG_END
    }

    libssh2_session_set_blocking(d_session, 1);

    d_channel = libssh2_channel_open_session(d_session);
    if (!d_channel) {
        RAISE_CHANNEL(SSH_CREATE) << "Failed to create a new ssh channel: " << getLastError() << LOG_END
    }

    int rc = libssh2_channel_subsystem(d_channel, subsystem);
    if (rc != 0) {
        RAISE_CHANNEL(SSH_SUBSYSTEM) << "Failed to start the subsystem '" << subsystem << "': " << getLastError()
                                     << LOG_END
    }

    libssh2_session_set_blocking(d_session, 0);
}

void SSHIO::closeChannel()
{
    if (d_channel) {
        libssh2_session_set_blocking(d_session, 1);
        libssh2_channel_close(d_channel);
        libssh2_channel_free(d_channel);
        d_channel = 0;
    }
}

void SSHIO::closeSession()
{
    if (d_session) {
        closeChannel();

        int64_t startTime = TimeUtil::getTimeOfDay() / 1000000;
        while (libssh2_session_disconnect(d_session, "work done") == LIBSSH2_ERROR_EAGAIN) {
            if (TimeUtil::getTimeOfDay() / 1000000 - startTime > 10) {
                break;
            }
        }

        startTime = TimeUtil::getTimeOfDay() / 1000000;
        while (libssh2_session_free(d_session) == LIBSSH2_ERROR_EAGAIN) {
            if (TimeUtil::getTimeOfDay() / 1000000 - startTime > 10) {
                break;
            }
        }
        d_session = 0;
    }

    if (d_socket != -1) {
        SocketUtil::close(d_socket);
        d_socket = -1;
    }
}

int SSHIO::read(char *buffer, int size)
{
    if (!d_channel) {
        return -1;
    }

    // Make sure the receive window is large enough for a full frame
    const unsigned long minWindowSize = 1024 * 1024;
    unsigned long windowSize = libssh2_channel_window_read_ex(d_channel, NULL, NULL);
    if (windowSize < minWindowSize) {
        libssh2_channel_receive_window_adjust2(d_channel, minWindowSize * 2, 0, 0);
    }

    int rc = static_cast<int>(libssh2_channel_read(d_channel, buffer, size));
    if (rc > 0) {
        return rc;
    }

    if (rc == 0 && libssh2_channel_eof(d_channel)) {
        LOG_DEBUG(SSH_EOF) << "The ssh channel has been closed by the server" << LOG_END
        return -1;
    }

    return checkError(rc);
}

int SSHIO::write(const char *buffer, int size)
{
    if (!d_channel) {
        return -1;
    }

    int rc = static_cast<int>(libssh2_channel_write(d_channel, buffer, size));
    if (rc > 0) {
        return rc;
    }

    return checkError(rc);
}

void SSHIO::flush()
{
    if (d_channel) {
        libssh2_channel_flush(d_channel);
    }
}

bool SSHIO::isReadable(int timeoutInMilliSeconds)
{
    return SocketUtil::isReadable(d_socket, timeoutInMilliSeconds);
}

bool SSHIO::isWritable(int timeoutInMilliSeconds)
{
    return SocketUtil::isWritable(d_socket, timeoutInMilliSeconds);
}

int SSHIO::checkError(int rc)
{
    if (rc == LIBSSH2_ERROR_EAGAIN || rc == 0) {
        return 0;
    }

    switch (rc) {
    case LIBSSH2_ERROR_ALLOC:
        LOG_ERROR(SSH_ALLOC) << "Allocation failed during an SSH operation" << LOG_END
        break;
    case LIBSSH2_ERROR_SOCKET_SEND:
        LOG_ERROR(SSH_SOCK) << "Unable to send data over the SSH channel" << LOG_END
        break;
    case LIBSSH2_ERROR_CHANNEL_CLOSED:
        LOG_ERROR(SSH_CLOSED) << "The ssh channel has been closed" << LOG_END
        break;
    case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
        LOG_ERROR(SSH_EOF) << "The ssh channel has been requested to be closed" << LOG_END
        break;
    default:
        LOG_ERROR(SSH_ERROR) << "SSH error: " << getLastError() << LOG_END
        break;
    }
    return -1;
}

bool SSHIO::isClosed()
{
    if (!d_channel) {
        return true;
    }

    // EOF must be explicitly checked to detect channel closing.
    if (libssh2_channel_eof(d_channel)) {
        return true;
    }

    char *signal = 0;
    libssh2_channel_get_exit_signal(d_channel, &signal, 0, 0, 0, 0, 0);
    if (signal != 0) {
        LOG_ERROR(SSH_SIGNAL) << "The subsystem was terminated by signal '" << signal << "'" << LOG_END
        ::free(signal);
        return true;
    }
    return false;
}

std::string SSHIO::getLastError()
{
    char *message;
    int length;

    if (d_session && libssh2_session_last_error(d_session, &message, &length, 0)) {
        return std::string(message, length);
    } else {
        return std::string("<no error>");
    }
}

} // namespace replica
