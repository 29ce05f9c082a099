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

#include <replica/replica_authorizer.h>
#include <replica/replica_directoryarchive.h>
#include <replica/replica_fdio.h>
#include <replica/replica_log.h>
#include <replica/replica_server.h>
#include <replica/replica_util.h>
#include <replica/replica_uuid.h>

#include <string>
#include <vector>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <unistd.h>

using namespace replica;

namespace {

int g_cancelFlag = 0;

void terminateHandler(int)
{
    g_cancelFlag = 1;
}

} // unnamed namespace

// Started by sshd as the "replication" subsystem, with the channel on stdin and stdout.  Logging goes to stderr.
int main(int argc, char *argv[])
{
    Log::useStandardError(true);

    int timeout = Stream::DefaultTimeout;
    std::vector<const char *> arguments;

    for (int i = 1; i < argc; ++i) {
        if (::strcmp(argv[i], "-v") == 0) {
            Log::setLevel(Log::Debug);
        } else if (::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout = ::atoi(argv[++i]);
        } else {
            arguments.push_back(argv[i]);
        }
    }

    if (arguments.size() != 1 && arguments.size() != 2) {
        ::fprintf(stderr, "Usage: %s [-v] [-t timeout_ms] archive_root [peer_id]\n", argv[0]);
        ::fprintf(stderr, "       Without a peer id every peer may replicate every file.\n");
        return 2;
    }

    Uuid peer;
    if (arguments.size() == 2 && !Uuid::parse(arguments[1], &peer)) {
        ::fprintf(stderr, "Invalid peer id: %s\n", arguments[1]);
        return 2;
    }

    ::signal(SIGTERM, terminateHandler);
    ::signal(SIGPIPE, SIG_IGN);

    Util::startup();

    AllowAllAuthorizer allowAll;
    OwnerAuthorizer ownerOnly(peer);
    Authorizer *authorizer = peer.isNil() ? static_cast<Authorizer*>(&allowAll) : &ownerOnly;

    bool success = false;
    try {
        DirectoryArchiveProvider provider(arguments[0]);
        FdIO io(STDIN_FILENO, STDOUT_FILENO);
        io.createChannel("replication");

        ServerSession server(&io, &provider, authorizer, peer, &g_cancelFlag);
        server.setTimeout(timeout);
        success = server.run();

        const Session &session = server.getSession();
        LOG_INFO(SUBSYSTEM_DONE) << "Session " << Session::getPhaseName(session.d_phase) << ": "
                                 << session.getStatistics() << LOG_END
        io.closeChannel();
    } catch (Exception &e) {
        LOG_ERROR(SUBSYSTEM_ERROR) << "Subsystem failed: " << e.getMessage() << LOG_END
    }

    Util::cleanup();

    return success ? 0 : 1;
}
