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

#include <replica/replica_client.h>
#include <replica/replica_directoryarchive.h>
#include <replica/replica_file.h>
#include <replica/replica_log.h>
#include <replica/replica_preset.h>
#include <replica/replica_sshio.h>
#include <replica/replica_timeutil.h>
#include <replica/replica_util.h>

#include <string>
#include <vector>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>

using namespace replica;

namespace {

int g_cancelFlag = 0;

void interruptHandler(int)
{
    g_cancelFlag = 1;
}

void printUsage(const char *program)
{
    ::printf("Usage: %s [-v] [-t timeout_ms] [-i local_file]... host port user password keyfile archive_dir "
             "preset [archive path owner]\n", program);
    ::printf("       where preset is either 'custom' (which needs the remote archive, path and owner) or 'mail';\n");
    ::printf("       use '-' for an empty password or keyfile, and '-' as the owner for all owners.\n");
    ::printf("       Each '-i' file is added to the local archive under the preset path before the sync.\n");
}

// Add 'localFile' to 'archive' under the preset root, named after its last component.
bool importFile(DirectoryArchive *archive, const Preset &preset, const char *localFile)
{
    std::string payload;
    if (!File::readContents(localFile, &payload)) {
        return false;
    }

    const char *base = ::strrchr(localFile, '/');
    base = base ? base + 1 : localFile;

    FileRecord record;
    if (!archive->add(preset.getAbsolutePath(base), TimeUtil::getTimeOfDay(), preset.getOwner(), payload,
                      &record)) {
        return false;
    }
    LOG_INFO(SYNC_IMPORT) << "Added " << record.toString() << LOG_END
    return true;
}

} // unnamed namespace

int main(int argc, char *argv[])
{
    int timeout = Stream::DefaultTimeout;
    std::vector<const char *> imports;
    std::vector<const char *> arguments;

    for (int i = 1; i < argc; ++i) {
        if (::strcmp(argv[i], "-v") == 0) {
            Log::setLevel(Log::Debug);
        } else if (::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout = ::atoi(argv[++i]);
        } else if (::strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            imports.push_back(argv[++i]);
        } else {
            arguments.push_back(argv[i]);
        }
    }

    if (arguments.size() != 7 && arguments.size() != 10) {
        printUsage(argv[0]);
        return 2;
    }

    const char *host = arguments[0];
    int port = ::atoi(arguments[1]);
    const char *user = arguments[2];
    const char *password = ::strcmp(arguments[3], "-") == 0 ? "" : arguments[3];
    const char *keyFile = ::strcmp(arguments[4], "-") == 0 ? "" : arguments[4];
    const char *archiveDir = arguments[5];
    std::string presetName = arguments[6];

    Preset preset;
    if (presetName == "custom") {
        if (arguments.size() != 10) {
            printUsage(argv[0]);
            return 2;
        }
        Uuid owner;
        if (::strcmp(arguments[9], "-") != 0 && !Uuid::parse(arguments[9], &owner)) {
            ::printf("Invalid owner id: %s\n", arguments[9]);
            return 2;
        }
        preset = Preset::custom(arguments[7], arguments[8], owner, 0);
    } else if (presetName == "mail") {
        preset = Preset::mailClient(0);
    } else {
        ::printf("Invalid preset: %s\n", presetName.c_str());
        return 2;
    }

    ::signal(SIGINT, interruptHandler);
    ::signal(SIGPIPE, SIG_IGN);

    Util::startup();
    if (!SSHIO::startup()) {
        LOG_ERROR(LIBSSH2_INIT) << "libssh2 initialization failed" << LOG_END
        return 1;
    }

    bool success = false;
    try {
        DirectoryArchive archive(archiveDir);
        if (!archive.open()) {
            LOG_ERROR(SYNC_ARCHIVE) << "Unable to open the archive in '" << archiveDir << "'" << LOG_END
        } else {
            bool imported = true;
            for (size_t i = 0; i < imports.size() && imported; ++i) {
                imported = importFile(&archive, preset, imports[i]);
            }

            if (imported) {
                SSHIO sshio;
                sshio.connect(host, port, user, password, keyFile, 0);
                sshio.createChannel("replication");

                ClientSession client(&sshio, &archive, preset, &g_cancelFlag);
                client.setTimeout(timeout);
                client.statusOut = [](const char *status) { ::printf("%s\n", status); };

                success = client.run();

                const Session &session = client.getSession();
                ::printf("pulled %lld, pushed %lld, skipped %lld, downloaded %lld bytes, uploaded %lld bytes\n",
                         static_cast<long long>(session.d_filesPulled),
                         static_cast<long long>(session.d_filesPushed),
                         static_cast<long long>(session.d_filesSkipped),
                         static_cast<long long>(session.d_bytesDownloaded),
                         static_cast<long long>(session.d_bytesUploaded));
                sshio.closeSession();
            }
        }
    } catch (Exception &e) {
        LOG_ERROR(SYNC_ERROR) << "Sync failed: " << e.getMessage() << LOG_END
    }

    SSHIO::cleanup();
    Util::cleanup();

    return success ? 0 : 1;
}
