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

#ifndef INCLUDED_REPLICA_CLIENT_H
#define INCLUDED_REPLICA_CLIENT_H

#include <replica/replica_archive.h>
#include <replica/replica_io.h>
#include <replica/replica_log.h>
#include <replica/replica_preset.h>
#include <replica/replica_session.h>
#include <replica/replica_stream.h>

#include <functional>
#include <string>

namespace replica
{

class ClientSession
{
public:
    // The session aborts after this many consecutive replies have timed out.
    enum { MaximumTimeouts = 3 };

    // Create a client session over 'io', whose channel must already be open, replicating 'localArchive' within
    // 'preset'.  If 'cancelFlag' is given, setting '*cancelFlag' to non-zero aborts the session immediately.
    ClientSession(IO *io, Archive *localArchive, const Preset &preset, int *cancelFlag = 0);

    // Destructor.  Does not delete the io channel or the archive.
    ~ClientSession();

    // The highest protocol version to offer; defaults to Util::MaximumVersion.
    void setPreferredVersion(uint32_t version);

    // How long to wait for each reply from the server, in milliseconds.
    void setTimeout(int milliseconds);

    // Run the whole session: handshake, pull loop, push loop, close.  Return true if the session closed
    // gracefully, false if it was aborted.  Files that were rejected or failed are skipped without aborting.
    bool run();

    const Session &getSession() const
    {
        return d_session;
    }

    // Called with a short message about each file that has been processed.
    std::function<void (const char *status)> statusOut;

private:
    // NOT IMPLEMENTED
    ClientSession(const ClientSession&);
    ClientSession& operator=(const ClientSession&);

    void handshake();
    void pull();
    void push();

    // Reconcile one file known locally as 'local' (absolute path, nil id if unknown) and on the server as 'remote'
    // (relative path), and carry out the action if the server confirms it.
    void processFile(const FileRecord &local, const FileRecord &remote);

    void execute(Action action, const FileRecord &local, const FileRecord &remote);

    // Fetch the payload of 'remote'.  Return false if the transfer was refused or failed its integrity check.
    bool download(const FileRecord &remote, std::string *payload);

    // Send the payload of 'local'.  Return false if the transfer was refused or failed on the server.
    bool upload(const FileRecord &local, const std::string &payload);

    // Skip the file whose reply has timed out and drop the late replies.  Raise the timeout again if the server
    // keeps failing to answer.
    void recover(const std::string &path, const TimeoutError &error);

    // Receive the next packet.  An RPL_ABORT outside a transfer ends the session.
    void receive(Packet *packet);

    // Raise a ProtocolViolation if 'packet' is not of 'type'.
    void expect(const Packet &packet, int type);

    // Return 'record' with its path relative to the preset root.
    FileRecord toWire(const FileRecord &record) const;

    // Log and count a file that could not be processed.
    void skip(const std::string &path, const std::string &reason);

    void report(const char *what, const std::string &path);

    IO *d_io;                           // io channel to the server
    Stream d_stream;                    // data stream on top of 'd_io'
    Session d_session;
    PacketStream d_packets;
    Archive *d_archive;                 // the local archive
    uint32_t d_preferredVersion;
    bool d_inTransfer;                  // if a download or an upload is in progress
    bool d_channelFailed;               // the channel has failed; no more packets can be sent
    bool d_remoteAborted;               // the server has sent RPL_ABORT outside a transfer
    int d_timeouts;                     // consecutive replies that have timed out
};

} // namespace replica

#endif // INCLUDED_REPLICA_CLIENT_H
