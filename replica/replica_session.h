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

#ifndef INCLUDED_REPLICA_SESSION_H
#define INCLUDED_REPLICA_SESSION_H

#include <replica/replica_packet.h>
#include <replica/replica_preset.h>
#include <replica/replica_reconciler.h>
#include <replica/replica_record.h>
#include <replica/replica_stream.h>

#include <string>

#include <stdint.h>

namespace replica
{

// The state of one replication run, owned by the state machine running it.
struct Session
{
    enum Phase {
        Init,
        AwaitVersion,
        Negotiating,
        AwaitConfirm,
        Pulling,
        Pushing,
        Closing,
        Closed,
        Aborted
    };

    explicit Session(Role role);

    static const char *getPhaseName(int phase);

    // A summary of the counters for the log.
    std::string getStatistics() const;

    // Forget the accepted RPL_SYNC proposal.
    void clearPendingSync();

    Role d_role;
    Preset d_preset;
    uint32_t d_version;                 // negotiated protocol version; 0 until RPL_VERSION
    Phase d_phase;

    int64_t d_packetsSent;
    int64_t d_packetsReceived;
    int64_t d_filesPulled;              // files changed on the client
    int64_t d_filesPushed;              // files changed on the server
    int64_t d_filesSkipped;             // files rejected, failed or timed out
    int64_t d_bytesDownloaded;
    int64_t d_bytesUploaded;

    // Server side: the operation has been confirmed, and the last accepted proposal which a following
    // transfer must match.
    bool d_operationConfirmed;
    bool d_hasPendingSync;
    Action d_pendingAction;
    FileRecord d_pendingClientRecord;   // relative path, as proposed
    FileRecord d_pendingServerRecord;   // absolute path; nil id if the server doesn't have the file
};

// Sends and receives packets over a stream on behalf of a session, tracing and counting them.
class PacketStream
{
public:
    PacketStream(Stream *stream, Session *session);

    void send(const Packet &packet);

    // Raise FramingError if the frame doesn't hold a valid packet.
    void receive(Packet *packet);

private:
    // NOT IMPLEMENTED
    PacketStream(const PacketStream&);
    PacketStream& operator=(const PacketStream&);

    Stream *d_stream;
    Session *d_session;
    std::string d_buffer;
};

} // namespace replica
#endif //INCLUDED_REPLICA_SESSION_H
