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

#include <replica/replica_session.h>

#include <replica/replica_log.h>

#include <sstream>

namespace replica
{

Session::Session(Role role)
    : d_role(role)
    , d_preset()
    , d_version(0)
    , d_phase(Init)
    , d_packetsSent(0)
    , d_packetsReceived(0)
    , d_filesPulled(0)
    , d_filesPushed(0)
    , d_filesSkipped(0)
    , d_bytesDownloaded(0)
    , d_bytesUploaded(0)
    , d_operationConfirmed(false)
    , d_hasPendingSync(false)
    , d_pendingAction(NoAction)
    , d_pendingClientRecord()
    , d_pendingServerRecord()
{
}

const char *Session::getPhaseName(int phase)
{
    switch (phase) {
    case Init: return "Init";
    case AwaitVersion: return "AwaitVersion";
    case Negotiating: return "Negotiating";
    case AwaitConfirm: return "AwaitConfirm";
    case Pulling: return "Pulling";
    case Pushing: return "Pushing";
    case Closing: return "Closing";
    case Closed: return "Closed";
    case Aborted: return "Aborted";
    default: return "UNDEFINED";
    }
}

std::string Session::getStatistics() const
{
    std::stringstream stream;
    stream << "phase=" << getPhaseName(d_phase)
           << " version=" << d_version
           << " sent=" << d_packetsSent
           << " received=" << d_packetsReceived
           << " pulled=" << d_filesPulled
           << " pushed=" << d_filesPushed
           << " skipped=" << d_filesSkipped
           << " downloaded=" << d_bytesDownloaded
           << " uploaded=" << d_bytesUploaded;
    return stream.str();
}

void Session::clearPendingSync()
{
    d_hasPendingSync = false;
    d_pendingAction = NoAction;
    d_pendingClientRecord = FileRecord();
    d_pendingServerRecord = FileRecord();
}

PacketStream::PacketStream(Stream *stream, Session *session)
    : d_stream(stream)
    , d_session(session)
    , d_buffer()
{
}

void PacketStream::send(const Packet &packet)
{
    PacketCodec::encode(packet, &d_buffer);
    d_stream->writeFrame(d_buffer);
    ++d_session->d_packetsSent;

    LOG_TRACE(RPL_SEND) << (d_session->d_role == ClientRole ? "client" : "server") << " sent "
                        << packet.toString() << LOG_END
}

void PacketStream::receive(Packet *packet)
{
    d_stream->readFrame(&d_buffer);
    ++d_session->d_packetsReceived;
    PacketCodec::decode(d_buffer.data(), static_cast<int>(d_buffer.size()), packet);

    LOG_TRACE(RPL_RECEIVE) << (d_session->d_role == ClientRole ? "client" : "server") << " received "
                           << packet->toString() << LOG_END
}

} // namespace replica
