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

#include <replica/replica_log.h>
#include <replica/replica_transfer.h>
#include <replica/replica_util.h>

#include <vector>

namespace replica
{

ClientSession::ClientSession(IO *io, Archive *localArchive, const Preset &preset, int *cancelFlag)
    : statusOut()
    , d_io(io)
    , d_stream(io, cancelFlag)
    , d_session(ClientRole)
    , d_packets(&d_stream, &d_session)
    , d_archive(localArchive)
    , d_preferredVersion(Util::MaximumVersion)
    , d_inTransfer(false)
    , d_channelFailed(false)
    , d_remoteAborted(false)
    , d_timeouts(0)
{
    d_session.d_preset = preset;
}

ClientSession::~ClientSession()
{
}

void ClientSession::setPreferredVersion(uint32_t version)
{
    d_preferredVersion = version;
}

void ClientSession::setTimeout(int milliseconds)
{
    d_stream.setTimeout(milliseconds);
}

bool ClientSession::run()
{
    d_session.d_phase = Session::Init;
    d_inTransfer = false;
    d_channelFailed = false;
    d_remoteAborted = false;
    d_timeouts = 0;

    try {
        handshake();
        if (d_session.d_phase == Session::Aborted) {
            return false;
        }

        d_session.d_phase = Session::Pulling;
        pull();

        d_session.d_phase = Session::Pushing;
        push();

        d_session.d_phase = Session::Closing;
        d_packets.send(Packet::close());
        d_session.d_phase = Session::Closed;

        LOG_INFO(CLIENT_CLOSED) << "Session closed: " << d_session.getStatistics() << LOG_END
        return true;
    } catch (ChannelError &e) {
        // Covers a timeout during the handshake too; nothing more is sent.
        LOG_ERROR(CLIENT_ABORTED) << "Session aborted in " << Session::getPhaseName(d_session.d_phase)
                                  << ": " << e.getMessage() << LOG_END
    } catch (Exception &e) {
        LOG_ERROR(CLIENT_ABORTED) << "Session aborted in " << Session::getPhaseName(d_session.d_phase)
                                  << ": " << e.getMessage() << LOG_END
        if (!d_remoteAborted && !d_channelFailed) {
            try {
                d_packets.send(Packet::abort(e.getMessage()));
            } catch (ChannelError &sendError) {
                LOG_DEBUG(CLIENT_ABORTED) << "Unable to send RPL_ABORT: " << sendError.getMessage() << LOG_END
            }
        }
    }

    d_session.d_phase = Session::Aborted;
    return false;
}

void ClientSession::handshake()
{
    Packet packet;

    d_packets.send(Packet::init(d_preferredVersion));
    d_session.d_phase = Session::AwaitVersion;

    receive(&packet);
    expect(packet, RPL_VERSION);
    if (packet.d_version < Util::MinimumVersion || packet.d_version > d_preferredVersion) {
        RAISE_PROTOCOL(CLIENT_VERSION) << "The server offered protocol version " << packet.d_version
                                       << " while versions " << Util::MinimumVersion << " to "
                                       << d_preferredVersion << " are supported" << LOG_END
    }
    d_session.d_version = packet.d_version;
    d_session.d_phase = Session::Negotiating;

    const Preset &preset = d_session.d_preset;
    d_packets.send(Packet::operation(d_session.d_version, preset.getCutoff(), preset.getWireName(),
                                     preset.getArchive(), preset.getPath(), preset.getOwner()));
    d_session.d_phase = Session::AwaitConfirm;

    receive(&packet);
    expect(packet, RPL_CONFIRM);
    if (!packet.d_accepted) {
        LOG_ERROR(CLIENT_REJECTED) << "The server rejected the operation " << preset.toString() << LOG_END
        try {
            d_packets.send(Packet::abort("operation rejected"));
        } catch (ChannelError &e) {
            LOG_DEBUG(CLIENT_REJECTED) << "Unable to send RPL_ABORT: " << e.getMessage() << LOG_END
        }
        d_session.d_phase = Session::Aborted;
        return;
    }

    LOG_INFO(CLIENT_OPERATION) << "Replicating " << preset.toString() << " with protocol version "
                               << d_session.d_version << LOG_END
}

void ClientSession::pull()
{
    const Preset &preset = d_session.d_preset;

    for (;;) {
        Packet packet;
        try {
            d_packets.send(Packet::request(Packet::Pull, FileRecord()));
            receive(&packet);
            if (packet.d_type == RPL_DONE) {
                break;
            }
            expect(packet, RPL_RESPONSE);

            const FileRecord &remote = packet.d_record;
            std::string path = preset.getAbsolutePath(remote.getPath());

            FileRecord local;
            bool found = !remote.getID().isNil() && d_archive->findById(remote.getID(), &local);
            if (!found) {
                found = d_archive->findByPath(path, &local);
            }
            if (!found) {
                local = FileRecord(Uuid(), path, 0, false);
            }

            processFile(local, remote);
        } catch (TimeoutError &e) {
            std::string path = (packet.d_type == RPL_RESPONSE) ? packet.d_record.getPath() : "<next file>";
            recover(path, e);
            continue;
        }
        d_timeouts = 0;
    }
}

void ClientSession::push()
{
    const Preset &preset = d_session.d_preset;

    std::vector<FileRecord> records;
    if (!d_archive->list(preset.getPath(), &records)) {
        LOG_ERROR(CLIENT_LIST) << "Unable to list the local archive under " << preset.getPath() << LOG_END
        return;
    }

    for (size_t i = 0; i < records.size(); ++i) {
        const FileRecord &local = records[i];
        if (!preset.contains(local)) {
            continue;
        }

        try {
            d_packets.send(Packet::request(Packet::Push, toWire(local)));

            Packet packet;
            receive(&packet);
            expect(packet, RPL_RESPONSE);

            processFile(local, packet.d_record);
        } catch (TimeoutError &e) {
            recover(local.getPath(), e);
            continue;
        }
        d_timeouts = 0;
    }
}

void ClientSession::processFile(const FileRecord &local, const FileRecord &remote)
{
    Action action = Reconciler::decide(local, remote);

    LOG_DEBUG(CLIENT_DECIDE) << local.getPath() << ": " << FileRecord::getStateName(local.getState()) << "/"
                             << FileRecord::getStateName(remote.getState()) << " -> "
                             << Reconciler::getName(action) << LOG_END

    d_packets.send(Packet::sync(action, toWire(local)));

    Packet packet;
    receive(&packet);
    expect(packet, RPL_CONFIRM);

    if (!packet.d_accepted) {
        LOG_INFO(RPL_DENIED) << "The server rejected " << Reconciler::getName(action) << " on " << local.getPath()
                             << LOG_END
        if (action != NoAction) {
            ++d_session.d_filesSkipped;
        }
        return;
    }

    execute(action, local, remote);
}

void ClientSession::execute(Action action, const FileRecord &local, const FileRecord &remote)
{
    const Preset &preset = d_session.d_preset;

    switch (action) {
    case NoAction:
    case ActionCount:
        return;

    case ClientCreate:
    case ClientUpdate: {
        std::string payload;
        if (!download(remote, &payload)) {
            return;
        }

        FileRecord record(remote.getID(), preset.getAbsolutePath(remote.getPath()), remote.getModified(), false);
        record.setOwner(local.getID().isNil() ? preset.getOwner() : local.getOwner());
        if (!d_archive->save(record, payload)) {
            skip(record.getPath(), "unable to save the downloaded file");
            return;
        }
        ++d_session.d_filesPulled;
        report("downloaded", record.getPath());
        return;
    }

    case ClientDelete: {
        FileRecord tombstone = local;
        tombstone.setModified(remote.getModified());
        if (!d_archive->remove(tombstone)) {
            skip(local.getPath(), "unable to delete the local file");
            return;
        }
        ++d_session.d_filesPulled;
        report("deleted", local.getPath());
        return;
    }

    case ServerCreate:
    case ServerUpdate: {
        std::string payload;
        if (!d_archive->load(local.getID(), &payload)) {
            skip(local.getPath(), "unable to read the local file");
            return;
        }
        if (!upload(local, payload)) {
            return;
        }
        ++d_session.d_filesPushed;
        report("uploaded", local.getPath());

        if (preset.purgeAfterPush() && !d_archive->purge(local.getID())) {
            LOG_ERROR(CLIENT_PURGE) << "Unable to purge " << local.getPath() << " after delivery" << LOG_END
        }
        return;
    }

    case ServerDelete:
        // The server has applied the deletion before confirming.
        ++d_session.d_filesPushed;
        report("deleted on the server", local.getPath());
        return;
    }
}

bool ClientSession::download(const FileRecord &remote, std::string *payload)
{
    Packet packet;

    d_packets.send(Packet::download(remote.getID(), remote.getPath()));
    receive(&packet);
    expect(packet, RPL_CONFIRM);
    if (!packet.d_accepted) {
        skip(remote.getPath(), "the server refused the download");
        return false;
    }

    d_inTransfer = true;
    Transfer transfer(remote.getID(), remote.getPath(), d_session.d_version);

    try {
        try {
            d_packets.send(Packet::get(Packet::Meta, 0));
            receive(&packet);
            if (packet.d_type == RPL_ABORT) {
                RAISE_INTEGRITY(CLIENT_DOWNLOAD) << "The server aborted the transfer: " << packet.d_reason << LOG_END
            }
            expect(packet, RPL_CHUNK);
            if (packet.d_kind != Packet::Meta) {
                RAISE_PROTOCOL(CLIENT_DOWNLOAD) << "Expected the meta piece of " << remote.getPath() << LOG_END
            }

            ChunkMeta meta;
            meta.d_pieces = packet.d_pieces;
            meta.d_size = packet.d_size;
            meta.d_digest = packet.d_digest;
            transfer.setMeta(meta);

            for (uint32_t i = 0; i < meta.d_pieces; ++i) {
                d_packets.send(Packet::get(Packet::Data, i));
                receive(&packet);
                if (packet.d_type == RPL_ABORT) {
                    RAISE_INTEGRITY(CLIENT_DOWNLOAD) << "The server aborted the transfer: " << packet.d_reason
                                                     << LOG_END
                }
                expect(packet, RPL_CHUNK);
                if (packet.d_kind != Packet::Data) {
                    RAISE_PROTOCOL(CLIENT_DOWNLOAD) << "Expected piece " << i << " of " << remote.getPath()
                                                    << LOG_END
                }
                transfer.addPiece(packet.d_piece, packet.d_data);
                d_session.d_bytesDownloaded += packet.d_data.size();
            }
        } catch (ChannelError &e) {
            if (e.getKind() == Exception::Timeout) {
                throw;
            }
            // The stream ended in the middle of the transfer; what has arrived fails verification below.
            d_channelFailed = true;
        }

        transfer.finish(payload);
    } catch (IntegrityError &e) {
        d_inTransfer = false;
        skip(remote.getPath(), e.getMessage());
        if (d_channelFailed) {
            RAISE_CHANNEL(CLIENT_DOWNLOAD) << "The channel was lost while downloading " << remote.getPath()
                                           << LOG_END
        }
        if (packet.d_type != RPL_ABORT) {
            d_packets.send(Packet::abort(e.getMessage()));
        }
        return false;
    }

    d_packets.send(Packet::done());
    d_inTransfer = false;
    return true;
}

bool ClientSession::upload(const FileRecord &local, const std::string &payload)
{
    Packet packet;
    FileRecord wire = toWire(local);

    Transfer transfer(local.getID(), wire.getPath(), d_session.d_version);
    try {
        transfer.load(payload);
    } catch (IntegrityError &e) {
        skip(local.getPath(), e.getMessage());
        return false;
    }
    ChunkMeta meta = transfer.getMeta();

    d_packets.send(Packet::upload(local.getID(), wire.getPath(), meta.d_size));
    receive(&packet);
    expect(packet, RPL_CONFIRM);
    if (!packet.d_accepted) {
        skip(local.getPath(), "the server refused the upload");
        return false;
    }

    d_inTransfer = true;

    d_packets.send(Packet::meta(RPL_PUT, meta.d_pieces, meta.d_size, meta.d_digest));
    receive(&packet);
    if (packet.d_type == RPL_ABORT) {
        d_inTransfer = false;
        skip(local.getPath(), "the server aborted the upload: " + packet.d_reason);
        return false;
    }
    expect(packet, RPL_RECEIVED);
    if (packet.d_kind != Packet::Meta) {
        RAISE_PROTOCOL(CLIENT_UPLOAD) << "Expected the receipt of the meta piece of " << wire.getPath() << LOG_END
    }

    for (uint32_t i = 0; i < meta.d_pieces; ++i) {
        std::string piece = transfer.getPiece(i);
        d_packets.send(Packet::data(RPL_PUT, i, piece));
        d_session.d_bytesUploaded += piece.size();

        receive(&packet);
        if (packet.d_type == RPL_ABORT) {
            d_inTransfer = false;
            skip(local.getPath(), "the server aborted the upload: " + packet.d_reason);
            return false;
        }
        expect(packet, RPL_RECEIVED);
        if (packet.d_kind != Packet::Data || packet.d_piece != i) {
            RAISE_PROTOCOL(CLIENT_UPLOAD) << "Expected the receipt of piece " << i << " of " << wire.getPath()
                                          << LOG_END
        }
    }

    d_packets.send(Packet::done());
    receive(&packet);
    d_inTransfer = false;
    if (packet.d_type == RPL_ABORT) {
        skip(local.getPath(), "the server failed to store the upload: " + packet.d_reason);
        return false;
    }
    expect(packet, RPL_DONE);
    return true;
}

void ClientSession::recover(const std::string &path, const TimeoutError &error)
{
    if (++d_timeouts >= MaximumTimeouts) {
        RAISE_TIMEOUT(CLIENT_TIMEOUT) << "The server has not answered " << d_timeouts << " times in a row"
                                      << LOG_END
    }

    d_inTransfer = false;
    skip(path, error.getMessage());
    d_stream.discardPending(d_stream.getTimeout());
}

void ClientSession::receive(Packet *packet)
{
    d_packets.receive(packet);

    if (packet->d_type == RPL_ABORT && !d_inTransfer) {
        d_remoteAborted = true;
        RAISE_PROTOCOL(RPL_ABORT) << "The server aborted the session: " << packet->d_reason << LOG_END
    }
}

void ClientSession::expect(const Packet &packet, int type)
{
    if (packet.d_type != type) {
        RAISE_PROTOCOL(CLIENT_UNEXPECTED) << "Expected " << Packet::getTypeName(type) << " in "
                                          << Session::getPhaseName(d_session.d_phase) << " but received "
                                          << Packet::getTypeName(packet.d_type) << LOG_END
    }
}

FileRecord ClientSession::toWire(const FileRecord &record) const
{
    FileRecord wire = record;
    std::string relative;
    if (d_session.d_preset.getRelativePath(record.getPath(), &relative)) {
        wire.setPath(relative);
    }
    wire.setOwner(Uuid());
    return wire;
}

void ClientSession::skip(const std::string &path, const std::string &reason)
{
    LOG_WARNING(CLIENT_SKIP) << "Skipping " << path << ": " << reason << LOG_END
    ++d_session.d_filesSkipped;
}

void ClientSession::report(const char *what, const std::string &path)
{
    LOG_INFO(CLIENT_FILE) << path << " " << what << LOG_END
    if (statusOut) {
        std::string status = path + " " + what;
        statusOut(status.c_str());
    }
}

} // namespace replica
