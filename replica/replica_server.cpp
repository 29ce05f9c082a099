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

#include <replica/replica_server.h>

#include <replica/replica_log.h>
#include <replica/replica_util.h>

#include <vector>

namespace replica
{

ServerSession::ServerSession(IO *io, ArchiveProvider *provider, Authorizer *authorizer, const Uuid &peer,
                             int *cancelFlag)
    : d_io(io)
    , d_stream(io, cancelFlag)
    , d_session(ServerRole)
    , d_packets(&d_stream, &d_session)
    , d_provider(provider)
    , d_authorizer(authorizer)
    , d_peer(peer)
    , d_archive(0)
    , d_transfer(0)
    , d_isUpload(false)
{
}

ServerSession::~ServerSession()
{
    dropTransfer();
}

void ServerSession::setTimeout(int milliseconds)
{
    d_stream.setTimeout(milliseconds);
}

bool ServerSession::run()
{
    d_session.d_phase = Session::Init;

    try {
        while (d_session.d_phase != Session::Closed && d_session.d_phase != Session::Aborted) {
            Packet packet;
            d_packets.receive(&packet);
            dispatch(packet);
        }
    } catch (ChannelError &e) {
        LOG_ERROR(SERVER_ABORTED) << "Session aborted in " << Session::getPhaseName(d_session.d_phase) << ": "
                                  << e.getMessage() << LOG_END
        d_session.d_phase = Session::Aborted;
    } catch (Exception &e) {
        LOG_ERROR(SERVER_ABORTED) << "Session aborted in " << Session::getPhaseName(d_session.d_phase) << ": "
                                  << e.getMessage() << LOG_END
        d_session.d_phase = Session::Aborted;
        try {
            d_packets.send(Packet::abort(e.getMessage()));
        } catch (ChannelError &sendError) {
            LOG_DEBUG(SERVER_ABORTED) << "Unable to send RPL_ABORT: " << sendError.getMessage() << LOG_END
        }
    }

    dropTransfer();

    if (d_session.d_phase == Session::Closed) {
        LOG_INFO(SERVER_CLOSED) << "Session closed: " << d_session.getStatistics() << LOG_END
        return true;
    }
    return false;
}

void ServerSession::dispatch(const Packet &packet)
{
    switch (static_cast<PacketType>(packet.d_type)) {
    case RPL_INIT:
        onInit(packet);
        break;
    case RPL_OPERATION:
        onOperation(packet);
        break;
    case RPL_REQUEST:
        onRequest(packet);
        break;
    case RPL_SYNC:
        onSync(packet);
        break;
    case RPL_DOWNLOAD:
        onDownload(packet);
        break;
    case RPL_GET:
        onGet(packet);
        break;
    case RPL_UPLOAD:
        onUpload(packet);
        break;
    case RPL_PUT:
        onPut(packet);
        break;
    case RPL_DONE:
        onDone(packet);
        break;
    case RPL_ABORT:
        onAbort(packet);
        break;
    case RPL_CLOSE:
        onClose(packet);
        break;
    case RPL_VERSION:
    case RPL_CONFIRM:
    case RPL_RESPONSE:
    case RPL_CHUNK:
    case RPL_RECEIVED:
        RAISE_PROTOCOL(SERVER_UNEXPECTED) << Packet::getTypeName(packet.d_type) << " is never sent by a client"
                                          << LOG_END
        break;
    }
}

void ServerSession::onInit(const Packet &packet)
{
    if (d_session.d_phase != Session::Init) {
        RAISE_PROTOCOL(SERVER_UNEXPECTED) << "RPL_INIT received in " << Session::getPhaseName(d_session.d_phase)
                                          << LOG_END
    }

    uint32_t version = packet.d_version;
    if (version > Util::MaximumVersion) {
        version = Util::MaximumVersion;
    }

    if (version < Util::MinimumVersion) {
        LOG_ERROR(SERVER_VERSION) << "The client offered protocol version " << packet.d_version
                                  << " while versions " << Util::MinimumVersion << " to " << Util::MaximumVersion
                                  << " are supported" << LOG_END
        d_packets.send(Packet::abort("unsupported protocol version"));
        d_session.d_phase = Session::Aborted;
        return;
    }

    d_session.d_version = version;
    d_packets.send(Packet::version(version));
    d_session.d_phase = Session::Negotiating;
}

void ServerSession::onOperation(const Packet &packet)
{
    if (d_session.d_phase != Session::Negotiating) {
        RAISE_PROTOCOL(SERVER_UNEXPECTED) << "RPL_OPERATION received in "
                                          << Session::getPhaseName(d_session.d_phase) << LOG_END
    }
    if (packet.d_version != d_session.d_version) {
        RAISE_PROTOCOL(SERVER_VERSION) << "RPL_OPERATION uses protocol version " << packet.d_version
                                       << " instead of the negotiated " << d_session.d_version << LOG_END
    }

    Preset preset;
    bool accepted = Preset::fromOperation(ServerRole, packet.d_preset, packet.d_archive, packet.d_path,
                                          packet.d_owner, packet.d_modified, d_peer, &preset);

    if (accepted && !d_authorizer->acceptOperation(preset)) {
        LOG_INFO(RPL_DENIED) << "Operation " << preset.toString() << " rejected for peer " << d_peer.toString()
                             << LOG_END
        accepted = false;
    }

    if (accepted) {
        d_archive = d_provider->open(preset.getArchive());
        if (!d_archive) {
            LOG_WARNING(SERVER_ARCHIVE) << "Unable to open the archive '" << preset.getArchive() << "'" << LOG_END
            accepted = false;
        }
    }

    d_packets.send(Packet::confirm(accepted));

    if (accepted) {
        d_session.d_preset = preset;
        d_session.d_operationConfirmed = true;
        d_session.d_phase = Session::Pulling;
        LOG_INFO(SERVER_OPERATION) << "Serving " << preset.toString() << " to peer " << d_peer.toString()
                                   << " with protocol version " << d_session.d_version << LOG_END
    } else {
        // Only RPL_CLOSE or RPL_ABORT may follow.
        d_session.d_phase = Session::Closing;
    }
}

void ServerSession::onRequest(const Packet &packet)
{
    requireOperation(packet);
    dropTransfer();

    Preset &preset = d_session.d_preset;

    if (packet.d_direction == Packet::Pull) {
        if (!preset.isPullEnabled()) {
            d_packets.send(Packet::done());
            return;
        }

        if (!preset.isEnumerated()) {
            std::vector<FileRecord> records;
            if (!d_archive->list(preset.getPath(), &records)) {
                LOG_ERROR(SERVER_LIST) << "Unable to list the archive under " << preset.getPath() << LOG_END
                records.clear();
            }
            preset.setEnumeration(records);
        }

        FileRecord record;
        if (preset.getNextRecord(&record)) {
            d_packets.send(Packet::response(toWire(record)));
        } else {
            d_packets.send(Packet::done());
        }
        return;
    }

    d_session.d_phase = Session::Pushing;

    bool inScope = false;
    FileRecord record = lookup(packet.d_record, &inScope);
    if (!inScope) {
        // Answered as if unknown; RPL_SYNC refuses whatever is proposed for it.
        LOG_WARNING(SERVER_SCOPE) << packet.d_record.getPath() << " is outside " << preset.toString() << LOG_END
    }
    if (!inScope || record.getID().isNil()) {
        d_packets.send(Packet::response(FileRecord(Uuid(), packet.d_record.getPath(), 0, false)));
    } else {
        d_packets.send(Packet::response(toWire(record)));
    }
}

void ServerSession::onSync(const Packet &packet)
{
    requireOperation(packet);
    dropTransfer();
    d_session.clearPendingSync();

    const Preset &preset = d_session.d_preset;
    const FileRecord &clientRecord = packet.d_record;
    Action proposed = packet.d_action;

    bool inScope = false;
    FileRecord serverRecord = lookup(clientRecord, &inScope);
    Action expected = Reconciler::mirror(Reconciler::decide(serverRecord, clientRecord));

    bool accepted = true;
    if (!inScope) {
        LOG_INFO(RPL_DENIED) << Reconciler::getName(proposed) << " on " << clientRecord.getPath()
                             << " is outside " << preset.toString() << LOG_END
        accepted = false;
    } else if (proposed != expected) {
        LOG_WARNING(SERVER_STALE) << clientRecord.getPath() << ": the client proposed "
                                  << Reconciler::getName(proposed) << " but the server expects "
                                  << Reconciler::getName(expected) << LOG_END
        accepted = false;
    } else if (!d_authorizer->acceptAction(preset, proposed, clientRecord, serverRecord)) {
        LOG_INFO(RPL_DENIED) << Reconciler::getName(proposed) << " on " << clientRecord.getPath()
                             << " rejected for peer " << d_peer.toString() << LOG_END
        accepted = false;
    }

    if (accepted && proposed == ServerDelete) {
        FileRecord tombstone = serverRecord;
        tombstone.setModified(clientRecord.getModified());
        if (d_archive->remove(tombstone)) {
            ++d_session.d_filesPushed;
            LOG_INFO(SERVER_FILE) << serverRecord.getPath() << " deleted" << LOG_END
        } else {
            LOG_ERROR(SERVER_DELETE) << "Unable to delete " << serverRecord.getPath() << LOG_END
            accepted = false;
        }
    }

    if (accepted && proposed != NoAction) {
        d_session.d_hasPendingSync = true;
        d_session.d_pendingAction = proposed;
        d_session.d_pendingClientRecord = clientRecord;
        d_session.d_pendingServerRecord = serverRecord;
    }

    if (!accepted) {
        ++d_session.d_filesSkipped;
    }

    d_packets.send(Packet::confirm(accepted));
}

void ServerSession::onDownload(const Packet &packet)
{
    requireOperation(packet);
    dropTransfer();

    const Uuid &id = packet.d_record.getID();
    bool matches = d_session.d_hasPendingSync && Reconciler::isDownload(d_session.d_pendingAction) &&
                   !id.isNil() && d_session.d_pendingServerRecord.getID() == id;
    const FileRecord serverRecord = d_session.d_pendingServerRecord;
    d_session.clearPendingSync();

    if (!matches) {
        LOG_WARNING(SERVER_DOWNLOAD) << "No accepted download of " << packet.d_record.getPath() << LOG_END
        d_packets.send(Packet::confirm(false));
        return;
    }

    std::string payload;
    if (!d_archive->load(id, &payload)) {
        LOG_ERROR(SERVER_DOWNLOAD) << "Unable to read " << serverRecord.getPath() << LOG_END
        ++d_session.d_filesSkipped;
        d_packets.send(Packet::confirm(false));
        return;
    }

    Transfer *transfer = new Transfer(id, packet.d_record.getPath(), d_session.d_version);
    try {
        transfer->load(payload);
    } catch (IntegrityError &e) {
        LOG_ERROR(SERVER_DOWNLOAD) << "Unable to serve " << serverRecord.getPath() << ": " << e.getMessage()
                                   << LOG_END
        delete transfer;
        ++d_session.d_filesSkipped;
        d_packets.send(Packet::confirm(false));
        return;
    }

    d_transfer = transfer;
    d_isUpload = false;
    d_packets.send(Packet::confirm(true));
}

void ServerSession::onGet(const Packet &packet)
{
    requireTransfer(packet, false);

    if (packet.d_kind == Packet::Meta) {
        ChunkMeta meta = d_transfer->getMeta();
        d_packets.send(Packet::meta(RPL_CHUNK, meta.d_pieces, meta.d_size, meta.d_digest));
        return;
    }

    std::string piece;
    try {
        piece = d_transfer->getPiece(packet.d_piece);
    } catch (IntegrityError &e) {
        abortTransfer(e.getMessage());
        return;
    }

    d_session.d_bytesDownloaded += piece.size();
    d_packets.send(Packet::data(RPL_CHUNK, packet.d_piece, piece));
}

void ServerSession::onUpload(const Packet &packet)
{
    requireOperation(packet);
    dropTransfer();

    const Uuid &id = packet.d_record.getID();
    bool matches = d_session.d_hasPendingSync && Reconciler::isUpload(d_session.d_pendingAction) &&
                   !id.isNil() && d_session.d_pendingClientRecord.getID() == id;

    if (!matches) {
        LOG_WARNING(SERVER_UPLOAD) << "No accepted upload of " << packet.d_record.getPath() << LOG_END
        d_session.clearPendingSync();
        d_packets.send(Packet::confirm(false));
        return;
    }

    // The pending sync stays until the upload is committed; it carries the metadata to store.
    d_transfer = new Transfer(id, packet.d_record.getPath(), d_session.d_version);
    d_isUpload = true;
    d_packets.send(Packet::confirm(true));
}

void ServerSession::onPut(const Packet &packet)
{
    requireTransfer(packet, true);

    try {
        if (packet.d_kind == Packet::Meta) {
            ChunkMeta meta;
            meta.d_pieces = packet.d_pieces;
            meta.d_size = packet.d_size;
            meta.d_digest = packet.d_digest;
            d_transfer->setMeta(meta);
        } else {
            d_transfer->addPiece(packet.d_piece, packet.d_data);
            d_session.d_bytesUploaded += packet.d_data.size();
        }
    } catch (IntegrityError &e) {
        abortTransfer(e.getMessage());
        return;
    }

    d_packets.send(Packet::received(packet.d_kind, packet.d_piece));
}

void ServerSession::onDone(const Packet &packet)
{
    if (!d_transfer) {
        RAISE_PROTOCOL(SERVER_UNEXPECTED) << Packet::getTypeName(packet.d_type) << " received outside a transfer"
                                          << LOG_END
    }

    if (!d_isUpload) {
        ++d_session.d_filesPulled;
        LOG_INFO(SERVER_FILE) << d_transfer->getPath() << " downloaded by the client" << LOG_END
        dropTransfer();
        return;
    }

    std::string payload;
    try {
        d_transfer->finish(&payload);
    } catch (IntegrityError &e) {
        abortTransfer(e.getMessage());
        d_session.clearPendingSync();
        return;
    }

    const Preset &preset = d_session.d_preset;
    const FileRecord &clientRecord = d_session.d_pendingClientRecord;
    const FileRecord &serverRecord = d_session.d_pendingServerRecord;

    FileRecord record(d_transfer->getFileID(), preset.getAbsolutePath(clientRecord.getPath()),
                      clientRecord.getModified(), false);
    if (!serverRecord.getID().isNil()) {
        record.setOwner(serverRecord.getOwner());
    } else {
        record.setOwner(preset.getOwner().isNil() ? d_peer : preset.getOwner());
    }

    if (!d_archive->save(record, payload)) {
        abortTransfer("unable to store " + clientRecord.getPath());
        d_session.clearPendingSync();
        return;
    }

    ++d_session.d_filesPushed;
    LOG_INFO(SERVER_FILE) << record.getPath() << " uploaded by the client" << LOG_END
    dropTransfer();
    d_session.clearPendingSync();
    d_packets.send(Packet::done());
}

void ServerSession::onAbort(const Packet &packet)
{
    if (d_transfer) {
        LOG_WARNING(SERVER_TRANSFER) << "The client aborted the transfer of " << d_transfer->getPath() << ": "
                                     << packet.d_reason << LOG_END
        ++d_session.d_filesSkipped;
        dropTransfer();
        d_session.clearPendingSync();
        return;
    }

    LOG_ERROR(SERVER_ABORTED) << "The client aborted the session in " << Session::getPhaseName(d_session.d_phase)
                              << ": " << packet.d_reason << LOG_END
    d_session.d_phase = Session::Aborted;
}

void ServerSession::onClose(const Packet &)
{
    if (d_session.d_phase == Session::Init) {
        RAISE_PROTOCOL(SERVER_UNEXPECTED) << "RPL_CLOSE received before RPL_INIT" << LOG_END
    }
    dropTransfer();
    d_session.d_phase = Session::Closed;
}

void ServerSession::requireOperation(const Packet &packet)
{
    if (!d_session.d_operationConfirmed ||
        (d_session.d_phase != Session::Pulling && d_session.d_phase != Session::Pushing)) {
        RAISE_PROTOCOL(SERVER_UNEXPECTED) << Packet::getTypeName(packet.d_type) << " received in "
                                          << Session::getPhaseName(d_session.d_phase) << LOG_END
    }
}

void ServerSession::requireTransfer(const Packet &packet, bool isUpload)
{
    requireOperation(packet);
    if (!d_transfer || d_isUpload != isUpload) {
        RAISE_PROTOCOL(SERVER_UNEXPECTED) << Packet::getTypeName(packet.d_type) << " received without an open "
                                          << (isUpload ? "upload" : "download") << LOG_END
    }
}

FileRecord ServerSession::lookup(const FileRecord &clientRecord, bool *inScope)
{
    const Preset &preset = d_session.d_preset;
    std::string path = preset.getAbsolutePath(clientRecord.getPath());

    // A record found by id may live anywhere in the archive; the client only gets to touch it inside the scope.
    FileRecord record;
    if ((!clientRecord.getID().isNil() && d_archive->findById(clientRecord.getID(), &record)) ||
        d_archive->findByPath(path, &record)) {
        *inScope = preset.containsPath(path) && preset.covers(record);
        return record;
    }

    *inScope = preset.containsPath(path);
    return FileRecord(Uuid(), path, 0, false);
}

FileRecord ServerSession::toWire(const FileRecord &record) const
{
    FileRecord wire = record;
    std::string relative;
    if (d_session.d_preset.getRelativePath(record.getPath(), &relative)) {
        wire.setPath(relative);
    }
    wire.setOwner(Uuid());
    return wire;
}

void ServerSession::abortTransfer(const std::string &reason)
{
    LOG_WARNING(SERVER_TRANSFER) << "Aborting the transfer of " << d_transfer->getPath() << ": " << reason << LOG_END
    ++d_session.d_filesSkipped;
    dropTransfer();
    d_packets.send(Packet::abort(reason));
}

void ServerSession::dropTransfer()
{
    if (d_transfer) {
        if (d_transfer->getNextPiece() < d_transfer->getPieceCount() || !d_transfer->hasMeta()) {
            LOG_DEBUG(SERVER_TRANSFER) << "Dropping the unfinished transfer of " << d_transfer->getPath() << LOG_END
        }
        delete d_transfer;
        d_transfer = 0;
    }
}

} // namespace replica
