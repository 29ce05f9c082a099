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

#include <replica/replica_transfer.h>

#include <replica/replica_log.h>
#include <replica/replica_util.h>

namespace replica
{

const uint32_t Transfer::MaximumSize;

Transfer::Transfer(const Uuid &fileId, const std::string &path, int version)
    : d_fileId(fileId)
    , d_path(path)
    , d_version(version)
    , d_hasMeta(false)
    , d_totalSize(0)
    , d_pieceCount(0)
    , d_digest()
    , d_nextPiece(0)
    , d_buffer()
{
}

Transfer::~Transfer()
{
}

void Transfer::load(const std::string &payload)
{
    if (payload.size() > MaximumSize) {
        RAISE_INTEGRITY(TRANSFER_SIZE) << d_path << ": payload of " << payload.size()
                                       << " bytes is too large to transfer" << LOG_END
    }

    d_buffer = payload;
    d_totalSize = static_cast<uint32_t>(payload.size());
    d_pieceCount = getPieceCount(d_totalSize);
    d_digest = Util::digest(d_version, d_buffer);
    d_nextPiece = 0;
    d_hasMeta = true;
}

ChunkMeta Transfer::getMeta() const
{
    ChunkMeta meta;
    meta.d_pieces = d_pieceCount;
    meta.d_size = d_totalSize;
    meta.d_digest = d_digest;
    return meta;
}

std::string Transfer::getPiece(uint32_t index)
{
    if (!d_hasMeta) {
        RAISE_INTEGRITY(TRANSFER_ORDER) << d_path << ": piece " << index << " requested before the payload is loaded"
                                        << LOG_END
    }
    if (index >= d_pieceCount) {
        RAISE_INTEGRITY(TRANSFER_ORDER) << d_path << ": piece " << index << " is beyond the last piece "
                                        << d_pieceCount << LOG_END
    }
    if (index != d_nextPiece) {
        RAISE_INTEGRITY(TRANSFER_ORDER) << d_path << ": piece " << index << " requested while piece "
                                        << d_nextPiece << " is next" << LOG_END
    }

    ++d_nextPiece;
    return d_buffer.substr(static_cast<size_t>(index) * ChunkSize, ChunkSize);
}

void Transfer::setMeta(const ChunkMeta &meta)
{
    if (d_hasMeta) {
        RAISE_INTEGRITY(TRANSFER_META) << d_path << ": meta received twice" << LOG_END
    }
    if (meta.d_size > MaximumSize) {
        RAISE_INTEGRITY(TRANSFER_SIZE) << d_path << ": payload of " << meta.d_size
                                       << " bytes is too large to transfer" << LOG_END
    }
    if (meta.d_pieces != getPieceCount(meta.d_size)) {
        RAISE_INTEGRITY(TRANSFER_META) << d_path << ": " << meta.d_pieces << " piece(s) cannot hold "
                                       << meta.d_size << " bytes" << LOG_END
    }

    d_totalSize = meta.d_size;
    d_pieceCount = meta.d_pieces;
    d_digest = meta.d_digest;
    d_nextPiece = 0;
    d_buffer.clear();
    d_hasMeta = true;
}

void Transfer::addPiece(uint32_t index, const std::string &bytes)
{
    if (!d_hasMeta) {
        RAISE_INTEGRITY(TRANSFER_ORDER) << d_path << ": piece " << index << " received before meta" << LOG_END
    }
    if (index >= d_pieceCount) {
        RAISE_INTEGRITY(TRANSFER_ORDER) << d_path << ": piece " << index << " is beyond the last piece "
                                        << d_pieceCount << LOG_END
    }
    if (index != d_nextPiece) {
        RAISE_INTEGRITY(TRANSFER_ORDER) << d_path << ": piece " << index << " received while expecting piece "
                                        << d_nextPiece << LOG_END
    }
    if (bytes.size() > ChunkSize) {
        RAISE_INTEGRITY(TRANSFER_SIZE) << d_path << ": piece " << index << " has " << bytes.size()
                                       << " bytes" << LOG_END
    }
    if (d_buffer.size() + bytes.size() > d_totalSize) {
        RAISE_INTEGRITY(TRANSFER_SIZE) << d_path << ": piece " << index << " exceeds the total size of "
                                       << d_totalSize << " bytes" << LOG_END
    }

    d_buffer += bytes;
    ++d_nextPiece;
}

void Transfer::finish(std::string *payload)
{
    if (!d_hasMeta) {
        RAISE_INTEGRITY(TRANSFER_TRUNCATED) << d_path << ": no meta received" << LOG_END
    }
    if (d_nextPiece < d_pieceCount) {
        RAISE_INTEGRITY(TRANSFER_TRUNCATED) << d_path << ": only " << d_nextPiece << " of " << d_pieceCount
                                            << " piece(s) received" << LOG_END
    }
    if (d_buffer.size() != d_totalSize) {
        RAISE_INTEGRITY(TRANSFER_SIZE) << d_path << ": received " << d_buffer.size() << " bytes instead of "
                                       << d_totalSize << LOG_END
    }

    std::string digest = Util::digest(d_version, d_buffer);
    if (digest != d_digest) {
        RAISE_INTEGRITY(TRANSFER_DIGEST) << d_path << ": digest mismatch (expected "
                                         << Util::toHex(d_digest.data(), static_cast<int>(d_digest.size()))
                                         << ", got " << Util::toHex(digest.data(), static_cast<int>(digest.size()))
                                         << ")" << LOG_END
    }

    payload->swap(d_buffer);
    d_buffer.clear();
}

} // namespace replica
