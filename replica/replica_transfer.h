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

#ifndef INCLUDED_REPLICA_TRANSFER_H
#define INCLUDED_REPLICA_TRANSFER_H

#include <replica/replica_uuid.h>

#include <string>

#include <climits>
#include <stdint.h>

namespace replica
{

// The "meta" pseudo-piece: what the receiver needs to know before the first data piece.
struct ChunkMeta
{
    ChunkMeta()
        : d_pieces(0)
        , d_size(0)
        , d_digest()
    {
    }

    uint32_t d_pieces;          // number of data pieces
    uint32_t d_size;            // total payload size in bytes
    std::string d_digest;       // digest of the whole payload
};

// State of one in-flight chunked transfer.
//
// Sending side:   load(), getMeta(), then getPiece(0), getPiece(1), ... in order.
// Receiving side: setMeta(), addPiece(0), addPiece(1), ..., then finish().
//
// Every violation raises an IntegrityError, which aborts the transfer but not the session.  Nothing is handed
// out of a receiving transfer before finish() has verified the length and the digest.
class Transfer
{
public:

    enum { ChunkSize = 32768 };

    // The largest payload either side accepts.
    static const uint32_t MaximumSize = INT_MAX;

    // 'version' is the negotiated protocol version, which selects the digest.
    Transfer(const Uuid &fileId, const std::string &path, int version);
    ~Transfer();

    void load(const std::string &payload);

    ChunkMeta getMeta() const;

    // Return piece 'index', which must be the next piece to send.
    std::string getPiece(uint32_t index);

    void setMeta(const ChunkMeta &meta);

    // Append piece 'index', which must be the next piece expected.
    void addPiece(uint32_t index, const std::string &bytes);

    // Verify the reassembled payload and move it to 'payload'.
    void finish(std::string *payload);

    // Number of pieces for a payload of 'size' bytes.
    static uint32_t getPieceCount(uint32_t size)
    {
        return static_cast<uint32_t>((static_cast<uint64_t>(size) + ChunkSize - 1) / ChunkSize);
    }

    const Uuid &getFileID() const
    {
        return d_fileId;
    }

    const std::string &getPath() const
    {
        return d_path;
    }

    uint32_t getTotalSize() const
    {
        return d_totalSize;
    }

    uint32_t getPieceCount() const
    {
        return d_pieceCount;
    }

    uint32_t getNextPiece() const
    {
        return d_nextPiece;
    }

    bool hasMeta() const
    {
        return d_hasMeta;
    }

private:
    // NOT IMPLEMENTED
    Transfer(const Transfer&);
    Transfer& operator=(const Transfer&);

    Uuid d_fileId;
    std::string d_path;
    int d_version;              // protocol version; selects the digest
    bool d_hasMeta;             // if the meta pseudo-piece is known
    uint32_t d_totalSize;
    uint32_t d_pieceCount;
    std::string d_digest;
    uint32_t d_nextPiece;       // next piece to send or to receive
    std::string d_buffer;       // the whole payload (sending) or the pieces received so far
};

} // namespace replica

#endif // INCLUDED_REPLICA_TRANSFER_H
