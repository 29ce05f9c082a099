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

#ifndef INCLUDED_REPLICA_PACKET_H
#define INCLUDED_REPLICA_PACKET_H

#include <replica/replica_reconciler.h>
#include <replica/replica_record.h>
#include <replica/replica_timeutil.h>
#include <replica/replica_uuid.h>

#include <string>

#include <stdint.h>

namespace replica
{

// Packet types; the value is the tag in the first payload byte.
enum PacketType {
    RPL_INIT = 1,
    RPL_VERSION = 2,
    RPL_OPERATION = 3,
    RPL_CONFIRM = 4,
    RPL_REQUEST = 5,
    RPL_RESPONSE = 6,
    RPL_DONE = 7,
    RPL_SYNC = 8,
    RPL_DOWNLOAD = 9,
    RPL_GET = 10,
    RPL_CHUNK = 11,
    RPL_UPLOAD = 12,
    RPL_PUT = 13,
    RPL_RECEIVED = 14,
    RPL_CLOSE = 15,
    RPL_ABORT = 16
};

// One decoded packet.  Only the fields that belong to 'd_type' are meaningful:
//
//   RPL_INIT, RPL_VERSION      d_version
//   RPL_OPERATION              d_version, d_modified, d_preset, and d_archive, d_path, d_owner for "custom"
//   RPL_CONFIRM                d_accepted
//   RPL_REQUEST                d_direction, and d_record for a push
//   RPL_RESPONSE               d_record
//   RPL_SYNC                   d_action, d_record
//   RPL_DOWNLOAD               d_record (id and path)
//   RPL_UPLOAD                 d_record (id and path), d_size
//   RPL_GET                    d_kind, d_piece
//   RPL_CHUNK, RPL_PUT         d_kind, then d_pieces, d_size, d_digest for meta or d_piece, d_data for data
//   RPL_RECEIVED               d_kind, and d_piece for data
//   RPL_ABORT                  d_reason
struct Packet
{
    enum Direction {
        Pull,
        Push
    };

    enum ChunkKind {
        Meta,
        Data
    };

    Packet();
    explicit Packet(int type);

    static Packet init(uint32_t version);
    static Packet version(uint32_t version);
    static Packet operation(uint32_t version, Timestamp cutoff, const std::string &preset,
                            const std::string &archive, const std::string &path, const Uuid &owner);
    static Packet confirm(bool accepted);
    static Packet request(int direction, const FileRecord &record);
    static Packet response(const FileRecord &record);
    static Packet done();
    static Packet sync(Action action, const FileRecord &record);
    static Packet download(const Uuid &id, const std::string &path);
    static Packet get(int kind, uint32_t piece);
    static Packet meta(int type, uint32_t pieces, uint32_t size, const std::string &digest);
    static Packet data(int type, uint32_t piece, const std::string &data);
    static Packet upload(const Uuid &id, const std::string &path, uint32_t size);
    static Packet received(int kind, uint32_t piece);
    static Packet close();
    static Packet abort(const std::string &reason);

    // A one-line description for tracing.
    std::string toString() const;

    static const char *getTypeName(int type);

    int d_type;
    uint32_t d_version;
    Timestamp d_modified;
    std::string d_preset;
    std::string d_archive;
    std::string d_path;
    Uuid d_owner;
    bool d_accepted;
    int d_direction;
    Action d_action;
    FileRecord d_record;
    int d_kind;
    uint32_t d_piece;
    uint32_t d_pieces;
    uint32_t d_size;
    std::string d_digest;
    std::string d_data;
    std::string d_reason;
};

struct PacketCodec
{
    // Serialize 'packet' into 'payload' (the frame length is added by the stream).
    static void encode(const Packet &packet, std::string *payload);

    // Parse 'size' bytes from 'payload' into 'packet'.  Raise FramingError if the payload is malformed.
    static void decode(const char *payload, int size, Packet *packet);
};

} // namespace replica
#endif //INCLUDED_REPLICA_PACKET_H
