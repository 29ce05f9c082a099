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

#include <replica/replica_packet.h>

#include <replica/replica_log.h>

#include <sstream>

namespace replica
{

namespace
{

const char *g_kindNames[] = { "meta", "data" };
const char *g_directionNames[] = { "pull", "push" };

class Writer
{
public:
    explicit Writer(std::string *buffer)
        : d_buffer(buffer)
    {
    }

    void writeUInt8(uint8_t value)
    {
        *d_buffer += static_cast<char>(value);
    }

    void writeUInt32(uint32_t value)
    {
        *d_buffer += static_cast<char>((value >> 24) & 0xff);
        *d_buffer += static_cast<char>((value >> 16) & 0xff);
        *d_buffer += static_cast<char>((value >> 8) & 0xff);
        *d_buffer += static_cast<char>(value & 0xff);
    }

    void writeBool(bool value)
    {
        writeUInt8(value ? 1 : 0);
    }

    void writeString(const std::string &value)
    {
        writeUInt32(static_cast<uint32_t>(value.size()));
        *d_buffer += value;
    }

    void writeUuid(const Uuid &id)
    {
        d_buffer->append(reinterpret_cast<const char *>(id.getBytes()), Uuid::Size);
    }

    void writeTimestamp(Timestamp time)
    {
        writeString(TimeUtil::format(time));
    }

    void writeRecord(const FileRecord &record)
    {
        writeUuid(record.getID());
        writeString(record.getPath());
        writeTimestamp(record.getModified());
        writeBool(record.isDeleted());
    }

private:
    // NOT IMPLEMENTED
    Writer(const Writer&);
    Writer& operator=(const Writer&);

    std::string *d_buffer;
};

// Every read checks the remaining length first; running past the end raises a FramingError.
class Reader
{
public:
    Reader(const char *data, int size, int type)
        : d_data(reinterpret_cast<const unsigned char *>(data))
        , d_size(size)
        , d_position(0)
        , d_type(type)
    {
    }

    uint8_t readUInt8(const char *field)
    {
        require(1, field);
        return d_data[d_position++];
    }

    uint32_t readUInt32(const char *field)
    {
        require(4, field);
        uint32_t value = (static_cast<uint32_t>(d_data[d_position]) << 24) |
                         (static_cast<uint32_t>(d_data[d_position + 1]) << 16) |
                         (static_cast<uint32_t>(d_data[d_position + 2]) << 8) |
                         static_cast<uint32_t>(d_data[d_position + 3]);
        d_position += 4;
        return value;
    }

    bool readBool(const char *field)
    {
        uint8_t value = readUInt8(field);
        if (value > 1) {
            RAISE_FRAMING(PACKET_DECODE) << Packet::getTypeName(d_type) << ": invalid boolean " << int(value)
                                         << " in field '" << field << "'" << LOG_END
        }
        return value == 1;
    }

    std::string readString(const char *field)
    {
        uint32_t length = readUInt32(field);
        require(length, field);
        std::string value(reinterpret_cast<const char *>(d_data + d_position), length);
        d_position += length;
        return value;
    }

    Uuid readUuid(const char *field)
    {
        require(Uuid::Size, field);
        Uuid id(reinterpret_cast<const char *>(d_data + d_position));
        d_position += Uuid::Size;
        return id;
    }

    Timestamp readTimestamp(const char *field)
    {
        std::string text = readString(field);
        Timestamp time;
        if (!TimeUtil::parse(text, &time)) {
            RAISE_FRAMING(PACKET_DECODE) << Packet::getTypeName(d_type) << ": malformed timestamp '" << text
                                         << "' in field '" << field << "'" << LOG_END
        }
        return time;
    }

    // Read a string that must be one of the 'count' names; return its index.
    int readName(const char *field, const char **names, int count)
    {
        std::string text = readString(field);
        for (int i = 0; i < count; ++i) {
            if (text == names[i]) {
                return i;
            }
        }
        RAISE_FRAMING(PACKET_DECODE) << Packet::getTypeName(d_type) << ": unknown value '" << text
                                     << "' in field '" << field << "'" << LOG_END
        return -1;
    }

    void readRecord(FileRecord *record)
    {
        record->setID(readUuid("id"));
        record->setPath(readString("path"));
        record->setModified(readTimestamp("modified"));
        record->setDeleted(readBool("deleted"));
    }

    void checkEnd()
    {
        if (d_position != d_size) {
            RAISE_FRAMING(PACKET_DECODE) << Packet::getTypeName(d_type) << ": " << (d_size - d_position)
                                         << " trailing byte(s)" << LOG_END
        }
    }

private:
    // NOT IMPLEMENTED
    Reader(const Reader&);
    Reader& operator=(const Reader&);

    void require(uint32_t bytes, const char *field)
    {
        if (bytes > static_cast<uint32_t>(d_size - d_position)) {
            RAISE_FRAMING(PACKET_DECODE) << Packet::getTypeName(d_type) << ": field '" << field
                                         << "' runs past the end of the packet" << LOG_END
        }
    }

    const unsigned char *d_data;
    int d_size;
    int d_position;
    int d_type;
};

} // unnamed namespace

Packet::Packet()
    : d_type(0)
    , d_version(0)
    , d_modified(0)
    , d_preset()
    , d_archive()
    , d_path()
    , d_owner()
    , d_accepted(false)
    , d_direction(Pull)
    , d_action(NoAction)
    , d_record()
    , d_kind(Meta)
    , d_piece(0)
    , d_pieces(0)
    , d_size(0)
    , d_digest()
    , d_data()
    , d_reason()
{
}

Packet::Packet(int type)
    : d_type(type)
    , d_version(0)
    , d_modified(0)
    , d_preset()
    , d_archive()
    , d_path()
    , d_owner()
    , d_accepted(false)
    , d_direction(Pull)
    , d_action(NoAction)
    , d_record()
    , d_kind(Meta)
    , d_piece(0)
    , d_pieces(0)
    , d_size(0)
    , d_digest()
    , d_data()
    , d_reason()
{
}

Packet Packet::init(uint32_t version)
{
    Packet packet(RPL_INIT);
    packet.d_version = version;
    return packet;
}

Packet Packet::version(uint32_t version)
{
    Packet packet(RPL_VERSION);
    packet.d_version = version;
    return packet;
}

Packet Packet::operation(uint32_t version, Timestamp cutoff, const std::string &preset,
                         const std::string &archive, const std::string &path, const Uuid &owner)
{
    Packet packet(RPL_OPERATION);
    packet.d_version = version;
    packet.d_modified = cutoff;
    packet.d_preset = preset;
    packet.d_archive = archive;
    packet.d_path = path;
    packet.d_owner = owner;
    return packet;
}

Packet Packet::confirm(bool accepted)
{
    Packet packet(RPL_CONFIRM);
    packet.d_accepted = accepted;
    return packet;
}

Packet Packet::request(int direction, const FileRecord &record)
{
    Packet packet(RPL_REQUEST);
    packet.d_direction = direction;
    packet.d_record = record;
    return packet;
}

Packet Packet::response(const FileRecord &record)
{
    Packet packet(RPL_RESPONSE);
    packet.d_record = record;
    return packet;
}

Packet Packet::done()
{
    return Packet(RPL_DONE);
}

Packet Packet::sync(Action action, const FileRecord &record)
{
    Packet packet(RPL_SYNC);
    packet.d_action = action;
    packet.d_record = record;
    return packet;
}

Packet Packet::download(const Uuid &id, const std::string &path)
{
    Packet packet(RPL_DOWNLOAD);
    packet.d_record.setID(id);
    packet.d_record.setPath(path);
    return packet;
}

Packet Packet::get(int kind, uint32_t piece)
{
    Packet packet(RPL_GET);
    packet.d_kind = kind;
    packet.d_piece = piece;
    return packet;
}

Packet Packet::meta(int type, uint32_t pieces, uint32_t size, const std::string &digest)
{
    Packet packet(type);
    packet.d_kind = Meta;
    packet.d_pieces = pieces;
    packet.d_size = size;
    packet.d_digest = digest;
    return packet;
}

Packet Packet::data(int type, uint32_t piece, const std::string &data)
{
    Packet packet(type);
    packet.d_kind = Data;
    packet.d_piece = piece;
    packet.d_data = data;
    return packet;
}

Packet Packet::upload(const Uuid &id, const std::string &path, uint32_t size)
{
    Packet packet(RPL_UPLOAD);
    packet.d_record.setID(id);
    packet.d_record.setPath(path);
    packet.d_size = size;
    return packet;
}

Packet Packet::received(int kind, uint32_t piece)
{
    Packet packet(RPL_RECEIVED);
    packet.d_kind = kind;
    packet.d_piece = piece;
    return packet;
}

Packet Packet::close()
{
    return Packet(RPL_CLOSE);
}

Packet Packet::abort(const std::string &reason)
{
    Packet packet(RPL_ABORT);
    packet.d_reason = reason;
    return packet;
}

std::string Packet::toString() const
{
    std::stringstream stream;
    stream << getTypeName(d_type);

    switch (d_type) {
    case RPL_INIT:
    case RPL_VERSION:
        stream << " version=" << d_version;
        break;
    case RPL_OPERATION:
        stream << " version=" << d_version << " preset=" << d_preset;
        if (d_preset == "custom") {
            stream << " archive=" << d_archive << " path=" << d_path;
        }
        break;
    case RPL_CONFIRM:
        stream << " accepted=" << (d_accepted ? "true" : "false");
        break;
    case RPL_REQUEST:
        stream << " " << g_directionNames[d_direction == Push ? 1 : 0];
        if (d_direction == Push) {
            stream << " " << d_record.toString();
        }
        break;
    case RPL_RESPONSE:
        stream << " " << d_record.toString();
        break;
    case RPL_SYNC:
        stream << " " << Reconciler::getName(d_action) << " " << d_record.toString();
        break;
    case RPL_DOWNLOAD:
        stream << " " << d_record.getID().toString() << " " << d_record.getPath();
        break;
    case RPL_UPLOAD:
        stream << " " << d_record.getID().toString() << " " << d_record.getPath() << " size=" << d_size;
        break;
    case RPL_GET:
    case RPL_RECEIVED:
        stream << " " << g_kindNames[d_kind == Data ? 1 : 0];
        if (d_kind == Data) {
            stream << " piece=" << d_piece;
        }
        break;
    case RPL_CHUNK:
    case RPL_PUT:
        if (d_kind == Meta) {
            stream << " meta pieces=" << d_pieces << " size=" << d_size;
        } else {
            stream << " data piece=" << d_piece << " bytes=" << d_data.size();
        }
        break;
    case RPL_ABORT:
        stream << " reason='" << d_reason << "'";
        break;
    default:
        break;
    }
    return stream.str();
}

const char *Packet::getTypeName(int type)
{
    switch (type) {
    case RPL_INIT: return "RPL_INIT";
    case RPL_VERSION: return "RPL_VERSION";
    case RPL_OPERATION: return "RPL_OPERATION";
    case RPL_CONFIRM: return "RPL_CONFIRM";
    case RPL_REQUEST: return "RPL_REQUEST";
    case RPL_RESPONSE: return "RPL_RESPONSE";
    case RPL_DONE: return "RPL_DONE";
    case RPL_SYNC: return "RPL_SYNC";
    case RPL_DOWNLOAD: return "RPL_DOWNLOAD";
    case RPL_GET: return "RPL_GET";
    case RPL_CHUNK: return "RPL_CHUNK";
    case RPL_UPLOAD: return "RPL_UPLOAD";
    case RPL_PUT: return "RPL_PUT";
    case RPL_RECEIVED: return "RPL_RECEIVED";
    case RPL_CLOSE: return "RPL_CLOSE";
    case RPL_ABORT: return "RPL_ABORT";
    default: return "RPL_UNKNOWN";
    }
}

void PacketCodec::encode(const Packet &packet, std::string *payload)
{
    payload->clear();
    Writer writer(payload);
    writer.writeUInt8(static_cast<uint8_t>(packet.d_type));

    switch (packet.d_type) {
    case RPL_INIT:
    case RPL_VERSION:
        writer.writeUInt32(packet.d_version);
        break;
    case RPL_OPERATION:
        writer.writeUInt32(packet.d_version);
        writer.writeTimestamp(packet.d_modified);
        writer.writeString(packet.d_preset);
        if (packet.d_preset == "custom") {
            writer.writeString(packet.d_archive);
            writer.writeString(packet.d_path);
            writer.writeUuid(packet.d_owner);
        }
        break;
    case RPL_CONFIRM:
        writer.writeBool(packet.d_accepted);
        break;
    case RPL_REQUEST:
        writer.writeString(g_directionNames[packet.d_direction == Packet::Push ? 1 : 0]);
        if (packet.d_direction == Packet::Push) {
            writer.writeRecord(packet.d_record);
        }
        break;
    case RPL_RESPONSE:
        writer.writeRecord(packet.d_record);
        break;
    case RPL_SYNC:
        writer.writeUInt32(static_cast<uint32_t>(packet.d_action));
        writer.writeRecord(packet.d_record);
        break;
    case RPL_DOWNLOAD:
        writer.writeUuid(packet.d_record.getID());
        writer.writeString(packet.d_record.getPath());
        break;
    case RPL_UPLOAD:
        writer.writeUuid(packet.d_record.getID());
        writer.writeString(packet.d_record.getPath());
        writer.writeUInt32(packet.d_size);
        break;
    case RPL_GET:
        writer.writeString(g_kindNames[packet.d_kind == Packet::Data ? 1 : 0]);
        writer.writeUInt32(packet.d_piece);
        break;
    case RPL_CHUNK:
    case RPL_PUT:
        writer.writeString(g_kindNames[packet.d_kind == Packet::Data ? 1 : 0]);
        if (packet.d_kind == Packet::Data) {
            writer.writeUInt32(packet.d_piece);
            writer.writeString(packet.d_data);
        } else {
            writer.writeUInt32(packet.d_pieces);
            writer.writeUInt32(packet.d_size);
            writer.writeString(packet.d_digest);
        }
        break;
    case RPL_RECEIVED:
        writer.writeString(g_kindNames[packet.d_kind == Packet::Data ? 1 : 0]);
        if (packet.d_kind == Packet::Data) {
            writer.writeUInt32(packet.d_piece);
        }
        break;
    case RPL_ABORT:
        writer.writeString(packet.d_reason);
        break;
    case RPL_DONE:
    case RPL_CLOSE:
    default:
        break;
    }
}

void PacketCodec::decode(const char *payload, int size, Packet *packet)
{
    if (size <= 0) {
        RAISE_FRAMING(PACKET_DECODE) << "Empty packet" << LOG_END
    }

    int type = static_cast<unsigned char>(payload[0]);
    if (type < RPL_INIT || type > RPL_ABORT) {
        RAISE_FRAMING(PACKET_DECODE) << "Unknown packet type " << type << LOG_END
    }

    *packet = Packet(type);
    Reader reader(payload + 1, size - 1, type);

    switch (type) {
    case RPL_INIT:
    case RPL_VERSION:
        packet->d_version = reader.readUInt32("version");
        break;
    case RPL_OPERATION:
        packet->d_version = reader.readUInt32("version");
        packet->d_modified = reader.readTimestamp("modified");
        packet->d_preset = reader.readString("preset");
        if (packet->d_preset == "custom") {
            packet->d_archive = reader.readString("archive");
            packet->d_path = reader.readString("path");
            packet->d_owner = reader.readUuid("owner");
        }
        break;
    case RPL_CONFIRM:
        packet->d_accepted = reader.readBool("accepted");
        break;
    case RPL_REQUEST:
        packet->d_direction = reader.readName("action", g_directionNames, 2);
        if (packet->d_direction == Packet::Push) {
            reader.readRecord(&packet->d_record);
        }
        break;
    case RPL_RESPONSE:
        reader.readRecord(&packet->d_record);
        break;
    case RPL_SYNC: {
        uint32_t action = reader.readUInt32("action");
        if (action >= ActionCount) {
            RAISE_FRAMING(PACKET_DECODE) << "RPL_SYNC: unknown action " << action << LOG_END
        }
        packet->d_action = static_cast<Action>(action);
        reader.readRecord(&packet->d_record);
        break;
    }
    case RPL_DOWNLOAD:
        packet->d_record.setID(reader.readUuid("id"));
        packet->d_record.setPath(reader.readString("path"));
        break;
    case RPL_UPLOAD:
        packet->d_record.setID(reader.readUuid("id"));
        packet->d_record.setPath(reader.readString("path"));
        packet->d_size = reader.readUInt32("size");
        break;
    case RPL_GET:
        packet->d_kind = reader.readName("kind", g_kindNames, 2);
        packet->d_piece = reader.readUInt32("piece");
        break;
    case RPL_CHUNK:
    case RPL_PUT:
        packet->d_kind = reader.readName("kind", g_kindNames, 2);
        if (packet->d_kind == Packet::Data) {
            packet->d_piece = reader.readUInt32("piece");
            packet->d_data = reader.readString("data");
        } else {
            packet->d_pieces = reader.readUInt32("pieces");
            packet->d_size = reader.readUInt32("size");
            packet->d_digest = reader.readString("digest");
        }
        break;
    case RPL_RECEIVED:
        packet->d_kind = reader.readName("kind", g_kindNames, 2);
        if (packet->d_kind == Packet::Data) {
            packet->d_piece = reader.readUInt32("piece");
        }
        break;
    case RPL_ABORT:
        packet->d_reason = reader.readString("reason");
        break;
    case RPL_DONE:
    case RPL_CLOSE:
        break;
    }

    reader.checkEnd();
}

} // namespace replica
