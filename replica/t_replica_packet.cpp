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
#include <replica/replica_timeutil.h>

#include <string>

#include <testutil/testutil_assert.h>

using namespace replica;

namespace {

void appendUInt32(std::string *buffer, uint32_t value)
{
    *buffer += static_cast<char>((value >> 24) & 0xff);
    *buffer += static_cast<char>((value >> 16) & 0xff);
    *buffer += static_cast<char>((value >> 8) & 0xff);
    *buffer += static_cast<char>(value & 0xff);
}

void appendString(std::string *buffer, const std::string &value)
{
    appendUInt32(buffer, static_cast<uint32_t>(value.size()));
    *buffer += value;
}

Packet roundTrip(const Packet &packet)
{
    std::string payload;
    PacketCodec::encode(packet, &payload);
    Packet decoded;
    PacketCodec::decode(payload.data(), static_cast<int>(payload.size()), &decoded);
    return decoded;
}

void decode(const std::string &payload)
{
    Packet packet;
    PacketCodec::decode(payload.data(), static_cast<int>(payload.size()), &packet);
}

bool sameRecord(const FileRecord &lhs, const FileRecord &rhs)
{
    return lhs.getID() == rhs.getID() && lhs.getPath() == rhs.getPath() &&
           lhs.getModified() == rhs.getModified() && lhs.isDeleted() == rhs.isDeleted();
}

} // unnamed namespace

void testWireLayout()
{
    std::string payload;
    PacketCodec::encode(Packet::init(2), &payload);
    ASSERT(payload == std::string("\x01\x00\x00\x00\x02", 5));

    PacketCodec::encode(Packet::confirm(true), &payload);
    ASSERT(payload == std::string("\x04\x01", 2));

    PacketCodec::encode(Packet::close(), &payload);
    ASSERT(payload == std::string("\x0f", 1));

    PacketCodec::encode(Packet::get(Packet::Data, 258), &payload);
    std::string expected("\x0a", 1);
    appendString(&expected, "data");
    appendUInt32(&expected, 258);
    ASSERT(payload == expected);

    // Only "custom" carries the archive, the path and the owner.
    PacketCodec::encode(Packet::operation(2, 0, "mail", "ignored", "/ignored/", Uuid::generate()), &payload);
    expected = std::string("\x03", 1);
    appendUInt32(&expected, 2);
    appendString(&expected, TimeUtil::format(0));
    appendString(&expected, "mail");
    ASSERT(payload == expected);
}

void testDecodeFields()
{
    Timestamp now = TimeUtil::getTimeOfDay();
    Uuid owner = Uuid::generate();

    Packet operation = roundTrip(Packet::operation(2, now, "custom", "photos", "/2020/", owner));
    ASSERT(operation.d_type == RPL_OPERATION);
    ASSERT(operation.d_version == 2);
    ASSERT(operation.d_modified == now);
    ASSERT(operation.d_preset == "custom");
    ASSERT(operation.d_archive == "photos");
    ASSERT(operation.d_path == "/2020/");
    ASSERT(operation.d_owner == owner);

    FileRecord record(Uuid::generate(), "notes/todo.txt", now, true);

    Packet pull = roundTrip(Packet::request(Packet::Pull, FileRecord()));
    ASSERT(pull.d_type == RPL_REQUEST);
    ASSERT(pull.d_direction == Packet::Pull);
    ASSERT(pull.d_record.getID().isNil());

    Packet push = roundTrip(Packet::request(Packet::Push, record));
    ASSERT(push.d_direction == Packet::Push);
    ASSERT(sameRecord(push.d_record, record));

    Packet sync = roundTrip(Packet::sync(ServerDelete, record));
    ASSERT(sync.d_type == RPL_SYNC);
    ASSERT(sync.d_action == ServerDelete);
    ASSERT(sameRecord(sync.d_record, record));

    Packet upload = roundTrip(Packet::upload(record.getID(), record.getPath(), 70000));
    ASSERT(upload.d_type == RPL_UPLOAD);
    ASSERT(upload.d_record.getID() == record.getID());
    ASSERT(upload.d_record.getPath() == record.getPath());
    ASSERT(upload.d_size == 70000);

    Packet meta = roundTrip(Packet::meta(RPL_CHUNK, 3, 70000, std::string("\x00\xff\x10", 3)));
    ASSERT(meta.d_type == RPL_CHUNK);
    ASSERT(meta.d_kind == Packet::Meta);
    ASSERT(meta.d_pieces == 3);
    ASSERT(meta.d_size == 70000);
    ASSERT(meta.d_digest == std::string("\x00\xff\x10", 3));

    std::string bytes(1000, '\0');
    for (unsigned int i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<char>(i);
    }
    Packet put = roundTrip(Packet::data(RPL_PUT, 2, bytes));
    ASSERT(put.d_type == RPL_PUT);
    ASSERT(put.d_kind == Packet::Data);
    ASSERT(put.d_piece == 2);
    ASSERT(put.d_data == bytes);

    Packet received = roundTrip(Packet::received(Packet::Meta, 0));
    ASSERT(received.d_type == RPL_RECEIVED);
    ASSERT(received.d_kind == Packet::Meta);

    Packet abort = roundTrip(Packet::abort("digest mismatch"));
    ASSERT(abort.d_type == RPL_ABORT);
    ASSERT(abort.d_reason == "digest mismatch");

    ASSERT(roundTrip(Packet::done()).d_type == RPL_DONE);
}

void testMalformedPackets()
{
    Packet packet;
    ASSERT_THROWS(PacketCodec::decode("", 0, &packet), FramingError);

    ASSERT_THROWS(decode(std::string("\x00", 1)), FramingError);
    ASSERT_THROWS(decode(std::string("\x11", 1)), FramingError);

    // Truncated integer.
    ASSERT_THROWS(decode(std::string("\x01\x00\x00", 3)), FramingError);

    // A string whose length runs past the end.
    std::string payload("\x10", 1);
    appendUInt32(&payload, 100);
    payload += "abc";
    ASSERT_THROWS(decode(payload), FramingError);

    // Trailing bytes.
    ASSERT_THROWS(decode(std::string("\x07\x00", 2)), FramingError);
    ASSERT_THROWS(decode(std::string("\x01\x00\x00\x00\x02\x00", 6)), FramingError);

    // A boolean is 0 or 1.
    ASSERT_THROWS(decode(std::string("\x04\x02", 2)), FramingError);

    payload = std::string("\x0a", 1);
    appendString(&payload, "blob");
    appendUInt32(&payload, 0);
    ASSERT_THROWS(decode(payload), FramingError);

    payload = std::string("\x05", 1);
    appendString(&payload, "sideways");
    ASSERT_THROWS(decode(payload), FramingError);

    payload = std::string("\x08", 1);
    appendUInt32(&payload, ActionCount);
    payload += std::string(Uuid::Size, '\x01');
    appendString(&payload, "a.txt");
    appendString(&payload, TimeUtil::format(1000000));
    payload += '\0';
    ASSERT_THROWS(decode(payload), FramingError);

    payload = std::string("\x06", 1);
    payload += std::string(Uuid::Size, '\x01');
    appendString(&payload, "a.txt");
    appendString(&payload, "yesterday");
    payload += '\0';
    ASSERT_THROWS(decode(payload), FramingError);

    // The same response with a proper timestamp is fine.
    payload = std::string("\x06", 1);
    payload += std::string(Uuid::Size, '\x01');
    appendString(&payload, "a.txt");
    appendString(&payload, "2020-03-14T09:26:53.589793");
    payload += '\0';
    ASSERT_NO_THROW(decode(payload), FramingError);
}

int main(int argc, char *argv[])
{
    Log::setLevel(Log::Fatal);

    testWireLayout();
    testDecodeFields();
    testMalformedPackets();
    return ASSERT_COUNT;
}
