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

#include <string>

#include <cstdlib>

#include <testutil/testutil_assert.h>

using namespace replica;

namespace {

std::string makePayload(uint32_t size)
{
    std::string payload(size, '\0');
    for (uint32_t i = 0; i < size; ++i) {
        payload[i] = static_cast<char>(std::rand() & 0xff);
    }
    return payload;
}

// Send 'payload' from one transfer to another, the way the sessions do.  Return the reassembled payload.
std::string relay(const std::string &payload, int version)
{
    Uuid id = Uuid::generate();
    Transfer sender(id, "/a.bin", version);
    Transfer receiver(id, "/a.bin", version);

    sender.load(payload);
    receiver.setMeta(sender.getMeta());
    for (uint32_t i = 0; i < sender.getPieceCount(); ++i) {
        receiver.addPiece(i, sender.getPiece(i));
    }

    std::string result;
    receiver.finish(&result);
    return result;
}

ChunkMeta makeMeta(const std::string &payload, int version)
{
    ChunkMeta meta;
    meta.d_size = static_cast<uint32_t>(payload.size());
    meta.d_pieces = Transfer::getPieceCount(meta.d_size);
    meta.d_digest = Util::digest(version, payload);
    return meta;
}

} // unnamed namespace

void testPieceCount()
{
    ASSERT(Transfer::getPieceCount(0) == 0);
    ASSERT(Transfer::getPieceCount(1) == 1);
    ASSERT(Transfer::getPieceCount(Transfer::ChunkSize - 1) == 1);
    ASSERT(Transfer::getPieceCount(Transfer::ChunkSize) == 1);
    ASSERT(Transfer::getPieceCount(Transfer::ChunkSize + 1) == 2);
    ASSERT(Transfer::getPieceCount(3 * Transfer::ChunkSize + 17) == 4);
    ASSERT(Transfer::getPieceCount(0xffff8000u) == 0x1ffffu);
    ASSERT(Transfer::getPieceCount(0xffff8001u) == 0x20000u);
    ASSERT(Transfer::getPieceCount(0xffffffffu) == 0x20000u);
}

void testRelay()
{
    const uint32_t SIZES[] = {
        0, 1, Transfer::ChunkSize - 1, Transfer::ChunkSize, Transfer::ChunkSize + 1, 3 * Transfer::ChunkSize + 17,
    };

    for (int version = Util::MinimumVersion; version <= Util::MaximumVersion; ++version) {
        for (unsigned int i = 0; i < sizeof(SIZES) / sizeof(SIZES[0]); ++i) {
            std::string payload = makePayload(SIZES[i]);
            ASSERT(relay(payload, version) == payload);
        }
    }
}

void testPieces()
{
    std::string payload = makePayload(2 * Transfer::ChunkSize + 5);
    Transfer sender(Uuid::generate(), "/a.bin", 2);
    sender.load(payload);

    ChunkMeta meta = sender.getMeta();
    ASSERT(meta.d_pieces == 3);
    ASSERT(meta.d_size == payload.size());
    ASSERT(meta.d_digest.size() == 32);

    ASSERT(sender.getPiece(0).size() == Transfer::ChunkSize);
    ASSERT(sender.getPiece(1).size() == Transfer::ChunkSize);
    ASSERT(sender.getPiece(2) == payload.substr(2 * Transfer::ChunkSize));

    // Pieces are handed out once, in order.
    ASSERT_THROWS(sender.getPiece(3), IntegrityError);

    Transfer other(Uuid::generate(), "/b.bin", 2);
    ASSERT_THROWS(other.getPiece(0), IntegrityError);
    other.load(payload);
    ASSERT_THROWS(other.getPiece(1), IntegrityError);
}

void testDigests()
{
    std::string payload("\x01\x02\xff", 3);
    ASSERT(Util::digest(1, payload) == std::string("\x02", 1));
    ASSERT(Util::digest(1, "") == std::string("\x00", 1));
    ASSERT(Util::toHex(Util::digest(2, "abc").data(), 32) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void testOutOfOrder()
{
    std::string payload = makePayload(3 * Transfer::ChunkSize);
    Transfer receiver(Uuid::generate(), "/a.bin", 2);
    receiver.setMeta(makeMeta(payload, 2));

    ASSERT_THROWS(receiver.addPiece(1, payload.substr(Transfer::ChunkSize, Transfer::ChunkSize)), IntegrityError);
    receiver.addPiece(0, payload.substr(0, Transfer::ChunkSize));
    ASSERT_THROWS(receiver.addPiece(0, payload.substr(0, Transfer::ChunkSize)), IntegrityError);
    ASSERT_THROWS(receiver.addPiece(3, ""), IntegrityError);
}

void testPieceBeforeMeta()
{
    Transfer receiver(Uuid::generate(), "/a.bin", 2);
    ASSERT_THROWS(receiver.addPiece(0, "abc"), IntegrityError);

    std::string payload;
    ASSERT_THROWS(receiver.finish(&payload), IntegrityError);
}

void testBadMeta()
{
    Transfer receiver(Uuid::generate(), "/a.bin", 2);

    ChunkMeta meta = makeMeta("0123456789", 2);
    meta.d_pieces = 2;
    ASSERT_THROWS(receiver.setMeta(meta), IntegrityError);

    meta.d_pieces = 1;
    receiver.setMeta(meta);
    ASSERT_THROWS(receiver.setMeta(meta), IntegrityError);
}

// A receiver never agrees to buffer more than MaximumSize bytes, whatever the sender promises.
void testOversizedMeta()
{
    ChunkMeta meta;
    meta.d_digest = std::string(32, 'x');

    meta.d_size = 0xffffffffu;
    meta.d_pieces = Transfer::getPieceCount(meta.d_size);
    Transfer huge(Uuid::generate(), "/a.bin", 2);
    ASSERT_THROWS(huge.setMeta(meta), IntegrityError);
    ASSERT(!huge.hasMeta());

    meta.d_size = Transfer::MaximumSize + 1u;
    meta.d_pieces = Transfer::getPieceCount(meta.d_size);
    Transfer justOver(Uuid::generate(), "/a.bin", 2);
    ASSERT_THROWS(justOver.setMeta(meta), IntegrityError);

    meta.d_size = Transfer::MaximumSize;
    meta.d_pieces = Transfer::getPieceCount(meta.d_size);
    Transfer largest(Uuid::generate(), "/a.bin", 2);
    ASSERT_NO_THROW(largest.setMeta(meta), IntegrityError);
    ASSERT(largest.getPieceCount() == 65536);
}

void testOversizedPiece()
{
    Transfer receiver(Uuid::generate(), "/a.bin", 2);
    receiver.setMeta(makeMeta("0123456789", 2));
    ASSERT_THROWS(receiver.addPiece(0, "0123456789a"), IntegrityError);

    std::string big = makePayload(Transfer::ChunkSize + 1);
    Transfer other(Uuid::generate(), "/b.bin", 2);
    other.setMeta(makeMeta(makePayload(2 * Transfer::ChunkSize), 2));
    ASSERT_THROWS(other.addPiece(0, big), IntegrityError);
}

void testShortPieces()
{
    std::string payload = makePayload(Transfer::ChunkSize + 10);
    Transfer receiver(Uuid::generate(), "/a.bin", 2);
    receiver.setMeta(makeMeta(payload, 2));
    receiver.addPiece(0, payload.substr(0, 100));
    receiver.addPiece(1, payload.substr(100, 100));

    std::string result;
    ASSERT_THROWS(receiver.finish(&result), IntegrityError);
    ASSERT(result.empty());
}

void testTruncated()
{
    std::string payload = makePayload(3 * Transfer::ChunkSize);
    Transfer receiver(Uuid::generate(), "/a.bin", 2);
    receiver.setMeta(makeMeta(payload, 2));
    receiver.addPiece(0, payload.substr(0, Transfer::ChunkSize));
    receiver.addPiece(1, payload.substr(Transfer::ChunkSize, Transfer::ChunkSize));

    std::string result;
    ASSERT_THROWS(receiver.finish(&result), IntegrityError);
    ASSERT(result.empty());
    ASSERT(receiver.getNextPiece() == 2);
}

void testDigestMismatch()
{
    for (int version = Util::MinimumVersion; version <= Util::MaximumVersion; ++version) {
        std::string payload = makePayload(Transfer::ChunkSize + 100);
        Transfer receiver(Uuid::generate(), "/a.bin", version);
        receiver.setMeta(makeMeta(payload, version));

        // The one-byte sum can't see a swap; flip a single byte instead.
        std::string tampered = payload;
        tampered[7] = static_cast<char>(tampered[7] ^ 0x01);
        receiver.addPiece(0, tampered.substr(0, Transfer::ChunkSize));
        receiver.addPiece(1, tampered.substr(Transfer::ChunkSize));

        std::string result;
        ASSERT_THROWS(receiver.finish(&result), IntegrityError);
        ASSERT(result.empty());
    }
}

int main(int argc, char *argv[])
{
    TESTUTIL_INIT_RAND
    Log::setLevel(Log::Fatal);

    testPieceCount();
    testRelay();
    testPieces();
    testDigests();
    testOutOfOrder();
    testPieceBeforeMeta();
    testBadMeta();
    testOversizedMeta();
    testOversizedPiece();
    testShortPieces();
    testTruncated();
    testDigestMismatch();
    return ASSERT_COUNT;
}
