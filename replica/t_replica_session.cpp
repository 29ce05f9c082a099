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
#include <replica/replica_server.h>

#include <replica/replica_authorizer.h>
#include <replica/replica_fdio.h>
#include <replica/replica_log.h>
#include <replica/replica_packet.h>
#include <replica/replica_reconciler.h>
#include <replica/replica_session.h>
#include <replica/replica_stream.h>
#include <replica/replica_transfer.h>
#include <replica/replica_util.h>

#include <string>
#include <thread>

#include <csignal>
#include <cstdlib>

#include <sys/socket.h>

#include <testutil/testutil_assert.h>
#include <testutil/testutil_memoryarchive.h>

using namespace replica;
using testutil::MemoryArchive;
using testutil::MemoryArchiveProvider;

namespace {

const Timestamp T1 = 1584177913000000ll;
const Timestamp T2 = 1584177914000000ll;
const Timestamp T3 = 1584177915000000ll;

std::string makePayload(int size)
{
    std::string payload(size, '\0');
    for (int i = 0; i < size; ++i) {
        payload[i] = static_cast<char>(std::rand() & 0xff);
    }
    return payload;
}

bool createChannelPair(int *clientDescriptor, int *serverDescriptor)
{
    int descriptors[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, descriptors) != 0) {
        return false;
    }
    *clientDescriptor = descriptors[0];
    *serverDescriptor = descriptors[1];
    return true;
}

// The outcome of one run between a client and a server session.
struct Outcome
{
    Outcome()
        : d_client(ClientRole)
        , d_server(ServerRole)
        , d_clientResult(false)
        , d_serverResult(false)
    {
    }

    Session d_client;
    Session d_server;
    bool d_clientResult;
    bool d_serverResult;
};

// Run a whole session between 'local' replicating within 'preset' and a server answering from 'provider'.
Outcome replicate(Archive *local, const Preset &preset, ArchiveProvider *provider, Authorizer *authorizer,
                  const Uuid &peer, uint32_t version = Util::MaximumVersion)
{
    Outcome outcome;

    int clientDescriptor;
    int serverDescriptor;
    if (!createChannelPair(&clientDescriptor, &serverDescriptor)) {
        ASSERT(!"socketpair failed");
        return outcome;
    }

    FdIO clientIO(clientDescriptor, clientDescriptor, true);
    FdIO serverIO(serverDescriptor, serverDescriptor, true);
    clientIO.createChannel("replication");
    serverIO.createChannel("replication");

    ServerSession server(&serverIO, provider, authorizer, peer);
    server.setTimeout(5000);

    std::thread serverThread([&]() {
        outcome.d_serverResult = server.run();
        serverIO.closeChannel();
    });

    ClientSession client(&clientIO, local, preset);
    client.setTimeout(5000);
    client.setPreferredVersion(version);
    outcome.d_clientResult = client.run();
    clientIO.closeChannel();

    serverThread.join();

    outcome.d_client = client.getSession();
    outcome.d_server = server.getSession();
    return outcome;
}

// One end of a channel driven packet by packet, for the exchanges a well-behaved peer never produces.
class ScriptedPeer
{
public:
    explicit ScriptedPeer(int descriptor, Role role = ServerRole)
        : d_io(descriptor, descriptor, true)
        , d_stream(&d_io)
        , d_session(role)
        , d_packets(&d_stream, &d_session)
    {
        d_io.createChannel("replication");
        d_stream.setTimeout(10000);
    }

    // Return false if the next packet is not of 'type'.
    bool expect(int type, Packet *packet)
    {
        d_packets.receive(packet);
        return packet->d_type == type;
    }

    bool expect(int type)
    {
        Packet packet;
        return expect(type, &packet);
    }

    void send(const Packet &packet)
    {
        d_packets.send(packet);
    }

    void sendFrame(const std::string &frame)
    {
        d_stream.writeFrame(frame);
    }

    void close()
    {
        d_io.closeChannel();
    }

private:
    FdIO d_io;
    Stream d_stream;
    Session d_session;
    PacketStream d_packets;
};

// Answer the handshake the way a server accepting any operation does.
bool acceptHandshake(ScriptedPeer *server)
{
    if (!server->expect(RPL_INIT)) {
        return false;
    }
    server->send(Packet::version(Util::MaximumVersion));
    if (!server->expect(RPL_OPERATION)) {
        return false;
    }
    server->send(Packet::confirm(true));
    return true;
}

// Run a client session over 'descriptor' against whatever answers on the other end.
bool runClient(int descriptor, Archive *local, const Preset &preset, Session *session)
{
    FdIO clientIO(descriptor, descriptor, true);
    clientIO.createChannel("replication");
    ClientSession client(&clientIO, local, preset);
    client.setTimeout(5000);
    bool result = client.run();
    *session = client.getSession();
    return result;
}

// Takes every operation but refuses any change to the server's copy.
class ReadOnlyAuthorizer : public Authorizer
{
public:
    virtual bool acceptOperation(const Preset &)
    {
        return true;
    }

    virtual bool acceptAction(const Preset &, Action action, const FileRecord &, const FileRecord &)
    {
        return !Reconciler::isUpload(action) && action != ServerDelete;
    }
};

} // unnamed namespace

void testNewFilePropagation()
{
    for (uint32_t version = Util::MinimumVersion; version <= Util::MaximumVersion; ++version) {
        MemoryArchive remote;
        FileRecord big = remote.put("/shared/a.bin", T1, makePayload(2 * Transfer::ChunkSize + 100));
        FileRecord empty = remote.put("/shared/empty.txt", T1, "");
        remote.put("/other/x.txt", T1, "out of scope");

        MemoryArchiveProvider provider;
        provider.add("docs", &remote);
        AllowAllAuthorizer authorizer;

        MemoryArchive local;
        Preset preset = Preset::custom("docs", "/shared", Uuid(), 0);

        Outcome outcome = replicate(&local, preset, &provider, &authorizer, Uuid::generate(), version);
        ASSERT(outcome.d_clientResult);
        ASSERT(outcome.d_serverResult);
        ASSERT(outcome.d_client.d_version == version);
        ASSERT(outcome.d_client.d_phase == Session::Closed);
        ASSERT(outcome.d_server.d_phase == Session::Closed);
        ASSERT(outcome.d_client.d_filesPulled == 2);
        ASSERT(outcome.d_server.d_filesPulled == 2);
        ASSERT(outcome.d_client.d_filesSkipped == 0);
        ASSERT(outcome.d_client.d_bytesDownloaded == 2 * Transfer::ChunkSize + 100);

        FileRecord copy;
        ASSERT(local.findById(big.getID(), &copy));
        ASSERT(copy.getPath() == "/shared/a.bin");
        ASSERT(copy.getModified() == T1);
        ASSERT(!copy.isDeleted());

        std::string expected;
        std::string actual;
        ASSERT(remote.load(big.getID(), &expected));
        ASSERT(local.load(big.getID(), &actual));
        ASSERT(actual == expected);

        ASSERT(local.load(empty.getID(), &actual));
        ASSERT(actual.empty());
        ASSERT(!local.findByPath("/other/x.txt", &copy));
        ASSERT(local.size() == 2);

        // Nothing has changed since, so the second run has nothing to do.
        outcome = replicate(&local, preset, &provider, &authorizer, Uuid::generate(), version);
        ASSERT(outcome.d_clientResult);
        ASSERT(outcome.d_client.d_filesPulled == 0);
        ASSERT(outcome.d_client.d_filesPushed == 0);
        ASSERT(outcome.d_client.d_filesSkipped == 0);
        ASSERT(outcome.d_server.d_filesSkipped == 0);
        ASSERT(outcome.d_client.d_bytesDownloaded == 0);
    }
}

void testDeletionPropagation()
{
    MemoryArchive remote;
    FileRecord stale = remote.put("/shared/f.txt", T1, "stale");
    FileRecord removed = remote.put("/shared/g.txt", T1, "removed");
    remote.putTombstone(FileRecord(removed.getID(), removed.getPath(), T2, true));

    MemoryArchive local;
    local.putTombstone(FileRecord(stale.getID(), stale.getPath(), T2, true));
    local.save(FileRecord(removed.getID(), removed.getPath(), T1, false), "removed");

    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;
    Preset preset = Preset::custom("docs", "/shared/", Uuid(), 0);

    Outcome outcome = replicate(&local, preset, &provider, &authorizer, Uuid::generate());
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_serverResult);
    ASSERT(outcome.d_client.d_filesPushed == 1);
    ASSERT(outcome.d_client.d_filesPulled == 1);

    // The newer local deletion wins over the stale server copy.
    FileRecord record;
    ASSERT(remote.findById(stale.getID(), &record));
    ASSERT(record.isDeleted());
    ASSERT(record.getModified() == T2);

    // The newer server deletion wins over the local copy.
    ASSERT(local.findById(removed.getID(), &record));
    ASSERT(record.isDeleted());
    ASSERT(record.getModified() == T2);

    outcome = replicate(&local, preset, &provider, &authorizer, Uuid::generate());
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_client.d_filesPulled == 0);
    ASSERT(outcome.d_client.d_filesPushed == 0);
    ASSERT(outcome.d_client.d_filesSkipped == 0);
}

void testUpload()
{
    Uuid peer = Uuid::generate();

    MemoryArchive local;
    std::string payload = makePayload(Transfer::ChunkSize + 1);
    FileRecord created = local.put("/shared/new.bin", T1, payload);
    local.put("/shared/empty.txt", T1, "");

    MemoryArchive remote;
    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;
    Preset preset = Preset::custom("docs", "/shared/", Uuid(), 0);

    Outcome outcome = replicate(&local, preset, &provider, &authorizer, peer);
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_serverResult);
    ASSERT(outcome.d_client.d_filesPushed == 2);
    ASSERT(outcome.d_server.d_filesPushed == 2);
    ASSERT(outcome.d_client.d_bytesUploaded == Transfer::ChunkSize + 1);

    FileRecord record;
    ASSERT(remote.findById(created.getID(), &record));
    ASSERT(record.getPath() == "/shared/new.bin");
    ASSERT(record.getModified() == T1);
    ASSERT(record.getOwner() == peer);

    std::string stored;
    ASSERT(remote.load(created.getID(), &stored));
    ASSERT(stored == payload);
    ASSERT(remote.findByPath("/shared/empty.txt", &record));
    ASSERT(remote.load(record.getID(), &stored));
    ASSERT(stored.empty());

    // A newer local copy updates the server copy and keeps its owner.
    std::string update = makePayload(100);
    local.save(FileRecord(created.getID(), created.getPath(), T2, false), update);

    outcome = replicate(&local, preset, &provider, &authorizer, Uuid::generate());
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_client.d_filesPushed == 1);
    ASSERT(remote.findById(created.getID(), &record));
    ASSERT(record.getModified() == T2);
    ASSERT(record.getOwner() == peer);
    ASSERT(remote.load(created.getID(), &stored));
    ASSERT(stored == update);

    // A newer server copy comes back down.
    remote.save(FileRecord(created.getID(), "/shared/new.bin", T3, false), "from the server");

    outcome = replicate(&local, preset, &provider, &authorizer, peer);
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_client.d_filesPulled == 1);
    ASSERT(outcome.d_client.d_filesPushed == 0);
    ASSERT(local.load(created.getID(), &stored));
    ASSERT(stored == "from the server");
}

void testAuthorizationDenied()
{
    Uuid peer = Uuid::generate();
    Uuid stranger = Uuid::generate();

    MemoryArchive remote;
    FileRecord theirs = remote.put("/shared/theirs.txt", T1, "theirs", stranger);
    remote.put("/shared/mine.txt", T1, "old", peer);

    MemoryArchive local;
    local.put("/shared/theirs.txt", T2, "overwritten", peer);
    local.put("/shared/mine.txt", T2, "new", peer);

    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    OwnerAuthorizer authorizer(peer);
    Preset preset = Preset::custom("docs", "/shared/", peer, 0);

    // A refused file is skipped; the session goes on and closes normally.
    Outcome outcome = replicate(&local, preset, &provider, &authorizer, peer);
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_serverResult);
    ASSERT(outcome.d_client.d_filesPushed == 1);
    ASSERT(outcome.d_client.d_filesSkipped == 1);
    ASSERT(outcome.d_server.d_filesSkipped == 1);

    std::string stored;
    ASSERT(remote.load(theirs.getID(), &stored));
    ASSERT(stored == "theirs");

    FileRecord record;
    ASSERT(remote.findByPath("/shared/mine.txt", &record));
    ASSERT(record.getOwner() == peer);
    ASSERT(remote.load(record.getID(), &stored));
    ASSERT(stored == "new");
}

void testVersionMismatch()
{
    MemoryArchive remote;
    remote.put("/a.txt", T1, "a");
    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;

    MemoryArchive local;
    Outcome outcome = replicate(&local, Preset::custom("docs", "/", Uuid(), 0), &provider, &authorizer,
                                Uuid::generate(), 0);
    ASSERT(!outcome.d_clientResult);
    ASSERT(!outcome.d_serverResult);
    ASSERT(outcome.d_client.d_phase == Session::Aborted);
    ASSERT(outcome.d_server.d_phase == Session::Aborted);
    ASSERT(local.size() == 0);
}

void testRejectedOperation()
{
    Uuid peer = Uuid::generate();

    MemoryArchive remote;
    remote.put("/a.txt", T1, "a", peer);
    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    OwnerAuthorizer authorizer(peer);

    MemoryArchive local;
    Outcome outcome = replicate(&local, Preset::custom("docs", "/", Uuid::generate(), 0), &provider, &authorizer,
                                peer);
    ASSERT(!outcome.d_clientResult);
    ASSERT(!outcome.d_serverResult);
    ASSERT(outcome.d_client.d_phase == Session::Aborted);
    ASSERT(outcome.d_server.d_phase == Session::Aborted);
    ASSERT(local.size() == 0);

    outcome = replicate(&local, Preset::custom("missing", "/", peer, 0), &provider, &authorizer, peer);
    ASSERT(!outcome.d_clientResult);
    ASSERT(local.size() == 0);

    outcome = replicate(&local, Preset::custom("docs", "/", peer, 0), &provider, &authorizer, peer);
    ASSERT(outcome.d_clientResult);
    ASSERT(local.size() == 1);
}

void testMailDelivery()
{
    Uuid peer = Uuid::generate();

    MemoryArchive outgoing;
    outgoing.put("/outbox/m1", T1, "hello");
    outgoing.put("/outbox/m2", T2, "world");
    outgoing.put("/drafts/m3", T2, "unsent");

    MemoryArchive mailbox;
    mailbox.put("/inbox/old", T1, "already delivered", peer);
    MemoryArchiveProvider provider;
    provider.add("mail", &mailbox);
    OwnerAuthorizer authorizer(peer);

    Outcome outcome = replicate(&outgoing, Preset::mailClient(0), &provider, &authorizer, peer);
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_serverResult);
    ASSERT(outcome.d_client.d_filesPushed == 2);
    ASSERT(outcome.d_client.d_filesPulled == 0);

    // Delivered envelopes are gone from the outbox; nothing was pulled back.
    FileRecord record;
    ASSERT(outgoing.size() == 1);
    ASSERT(outgoing.findByPath("/drafts/m3", &record));

    ASSERT(mailbox.size() == 3);
    ASSERT(mailbox.findByPath("/inbox/m1", &record));
    ASSERT(record.getOwner() == peer);
    std::string stored;
    ASSERT(mailbox.load(record.getID(), &stored));
    ASSERT(stored == "hello");
    ASSERT(mailbox.findByPath("/inbox/m2", &record));
}

void testLocalFaults()
{
    MemoryArchive remote;
    remote.put("/shared/down.txt", T1, "down");
    remote.failSave = true;

    MemoryArchive local;
    local.put("/shared/up.txt", T1, "up");
    local.failSave = true;

    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;

    // Neither side can store the file it receives; both files are skipped and the session still closes.
    Outcome outcome = replicate(&local, Preset::custom("docs", "/shared/", Uuid(), 0), &provider, &authorizer,
                                Uuid::generate());
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_serverResult);
    ASSERT(outcome.d_client.d_filesSkipped == 2);
    ASSERT(outcome.d_client.d_filesPulled == 0);
    ASSERT(outcome.d_client.d_filesPushed == 0);

    FileRecord record;
    ASSERT(!remote.findByPath("/shared/up.txt", &record));
    ASSERT(!local.findByPath("/shared/down.txt", &record));
}

// The server promises three pieces, sends two and drops the connection.
void testTruncatedTransfer()
{
    int clientDescriptor;
    int serverDescriptor;
    ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

    std::string payload = makePayload(3 * Transfer::ChunkSize);
    Uuid id = Uuid::generate();
    bool scriptCompleted = false;

    std::thread serverThread([&]() {
        try {
            ScriptedPeer server(serverDescriptor);
            Packet packet;
            if (!server.expect(RPL_INIT)) {
                return;
            }
            server.send(Packet::version(2));
            if (!server.expect(RPL_OPERATION)) {
                return;
            }
            server.send(Packet::confirm(true));
            if (!server.expect(RPL_REQUEST)) {
                return;
            }
            server.send(Packet::response(FileRecord(id, "big.bin", T1, false)));
            if (!server.expect(RPL_SYNC, &packet) || packet.d_action != ClientCreate) {
                return;
            }
            server.send(Packet::confirm(true));
            if (!server.expect(RPL_DOWNLOAD)) {
                return;
            }
            server.send(Packet::confirm(true));
            if (!server.expect(RPL_GET, &packet) || packet.d_kind != Packet::Meta) {
                return;
            }
            server.send(Packet::meta(RPL_CHUNK, 3, static_cast<uint32_t>(payload.size()),
                                     Util::digest(2, payload)));
            for (uint32_t i = 0; i < 2; ++i) {
                if (!server.expect(RPL_GET, &packet) || packet.d_piece != i) {
                    return;
                }
                server.send(Packet::data(RPL_CHUNK, i, payload.substr(i * Transfer::ChunkSize,
                                                                       Transfer::ChunkSize)));
            }
            if (!server.expect(RPL_GET)) {
                return;
            }
            server.close();
            scriptCompleted = true;
        } catch (Exception &e) {
            LOG_ERROR(TEST_SCRIPT) << "Scripted server failed: " << e.getMessage() << LOG_END
        }
    });

    MemoryArchive local;
    bool result;
    Session session(ClientRole);
    {
        FdIO clientIO(clientDescriptor, clientDescriptor, true);
        clientIO.createChannel("replication");
        ClientSession client(&clientIO, &local, Preset::custom("docs", "/", Uuid(), 0));
        client.setTimeout(5000);
        result = client.run();
        session = client.getSession();
    }
    serverThread.join();

    ASSERT(scriptCompleted);
    ASSERT(!result);
    ASSERT(session.d_phase == Session::Aborted);
    ASSERT(session.d_filesSkipped == 1);
    ASSERT(session.d_filesPulled == 0);
    ASSERT(session.d_bytesDownloaded == 2 * Transfer::ChunkSize);
    ASSERT(local.size() == 0);
}

// A server that stops answering costs one file per timeout, and the whole session after a few in a row.
void testTimeouts()
{
    int clientDescriptor;
    int serverDescriptor;
    ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

    int requests = 0;
    bool handshakeCompleted = false;

    std::thread serverThread([&]() {
        ScriptedPeer server(serverDescriptor);
        try {
            if (!server.expect(RPL_INIT)) {
                return;
            }
            server.send(Packet::version(2));
            if (!server.expect(RPL_OPERATION)) {
                return;
            }
            server.send(Packet::confirm(true));
            handshakeCompleted = true;

            for (;;) {
                if (server.expect(RPL_REQUEST)) {
                    ++requests;
                }
            }
        } catch (ChannelError &e) {
            LOG_DEBUG(TEST_SCRIPT) << "The client has gone: " << e.getMessage() << LOG_END
        } catch (Exception &e) {
            LOG_ERROR(TEST_SCRIPT) << "Scripted server failed: " << e.getMessage() << LOG_END
        }
    });

    MemoryArchive local;
    bool result;
    Session session(ClientRole);
    {
        FdIO clientIO(clientDescriptor, clientDescriptor, true);
        clientIO.createChannel("replication");
        ClientSession client(&clientIO, &local, Preset::custom("docs", "/", Uuid(), 0));
        client.setTimeout(300);
        result = client.run();
        session = client.getSession();
    }
    serverThread.join();

    ASSERT(handshakeCompleted);
    ASSERT(!result);
    ASSERT(session.d_phase == Session::Aborted);
    ASSERT(requests == ClientSession::MaximumTimeouts);
    ASSERT(session.d_filesSkipped == ClientSession::MaximumTimeouts - 1);
}

// A proposal that doesn't match the server's own state is refused, and so is a transfer nobody agreed to.
void testServerRefusesStaleProposals()
{
    int clientDescriptor;
    int serverDescriptor;
    ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

    MemoryArchive remote;
    FileRecord existing = remote.put("/a.txt", T2, "current");
    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;

    bool serverResult = true;
    Session serverSession(ServerRole);
    std::thread serverThread([&]() {
        FdIO serverIO(serverDescriptor, serverDescriptor, true);
        serverIO.createChannel("replication");
        ServerSession server(&serverIO, &provider, &authorizer, Uuid::generate());
        server.setTimeout(5000);
        serverResult = server.run();
        serverSession = server.getSession();
    });

    ScriptedPeer client(clientDescriptor, ClientRole);
    Packet packet;

    client.send(Packet::init(7));
    ASSERT(client.expect(RPL_VERSION, &packet));
    ASSERT(packet.d_version == Util::MaximumVersion);

    client.send(Packet::operation(packet.d_version, 0, "custom", "docs", "/", Uuid()));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);

    // The client believes its older copy should overwrite the server's.
    client.send(Packet::sync(ServerUpdate, FileRecord(existing.getID(), "a.txt", T1, false)));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    client.send(Packet::upload(existing.getID(), "a.txt", 5));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    client.send(Packet::download(existing.getID(), "a.txt"));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    // A piece request without a download is a protocol violation.
    client.send(Packet::get(Packet::Data, 0));
    ASSERT(client.expect(RPL_ABORT, &packet));

    serverThread.join();
    client.close();

    ASSERT(!serverResult);
    ASSERT(serverSession.d_phase == Session::Aborted);

    std::string stored;
    ASSERT(remote.load(existing.getID(), &stored));
    ASSERT(stored == "current");
}

void testServerAbortsOnMalformedPacket()
{
    int clientDescriptor;
    int serverDescriptor;
    ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

    MemoryArchiveProvider provider;
    AllowAllAuthorizer authorizer;

    bool serverResult = true;
    std::thread serverThread([&]() {
        FdIO serverIO(serverDescriptor, serverDescriptor, true);
        serverIO.createChannel("replication");
        ServerSession server(&serverIO, &provider, &authorizer, Uuid::generate());
        server.setTimeout(5000);
        serverResult = server.run();
    });

    ScriptedPeer client(clientDescriptor, ClientRole);
    client.sendFrame(std::string("\x01\x00\x00", 3));

    Packet packet;
    ASSERT(client.expect(RPL_ABORT, &packet));
    ASSERT(!packet.d_reason.empty());

    serverThread.join();
    client.close();
    ASSERT(!serverResult);
}

void testActionRefusedByPolicy()
{
    MemoryArchive remote;
    FileRecord published = remote.put("/shared/published.txt", T1, "published");

    MemoryArchive local;
    FileRecord draft = local.put("/shared/draft.txt", T1, "draft");

    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    ReadOnlyAuthorizer authorizer;

    Outcome outcome = replicate(&local, Preset::custom("docs", "/shared/", Uuid(), 0), &provider, &authorizer,
                                Uuid::generate());
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_serverResult);
    ASSERT(outcome.d_client.d_filesPulled == 1);
    ASSERT(outcome.d_client.d_filesPushed == 0);
    ASSERT(outcome.d_client.d_filesSkipped == 1);
    ASSERT(outcome.d_server.d_filesSkipped == 1);

    FileRecord record;
    ASSERT(local.findById(published.getID(), &record));
    ASSERT(!remote.findById(draft.getID(), &record));
    ASSERT(remote.size() == 1);
}

// The client knows two server files by id, but they live outside the root it replicates.
void testOutOfScopeRecords()
{
    MemoryArchive remote;
    FileRecord secret = remote.put("/private/secret.txt", T1, "secret");
    FileRecord other = remote.put("/private/other.txt", T1, "other");

    MemoryArchive local;
    local.save(FileRecord(secret.getID(), "/shared/x.txt", T2, false), "overwritten");
    local.putTombstone(FileRecord(other.getID(), "/shared/other.txt", T2, true));

    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;

    Outcome outcome = replicate(&local, Preset::custom("docs", "/shared/", Uuid(), 0), &provider, &authorizer,
                                Uuid::generate());
    ASSERT(outcome.d_clientResult);
    ASSERT(outcome.d_serverResult);
    ASSERT(outcome.d_client.d_filesPushed == 0);
    ASSERT(outcome.d_client.d_filesSkipped == 1);
    ASSERT(outcome.d_server.d_filesPushed == 0);
    ASSERT(outcome.d_server.d_filesSkipped == 2);

    FileRecord record;
    ASSERT(remote.findById(secret.getID(), &record));
    ASSERT(record.getPath() == "/private/secret.txt");
    ASSERT(!record.isDeleted());
    ASSERT(record.getModified() == T1);

    std::string stored;
    ASSERT(remote.load(secret.getID(), &stored));
    ASSERT(stored == "secret");

    ASSERT(remote.findById(other.getID(), &record));
    ASSERT(record.getPath() == "/private/other.txt");
    ASSERT(!record.isDeleted());
    ASSERT(remote.size() == 2);
}

// Proposals naming a file outside the root, by id or by a path that climbs out of it, are refused.
void testServerRefusesOutOfScopeProposals()
{
    int clientDescriptor;
    int serverDescriptor;
    ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

    MemoryArchive remote;
    FileRecord secret = remote.put("/private/secret.txt", T1, "secret");
    remote.put("/shared/inside.txt", T1, "inside");
    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;

    bool serverResult = false;
    Session serverSession(ServerRole);
    std::thread serverThread([&]() {
        FdIO serverIO(serverDescriptor, serverDescriptor, true);
        serverIO.createChannel("replication");
        ServerSession server(&serverIO, &provider, &authorizer, Uuid::generate());
        server.setTimeout(5000);
        serverResult = server.run();
        serverSession = server.getSession();
    });

    ScriptedPeer client(clientDescriptor, ClientRole);
    Packet packet;

    client.send(Packet::init(Util::MaximumVersion));
    ASSERT(client.expect(RPL_VERSION, &packet));
    client.send(Packet::operation(packet.d_version, 0, "custom", "docs", "/shared/", Uuid()));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);

    // Nothing about the out-of-scope file comes back.
    client.send(Packet::request(Packet::Push, FileRecord(secret.getID(), "x.txt", T2, false)));
    ASSERT(client.expect(RPL_RESPONSE, &packet));
    ASSERT(packet.d_record.getID().isNil());
    ASSERT(packet.d_record.getModified() == 0);

    client.send(Packet::sync(ServerUpdate, FileRecord(secret.getID(), "x.txt", T2, false)));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    client.send(Packet::sync(ServerDelete, FileRecord(secret.getID(), "x.txt", T2, true)));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    Uuid fresh = Uuid::generate();
    client.send(Packet::sync(ServerCreate, FileRecord(fresh, "../private/new.txt", T2, false)));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    client.send(Packet::sync(ServerCreate, FileRecord(fresh, "sub/./new.txt", T2, false)));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    client.send(Packet::upload(fresh, "../private/new.txt", 3));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(!packet.d_accepted);

    // The same file under the root is fine.
    client.send(Packet::sync(ServerCreate, FileRecord(fresh, "new.txt", T2, false)));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);

    client.send(Packet::close());
    serverThread.join();
    client.close();

    ASSERT(serverResult);
    ASSERT(serverSession.d_filesSkipped == 4);

    FileRecord record;
    ASSERT(remote.findById(secret.getID(), &record));
    ASSERT(record.getPath() == "/private/secret.txt");
    ASSERT(!record.isDeleted());
    std::string stored;
    ASSERT(remote.load(secret.getID(), &stored));
    ASSERT(stored == "secret");
    ASSERT(remote.size() == 2);
}

// A download that fails verification costs that file only; the client asks for the next one.
void testCorruptDownload()
{
    int clientDescriptor;
    int serverDescriptor;
    ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

    std::string payload = makePayload(100);
    bool abortReceived = false;
    bool nextRequested = false;
    bool closed = false;

    std::thread serverThread([&]() {
        try {
            ScriptedPeer server(serverDescriptor);
            Packet packet;
            if (!acceptHandshake(&server) || !server.expect(RPL_REQUEST)) {
                return;
            }
            server.send(Packet::response(FileRecord(Uuid::generate(), "bad.bin", T1, false)));
            if (!server.expect(RPL_SYNC, &packet) || packet.d_action != ClientCreate) {
                return;
            }
            server.send(Packet::confirm(true));
            if (!server.expect(RPL_DOWNLOAD)) {
                return;
            }
            server.send(Packet::confirm(true));
            if (!server.expect(RPL_GET, &packet) || packet.d_kind != Packet::Meta) {
                return;
            }
            server.send(Packet::meta(RPL_CHUNK, 1, static_cast<uint32_t>(payload.size()), std::string(32, 'x')));
            if (!server.expect(RPL_GET, &packet) || packet.d_piece != 0) {
                return;
            }
            server.send(Packet::data(RPL_CHUNK, 0, payload));

            abortReceived = server.expect(RPL_ABORT);
            nextRequested = server.expect(RPL_REQUEST);
            server.send(Packet::done());
            closed = server.expect(RPL_CLOSE);
        } catch (Exception &e) {
            LOG_ERROR(TEST_SCRIPT) << "Scripted server failed: " << e.getMessage() << LOG_END
        }
    });

    MemoryArchive local;
    Session session(ClientRole);
    bool result = runClient(clientDescriptor, &local, Preset::custom("docs", "/", Uuid(), 0), &session);
    serverThread.join();

    ASSERT(abortReceived);
    ASSERT(nextRequested);
    ASSERT(closed);
    ASSERT(result);
    ASSERT(session.d_phase == Session::Closed);
    ASSERT(session.d_filesSkipped == 1);
    ASSERT(session.d_filesPulled == 0);
    ASSERT(local.size() == 0);
}

// The server refuses to store an upload whose digest or piece count doesn't add up, and takes the next one.
void testServerAbortsCorruptUpload()
{
    int clientDescriptor;
    int serverDescriptor;
    ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

    MemoryArchive remote;
    MemoryArchiveProvider provider;
    provider.add("docs", &remote);
    AllowAllAuthorizer authorizer;

    bool serverResult = false;
    Session serverSession(ServerRole);
    std::thread serverThread([&]() {
        FdIO serverIO(serverDescriptor, serverDescriptor, true);
        serverIO.createChannel("replication");
        ServerSession server(&serverIO, &provider, &authorizer, Uuid::generate());
        server.setTimeout(5000);
        serverResult = server.run();
        serverSession = server.getSession();
    });

    ScriptedPeer client(clientDescriptor, ClientRole);
    Packet packet;

    client.send(Packet::init(Util::MaximumVersion));
    ASSERT(client.expect(RPL_VERSION, &packet));
    uint32_t version = packet.d_version;
    client.send(Packet::operation(version, 0, "custom", "docs", "/", Uuid()));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);

    // A piece altered on the way.
    std::string payload = makePayload(100);
    std::string altered = payload;
    altered[50] = static_cast<char>(altered[50] ^ 0x01);
    FileRecord corrupt(Uuid::generate(), "corrupt.bin", T1, false);

    client.send(Packet::request(Packet::Push, corrupt));
    ASSERT(client.expect(RPL_RESPONSE, &packet));
    client.send(Packet::sync(ServerCreate, corrupt));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);
    client.send(Packet::upload(corrupt.getID(), corrupt.getPath(), static_cast<uint32_t>(payload.size())));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);
    client.send(Packet::meta(RPL_PUT, 1, static_cast<uint32_t>(payload.size()), Util::digest(version, payload)));
    ASSERT(client.expect(RPL_RECEIVED, &packet));
    ASSERT(packet.d_kind == Packet::Meta);
    client.send(Packet::data(RPL_PUT, 0, altered));
    ASSERT(client.expect(RPL_RECEIVED, &packet));
    client.send(Packet::done());
    ASSERT(client.expect(RPL_ABORT, &packet));

    // Two pieces can't hold ten bytes.
    FileRecord miscounted(Uuid::generate(), "miscounted.bin", T1, false);
    client.send(Packet::request(Packet::Push, miscounted));
    ASSERT(client.expect(RPL_RESPONSE, &packet));
    client.send(Packet::sync(ServerCreate, miscounted));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);
    client.send(Packet::upload(miscounted.getID(), miscounted.getPath(), 10));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);
    client.send(Packet::meta(RPL_PUT, 2, 10, Util::digest(version, "0123456789")));
    ASSERT(client.expect(RPL_ABORT, &packet));

    // The session carries on with an intact upload.
    FileRecord intact(Uuid::generate(), "intact.txt", T1, false);
    client.send(Packet::request(Packet::Push, intact));
    ASSERT(client.expect(RPL_RESPONSE, &packet));
    client.send(Packet::sync(ServerCreate, intact));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);
    client.send(Packet::upload(intact.getID(), intact.getPath(), 6));
    ASSERT(client.expect(RPL_CONFIRM, &packet));
    ASSERT(packet.d_accepted);
    client.send(Packet::meta(RPL_PUT, 1, 6, Util::digest(version, "intact")));
    ASSERT(client.expect(RPL_RECEIVED, &packet));
    client.send(Packet::data(RPL_PUT, 0, "intact"));
    ASSERT(client.expect(RPL_RECEIVED, &packet));
    client.send(Packet::done());
    ASSERT(client.expect(RPL_DONE, &packet));

    client.send(Packet::close());
    serverThread.join();
    client.close();

    ASSERT(serverResult);
    ASSERT(serverSession.d_filesSkipped == 2);
    ASSERT(serverSession.d_filesPushed == 1);

    FileRecord record;
    ASSERT(!remote.findById(corrupt.getID(), &record));
    ASSERT(!remote.findById(miscounted.getID(), &record));
    ASSERT(remote.findByPath("/intact.txt", &record));
    std::string stored;
    ASSERT(remote.load(record.getID(), &stored));
    ASSERT(stored == "intact");
    ASSERT(remote.size() == 1);
}

// A server that aborts an upload costs the client that file; one that acknowledges the wrong piece is a
// protocol violation.
void testClientUploadAborted()
{
    for (int misbehave = 0; misbehave < 2; ++misbehave) {
        int clientDescriptor;
        int serverDescriptor;
        ASSERT(createChannelPair(&clientDescriptor, &serverDescriptor));

        bool closed = false;
        bool abortReceived = false;

        std::thread serverThread([&]() {
            try {
                ScriptedPeer server(serverDescriptor);
                Packet packet;
                if (!acceptHandshake(&server) || !server.expect(RPL_REQUEST, &packet) ||
                    packet.d_direction != Packet::Pull) {
                    return;
                }
                server.send(Packet::done());
                if (!server.expect(RPL_REQUEST, &packet) || packet.d_direction != Packet::Push) {
                    return;
                }
                server.send(Packet::response(FileRecord(Uuid(), packet.d_record.getPath(), 0, false)));
                if (!server.expect(RPL_SYNC, &packet) || packet.d_action != ServerCreate) {
                    return;
                }
                server.send(Packet::confirm(true));
                if (!server.expect(RPL_UPLOAD)) {
                    return;
                }
                server.send(Packet::confirm(true));
                if (!server.expect(RPL_PUT, &packet) || packet.d_kind != Packet::Meta) {
                    return;
                }
                if (misbehave) {
                    server.send(Packet::received(Packet::Data, 0));
                    abortReceived = server.expect(RPL_ABORT);
                } else {
                    server.send(Packet::abort("no space left"));
                    closed = server.expect(RPL_CLOSE);
                }
            } catch (Exception &e) {
                LOG_ERROR(TEST_SCRIPT) << "Scripted server failed: " << e.getMessage() << LOG_END
            }
        });

        MemoryArchive local;
        FileRecord outgoing = local.put("/up.bin", T1, makePayload(Transfer::ChunkSize + 5));
        Session session(ClientRole);
        bool result = runClient(clientDescriptor, &local, Preset::custom("docs", "/", Uuid(), 0), &session);
        serverThread.join();

        FileRecord record;
        ASSERT(local.findById(outgoing.getID(), &record));
        ASSERT(session.d_filesPushed == 0);
        if (misbehave) {
            ASSERT(abortReceived);
            ASSERT(!result);
            ASSERT(session.d_phase == Session::Aborted);
        } else {
            ASSERT(closed);
            ASSERT(result);
            ASSERT(session.d_phase == Session::Closed);
            ASSERT(session.d_filesSkipped == 1);
        }
    }
}

int main(int argc, char *argv[])
{
    TESTUTIL_INIT_RAND
    ::signal(SIGPIPE, SIG_IGN);
    Log::setLevel(Log::Fatal);

    testNewFilePropagation();
    testDeletionPropagation();
    testUpload();
    testAuthorizationDenied();
    testVersionMismatch();
    testRejectedOperation();
    testMailDelivery();
    testLocalFaults();
    testTruncatedTransfer();
    testTimeouts();
    testServerRefusesStaleProposals();
    testServerAbortsOnMalformedPacket();
    testActionRefusedByPolicy();
    testOutOfScopeRecords();
    testServerRefusesOutOfScopeProposals();
    testCorruptDownload();
    testServerAbortsCorruptUpload();
    testClientUploadAborted();
    return ASSERT_COUNT;
}
