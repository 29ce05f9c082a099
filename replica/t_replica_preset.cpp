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

#include <replica/replica_preset.h>

#include <replica/replica_authorizer.h>
#include <replica/replica_log.h>

#include <string>
#include <vector>

#include <testutil/testutil_assert.h>

using namespace replica;

namespace {

FileRecord makeRecord(const std::string &path, Timestamp modified, const Uuid &owner)
{
    FileRecord record(Uuid::generate(), path, modified, false);
    record.setOwner(owner);
    return record;
}

} // unnamed namespace

void testPaths()
{
    Preset preset = Preset::custom("photos", "2020", Uuid(), 0);
    ASSERT(preset.getPath() == "/2020/");
    ASSERT(preset.getAbsolutePath("beach/1.jpg") == "/2020/beach/1.jpg");
    ASSERT(preset.getAbsolutePath("/beach/1.jpg") == "/2020/beach/1.jpg");

    std::string relative;
    ASSERT(preset.getRelativePath("/2020/beach/1.jpg", &relative));
    ASSERT(relative == "beach/1.jpg");
    ASSERT(!preset.getRelativePath("/2021/beach/1.jpg", &relative));
    ASSERT(!preset.getRelativePath("/2020/", &relative));
    ASSERT(!preset.getRelativePath("/2020", &relative));

    Preset root;
    ASSERT(root.getPath() == "/");
    ASSERT(root.getAbsolutePath("a.txt") == "/a.txt");
}

void testScope()
{
    Uuid alice = Uuid::generate();
    Uuid bob = Uuid::generate();

    Preset everyone = Preset::custom("docs", "/shared/", Uuid(), 0);
    ASSERT(everyone.contains(makeRecord("/shared/a.txt", 1, alice)));
    ASSERT(everyone.contains(makeRecord("/shared/sub/b.txt", 1, bob)));
    ASSERT(!everyone.contains(makeRecord("/private/a.txt", 1, alice)));
    ASSERT(!everyone.contains(makeRecord("/shared/../private/a.txt", 1, alice)));
    ASSERT(!everyone.contains(makeRecord("/shared/./a.txt", 1, alice)));

    Preset aliceOnly = Preset::custom("docs", "/shared/", alice, 0);
    ASSERT(aliceOnly.contains(makeRecord("/shared/a.txt", 1, alice)));
    ASSERT(!aliceOnly.contains(makeRecord("/shared/a.txt", 1, bob)));

    Preset recent = Preset::custom("docs", "/shared/", Uuid(), 5000000);
    ASSERT(recent.contains(makeRecord("/shared/a.txt", 5000001, alice)));
    ASSERT(!recent.contains(makeRecord("/shared/a.txt", 5000000, alice)));
    ASSERT(!recent.contains(makeRecord("/shared/a.txt", 1, alice)));
}

void testMailPresets()
{
    Uuid peer = Uuid::generate();
    Preset preset;

    ASSERT(Preset::fromOperation(ClientRole, "mail", "", "", Uuid(), 0, Uuid(), &preset));
    ASSERT(preset.getKind() == Preset::MailClient);
    ASSERT(preset.getPath() == "/outbox/");
    ASSERT(preset.isPullEnabled());
    ASSERT(preset.purgeAfterPush());
    ASSERT(std::string(preset.getWireName()) == "mail");

    // The server files incoming mail into the peer's inbox, whatever the client asked for.
    ASSERT(Preset::fromOperation(ServerRole, "mail", "ignored", "/ignored/", Uuid::generate(), 0, peer, &preset));
    ASSERT(preset.getKind() == Preset::MailServer);
    ASSERT(preset.getPath() == "/inbox/");
    ASSERT(preset.getOwner() == peer);
    ASSERT(!preset.isPullEnabled());
    ASSERT(!preset.purgeAfterPush());

    ASSERT(Preset::fromOperation(ServerRole, "custom", "docs", "/shared", peer, 0, peer, &preset));
    ASSERT(preset.getKind() == Preset::Custom);
    ASSERT(preset.getArchive() == "docs");
    ASSERT(preset.getPath() == "/shared/");
    ASSERT(preset.isPullEnabled());
    ASSERT(std::string(preset.getWireName()) == "custom");

    ASSERT(!Preset::fromOperation(ServerRole, "calendar", "", "", Uuid(), 0, peer, &preset));
}

void testEnumeration()
{
    Uuid owner = Uuid::generate();
    Preset preset = Preset::custom("docs", "/shared/", owner, 0);
    ASSERT(!preset.isEnumerated());

    std::vector<FileRecord> records;
    records.push_back(makeRecord("/shared/a.txt", 1, owner));
    records.push_back(makeRecord("/other/b.txt", 1, owner));
    records.push_back(makeRecord("/shared/c.txt", 1, Uuid::generate()));
    records.push_back(makeRecord("/shared/d.txt", 1, owner));

    preset.setEnumeration(records);
    ASSERT(preset.isEnumerated());

    FileRecord record;
    ASSERT(preset.getNextRecord(&record));
    ASSERT(record.getPath() == "/shared/a.txt");
    ASSERT(preset.getNextRecord(&record));
    ASSERT(record.getPath() == "/shared/d.txt");
    ASSERT(!preset.getNextRecord(&record));
    ASSERT(!preset.getNextRecord(&record));
}

void testOwnerAuthorizer()
{
    Uuid peer = Uuid::generate();
    Uuid stranger = Uuid::generate();
    OwnerAuthorizer authorizer(peer);

    ASSERT(authorizer.acceptOperation(Preset::custom("docs", "/", peer, 0)));
    ASSERT(!authorizer.acceptOperation(Preset::custom("docs", "/", stranger, 0)));
    ASSERT(!authorizer.acceptOperation(Preset::custom("docs", "/", Uuid(), 0)));
    ASSERT(authorizer.acceptOperation(Preset::mailServer(peer, 0)));

    Preset preset = Preset::custom("docs", "/", peer, 0);
    FileRecord clientRecord(Uuid::generate(), "a.txt", 2, false);

    ASSERT(authorizer.acceptAction(preset, ServerCreate, clientRecord, FileRecord()));
    ASSERT(authorizer.acceptAction(preset, ServerUpdate, clientRecord, makeRecord("/a.txt", 1, peer)));
    ASSERT(!authorizer.acceptAction(preset, ServerUpdate, clientRecord, makeRecord("/a.txt", 1, stranger)));
    ASSERT(!authorizer.acceptAction(preset, ClientCreate, FileRecord(), makeRecord("/a.txt", 1, stranger)));

    AllowAllAuthorizer allowAll;
    ASSERT(allowAll.acceptOperation(Preset::custom("docs", "/", stranger, 0)));
    ASSERT(allowAll.acceptAction(preset, ServerDelete, clientRecord, makeRecord("/a.txt", 1, stranger)));
}

int main(int argc, char *argv[])
{
    Log::setLevel(Log::Error);

    testPaths();
    testScope();
    testMailPresets();
    testEnumeration();
    testOwnerAuthorizer();
    return ASSERT_COUNT;
}
