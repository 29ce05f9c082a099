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

#include <replica/replica_directoryarchive.h>

#include <replica/replica_file.h>
#include <replica/replica_log.h>
#include <replica/replica_pathutil.h>

#include <string>
#include <vector>

#include <testutil/testutil_assert.h>

using namespace replica;

void testAddAndLoad(const std::string &top)
{
    DirectoryArchive archive(PathUtil::join(top.c_str(), "docs"));
    ASSERT(archive.open());
    ASSERT(PathUtil::isDirectory(PathUtil::join(archive.getRoot().c_str(), "data").c_str()));

    std::vector<FileRecord> records;
    ASSERT(archive.list("/", &records));
    ASSERT(records.empty());

    Uuid owner = Uuid::generate();
    FileRecord added;
    ASSERT(archive.add("/shared/a.txt", 1000000, owner, "first", &added));
    ASSERT(!added.getID().isNil());
    ASSERT(added.getOwner() == owner);

    FileRecord found;
    ASSERT(archive.findByPath("/shared/a.txt", &found));
    ASSERT(found.getID() == added.getID());
    ASSERT(found.getModified() == 1000000);
    ASSERT(!found.isDeleted());
    ASSERT(archive.findById(added.getID(), &found));
    ASSERT(found.getPath() == "/shared/a.txt");

    std::string payload;
    ASSERT(archive.load(added.getID(), &payload));
    ASSERT(payload == "first");

    // Adding the same path again updates the file under its id.
    FileRecord updated;
    ASSERT(archive.add("/shared/a.txt", 2000000, owner, "second", &updated));
    ASSERT(updated.getID() == added.getID());
    ASSERT(archive.load(added.getID(), &payload));
    ASSERT(payload == "second");

    ASSERT(!archive.findByPath("/shared/b.txt", &found));
    ASSERT(!archive.findById(Uuid::generate(), &found));
    ASSERT(!archive.load(Uuid::generate(), &payload));
}

void testRemoveAndPurge(const std::string &top)
{
    DirectoryArchive archive(PathUtil::join(top.c_str(), "trash"));
    ASSERT(archive.open());

    FileRecord record;
    ASSERT(archive.add("/a.txt", 1000000, Uuid(), "payload", &record));

    FileRecord tombstone = record;
    tombstone.setModified(3000000);
    ASSERT(archive.remove(tombstone));

    FileRecord found;
    ASSERT(archive.findById(record.getID(), &found));
    ASSERT(found.getState() == FileRecord::Tombstone);
    ASSERT(found.getModified() == 3000000);

    std::string payload;
    ASSERT(!archive.load(record.getID(), &payload));

    std::vector<FileRecord> records;
    ASSERT(archive.list("/", &records));
    ASSERT(records.size() == 1);

    // Saving brings it back to life.
    FileRecord revived(record.getID(), "/a.txt", 4000000, false);
    ASSERT(archive.save(revived, "again"));
    ASSERT(archive.findByPath("/a.txt", &found));
    ASSERT(found.getState() == FileRecord::Live);

    ASSERT(archive.purge(record.getID()));
    ASSERT(!archive.findById(record.getID(), &found));
    ASSERT(!archive.findByPath("/a.txt", &found));
    ASSERT(!archive.purge(record.getID()));
    ASSERT(!archive.remove(record));
}

void testSave(const std::string &top)
{
    DirectoryArchive archive(PathUtil::join(top.c_str(), "save"));
    ASSERT(archive.open());

    FileRecord first(Uuid::generate(), "/x.txt", 1000000, false);
    ASSERT(archive.save(first, "one"));

    // Another file at the same path replaces the first one.
    FileRecord second(Uuid::generate(), "/x.txt", 2000000, false);
    ASSERT(archive.save(second, "two"));

    FileRecord found;
    ASSERT(!archive.findById(first.getID(), &found));
    ASSERT(archive.findByPath("/x.txt", &found));
    ASSERT(found.getID() == second.getID());

    // A rename moves the path.
    FileRecord renamed(second.getID(), "/y.txt", 3000000, false);
    ASSERT(archive.save(renamed, "two"));
    ASSERT(!archive.findByPath("/x.txt", &found));
    ASSERT(archive.findByPath("/y.txt", &found));

    ASSERT(!archive.save(FileRecord(Uuid(), "/z.txt", 1, false), "nil"));
    ASSERT(!archive.save(FileRecord(Uuid::generate(), "/line\nbreak", 1, false), "bad"));
}

void testList(const std::string &top)
{
    DirectoryArchive archive(PathUtil::join(top.c_str(), "list"));
    ASSERT(archive.open());

    FileRecord record;
    ASSERT(archive.add("/inbox/1", 1, Uuid(), "1", &record));
    ASSERT(archive.add("/inbox/2", 1, Uuid(), "2", &record));
    ASSERT(archive.add("/outbox/3", 1, Uuid(), "3", &record));
    ASSERT(archive.add("/inboxes", 1, Uuid(), "4", &record));

    std::vector<FileRecord> records;
    ASSERT(archive.list("/inbox/", &records));
    ASSERT(records.size() == 2);
    ASSERT(records[0].getPath() == "/inbox/1");
    ASSERT(records[1].getPath() == "/inbox/2");

    records.clear();
    ASSERT(archive.list("/", &records));
    ASSERT(records.size() == 4);
}

void testReopen(const std::string &top)
{
    std::string root = PathUtil::join(top.c_str(), "reopen");
    Uuid owner = Uuid::generate();
    FileRecord live;
    FileRecord deleted;

    {
        DirectoryArchive archive(root);
        ASSERT(archive.open());
        ASSERT(archive.add("/notes/with\ttab.txt", 1584177913589793ll, owner, "live", &live));
        ASSERT(archive.add("/notes/gone.txt", 1000000, owner, "gone", &deleted));
        deleted.setModified(2000000);
        ASSERT(archive.remove(deleted));
    }

    DirectoryArchive archive(root);
    ASSERT(archive.open());

    FileRecord found;
    ASSERT(archive.findById(live.getID(), &found));
    ASSERT(found.getPath() == "/notes/with\ttab.txt");
    ASSERT(found.getModified() == 1584177913589793ll);
    ASSERT(found.getOwner() == owner);
    ASSERT(!found.isDeleted());

    std::string payload;
    ASSERT(archive.load(live.getID(), &payload));
    ASSERT(payload == "live");

    ASSERT(archive.findByPath("/notes/gone.txt", &found));
    ASSERT(found.getID() == deleted.getID());
    ASSERT(found.isDeleted());
    ASSERT(found.getModified() == 2000000);
}

void testMalformedIndex(const std::string &top)
{
    std::string root = PathUtil::join(top.c_str(), "broken");
    ASSERT(PathUtil::createDirectories(root.c_str()));
    ASSERT(File::writeContents(PathUtil::join(root.c_str(), ".replica-index").c_str(), "not\tan\tindex\n"));

    DirectoryArchive archive(root);
    ASSERT(!archive.open());
}

// While the index can't be written nothing changes, in memory or on disk.
void testIndexWriteFailure(const std::string &top)
{
    std::string root = PathUtil::join(top.c_str(), "stuck");
    std::string dataPath = PathUtil::join(root.c_str(), "data");
    DirectoryArchive archive(root);
    ASSERT(archive.open());

    FileRecord first(Uuid::generate(), "/x.txt", 1000000, false);
    ASSERT(archive.save(first, "one"));

    // A directory where the index belongs makes every rename over it fail.
    std::string indexPath = PathUtil::join(root.c_str(), ".replica-index");
    ASSERT(PathUtil::remove(indexPath.c_str()));
    ASSERT(PathUtil::createDirectory(indexPath.c_str()));

    FileRecord second(Uuid::generate(), "/x.txt", 2000000, false);
    ASSERT(!archive.save(second, "two"));
    ASSERT(!archive.save(FileRecord(first.getID(), "/x.txt", 3000000, false), "three"));

    FileRecord tombstone = first;
    tombstone.setModified(4000000);
    ASSERT(!archive.remove(tombstone));
    ASSERT(!archive.purge(first.getID()));

    FileRecord found;
    ASSERT(archive.findByPath("/x.txt", &found));
    ASSERT(found.getID() == first.getID());
    ASSERT(found.getModified() == 1000000);
    ASSERT(!found.isDeleted());
    ASSERT(!archive.findById(second.getID(), &found));

    std::string payload;
    ASSERT(archive.load(first.getID(), &payload));
    ASSERT(payload == "one");

    std::string secondPath = PathUtil::join(dataPath.c_str(), second.getID().toString().c_str());
    ASSERT(!PathUtil::exists(secondPath.c_str()));
    ASSERT(!PathUtil::exists((secondPath + ".new").c_str()));
    ASSERT(!PathUtil::exists((PathUtil::join(dataPath.c_str(), first.getID().toString().c_str()) + ".new").c_str()));

    // Once the index is writable again the archive carries on from where it was.
    ASSERT(PathUtil::remove(indexPath.c_str()));
    ASSERT(archive.save(second, "two"));
    ASSERT(!archive.findById(first.getID(), &found));

    DirectoryArchive reopened(root);
    ASSERT(reopened.open());
    ASSERT(reopened.findByPath("/x.txt", &found));
    ASSERT(found.getID() == second.getID());
    ASSERT(reopened.load(second.getID(), &payload));
    ASSERT(payload == "two");
    ASSERT(!reopened.findById(first.getID(), &found));
}

void testProvider(const std::string &top)
{
    DirectoryArchiveProvider provider(PathUtil::join(top.c_str(), "provider"));

    Archive *mail = provider.open("mail");
    ASSERT(mail != 0);
    ASSERT(provider.open("mail") == mail);
    ASSERT(provider.open("docs") != 0);
    ASSERT(provider.open("docs") != mail);

    ASSERT(provider.open("") == 0);
    ASSERT(provider.open(".") == 0);
    ASSERT(provider.open("..") == 0);
    ASSERT(provider.open("../mail") == 0);
    ASSERT(provider.open("a/b") == 0);
}

int main(int argc, char *argv[])
{
    TESTUTIL_INIT_RAND
    Log::setLevel(Log::Fatal);

    std::string top = PathUtil::getCurrentDirectory();
    top = PathUtil::join(top.c_str(), "test_archive");

    PathUtil::removeDirectoryRecursively(top.c_str());
    ASSERT(PathUtil::createDirectory(top.c_str()));

    testAddAndLoad(top);
    testRemoveAndPurge(top);
    testSave(top);
    testList(top);
    testReopen(top);
    testMalformedIndex(top);
    testIndexWriteFailure(top);
    testProvider(top);

    PathUtil::removeDirectoryRecursively(top.c_str());
    return ASSERT_COUNT;
}
