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
#include <replica/replica_util.h>

#include <sstream>

namespace replica
{

namespace
{

const char *g_indexName = ".replica-index";
const char *g_dataName = "data";

} // unnamed namespace

DirectoryArchive::DirectoryArchive(const std::string &root)
    : Archive()
    , d_root(root)
    , d_records()
    , d_paths()
    , d_mutex()
{
}

DirectoryArchive::~DirectoryArchive()
{
}

bool DirectoryArchive::open()
{
    std::lock_guard<std::mutex> lock(d_mutex);

    std::string dataPath = PathUtil::join(d_root.c_str(), g_dataName);
    if (!PathUtil::createDirectories(dataPath.c_str())) {
        return false;
    }
    return readIndex();
}

bool DirectoryArchive::list(const std::string &prefix, std::vector<FileRecord> *records)
{
    std::lock_guard<std::mutex> lock(d_mutex);

    for (std::map<std::string, Uuid>::const_iterator iter = d_paths.lower_bound(prefix);
         iter != d_paths.end() && iter->first.compare(0, prefix.size(), prefix) == 0; ++iter) {
        records->push_back(d_records[iter->second]);
    }
    return true;
}

bool DirectoryArchive::findById(const Uuid &id, FileRecord *record)
{
    std::lock_guard<std::mutex> lock(d_mutex);

    std::map<Uuid, FileRecord>::const_iterator iter = d_records.find(id);
    if (iter == d_records.end()) {
        return false;
    }
    *record = iter->second;
    return true;
}

bool DirectoryArchive::findByPath(const std::string &path, FileRecord *record)
{
    std::lock_guard<std::mutex> lock(d_mutex);

    std::map<std::string, Uuid>::const_iterator iter = d_paths.find(path);
    if (iter == d_paths.end()) {
        return false;
    }
    *record = d_records[iter->second];
    return true;
}

bool DirectoryArchive::load(const Uuid &id, std::string *payload)
{
    std::lock_guard<std::mutex> lock(d_mutex);

    std::map<Uuid, FileRecord>::const_iterator iter = d_records.find(id);
    if (iter == d_records.end() || iter->second.isDeleted()) {
        LOG_ERROR(ARCHIVE_LOAD) << d_root << ": no live file " << id.toString() << LOG_END
        return false;
    }
    return File::readContents(getPayloadPath(id).c_str(), payload);
}

bool DirectoryArchive::save(const FileRecord &record, const std::string &payload)
{
    std::lock_guard<std::mutex> lock(d_mutex);
    return saveLocked(record, payload);
}

bool DirectoryArchive::saveLocked(const FileRecord &record, const std::string &payload)
{
    if (record.getID().isNil()) {
        LOG_ERROR(ARCHIVE_SAVE) << d_root << ": refusing to save " << record.getPath() << " without an id" << LOG_END
        return false;
    }
    if (record.getPath().find('\n') != std::string::npos) {
        LOG_ERROR(ARCHIVE_SAVE) << d_root << ": refusing to save a path with a line break" << LOG_END
        return false;
    }

    // The payload waits beside its final name until the index names it.
    std::string payloadPath = getPayloadPath(record.getID());
    std::string stagedPath = payloadPath + ".new";
    if (!File::writeContents(stagedPath.c_str(), payload)) {
        return false;
    }

    Records records = d_records;

    // A path names one file; another file stored at the same path is replaced.
    Uuid replaced;
    std::map<std::string, Uuid>::const_iterator path = d_paths.find(record.getPath());
    if (path != d_paths.end() && path->second != record.getID()) {
        replaced = path->second;
        records.erase(replaced);
    }

    FileRecord stored = record;
    stored.setDeleted(false);
    records[stored.getID()] = stored;

    if (!writeIndex(records)) {
        LOG_ERROR(ARCHIVE_SAVE) << d_root << ": unable to record " << stored.toString() << " in the index"
                                << LOG_END
        PathUtil::remove(stagedPath.c_str(), false);
        return false;
    }

    if (!PathUtil::rename(stagedPath.c_str(), payloadPath.c_str())) {
        PathUtil::remove(stagedPath.c_str(), false);
        if (!writeIndex(d_records)) {
            LOG_ERROR(ARCHIVE_INDEX) << d_root << ": unable to restore the index after failing to store "
                                     << stored.toString() << LOG_END
        }
        return false;
    }

    commit(&records);
    if (!replaced.isNil()) {
        PathUtil::remove(getPayloadPath(replaced).c_str(), false);
    }

    LOG_DEBUG(ARCHIVE_SAVE) << d_root << ": saved " << stored.toString() << " (" << payload.size() << " bytes)"
                            << LOG_END
    return true;
}

bool DirectoryArchive::remove(const FileRecord &record)
{
    std::lock_guard<std::mutex> lock(d_mutex);

    Records records = d_records;
    Records::iterator iter = records.find(record.getID());
    if (iter == records.end()) {
        LOG_ERROR(ARCHIVE_REMOVE) << d_root << ": no file " << record.getID().toString() << LOG_END
        return false;
    }

    iter->second.setDeleted(true);
    iter->second.setModified(record.getModified());
    if (!writeIndex(records)) {
        LOG_ERROR(ARCHIVE_REMOVE) << d_root << ": unable to record the deletion of " << iter->second.toString()
                                  << LOG_END
        return false;
    }

    LOG_DEBUG(ARCHIVE_REMOVE) << d_root << ": deleted " << iter->second.toString() << LOG_END
    commit(&records);
    PathUtil::remove(getPayloadPath(record.getID()).c_str(), false);
    return true;
}

bool DirectoryArchive::purge(const Uuid &id)
{
    std::lock_guard<std::mutex> lock(d_mutex);

    Records records = d_records;
    if (records.erase(id) == 0) {
        LOG_ERROR(ARCHIVE_PURGE) << d_root << ": no file " << id.toString() << LOG_END
        return false;
    }

    if (!writeIndex(records)) {
        LOG_ERROR(ARCHIVE_PURGE) << d_root << ": unable to drop " << id.toString() << " from the index" << LOG_END
        return false;
    }

    commit(&records);
    PathUtil::remove(getPayloadPath(id).c_str(), false);
    return true;
}

bool DirectoryArchive::add(const std::string &path, Timestamp modified, const Uuid &owner,
                           const std::string &payload, FileRecord *record)
{
    std::lock_guard<std::mutex> lock(d_mutex);

    FileRecord added(Uuid::generate(), path, modified, false);
    added.setOwner(owner);

    // Keep the id of a file already stored at 'path' so that it is updated rather than replaced.
    std::map<std::string, Uuid>::const_iterator iter = d_paths.find(path);
    if (iter != d_paths.end()) {
        added.setID(iter->second);
    }

    if (!saveLocked(added, payload)) {
        return false;
    }
    *record = added;
    return true;
}

void DirectoryArchive::commit(Records *records)
{
    d_records.swap(*records);
    d_paths.clear();
    for (Records::const_iterator iter = d_records.begin(); iter != d_records.end(); ++iter) {
        d_paths[iter->second.getPath()] = iter->first;
    }
}

std::string DirectoryArchive::getPayloadPath(const Uuid &id) const
{
    std::string dataPath = PathUtil::join(d_root.c_str(), g_dataName);
    return PathUtil::join(dataPath.c_str(), id.toString().c_str());
}

bool DirectoryArchive::readIndex()
{
    Records records;

    std::string indexPath = PathUtil::join(d_root.c_str(), g_indexName);
    if (!PathUtil::exists(indexPath.c_str())) {
        commit(&records);
        return true;
    }

    std::string contents;
    if (!File::readContents(indexPath.c_str(), &contents)) {
        return false;
    }

    std::istringstream stream(contents);
    std::string line;
    int lineNumber = 0;
    while (std::getline(stream, line)) {
        ++lineNumber;
        if (line.empty()) {
            continue;
        }

        // The path is the last field and may contain anything but a newline.
        std::vector<std::string> fields;
        size_t begin = 0;
        for (int i = 0; i < 4; ++i) {
            size_t end = line.find('\t', begin);
            if (end == std::string::npos) {
                break;
            }
            fields.push_back(line.substr(begin, end - begin));
            begin = end + 1;
        }

        Uuid id;
        Uuid owner;
        Timestamp modified;
        if (fields.size() != 4 || !Uuid::parse(fields[0], &id) || !TimeUtil::parse(fields[1], &modified) ||
            (fields[2] != "0" && fields[2] != "1") || !Uuid::parse(fields[3], &owner)) {
            LOG_ERROR(ARCHIVE_INDEX) << indexPath << ":" << lineNumber << ": malformed index entry" << LOG_END
            return false;
        }

        FileRecord record(id, line.substr(begin), modified, fields[2] == "1");
        record.setOwner(owner);
        records[id] = record;
    }

    commit(&records);
    LOG_DEBUG(ARCHIVE_INDEX) << d_root << ": " << d_records.size() << " file(s) in the index" << LOG_END
    return true;
}

bool DirectoryArchive::writeIndex(const Records &records) const
{
    std::string contents;
    for (Records::const_iterator iter = records.begin(); iter != records.end(); ++iter) {
        const FileRecord &record = iter->second;
        contents += record.getID().toString();
        contents += "\t";
        contents += TimeUtil::format(record.getModified());
        contents += "\t";
        contents += record.isDeleted() ? "1" : "0";
        contents += "\t";
        contents += record.getOwner().toString();
        contents += "\t";
        contents += record.getPath();
        contents += "\n";
    }

    std::string indexPath = PathUtil::join(d_root.c_str(), g_indexName);
    return File::writeContents(indexPath.c_str(), contents);
}

DirectoryArchiveProvider::DirectoryArchiveProvider(const std::string &root)
    : ArchiveProvider()
    , d_root(root)
    , d_archives()
    , d_mutex()
{
}

DirectoryArchiveProvider::~DirectoryArchiveProvider()
{
    for (std::map<std::string, DirectoryArchive*>::iterator iter = d_archives.begin(); iter != d_archives.end();
         ++iter) {
        delete iter->second;
    }
}

Archive *DirectoryArchiveProvider::open(const std::string &name)
{
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        LOG_WARNING(ARCHIVE_NAME) << "Invalid archive name '" << name << "'" << LOG_END
        return 0;
    }

    std::lock_guard<std::mutex> lock(d_mutex);

    std::map<std::string, DirectoryArchive*>::iterator iter = d_archives.find(name);
    if (iter != d_archives.end()) {
        return iter->second;
    }

    DirectoryArchive *archive = new DirectoryArchive(PathUtil::join(d_root.c_str(), name.c_str()));
    if (!archive->open()) {
        delete archive;
        return 0;
    }
    d_archives[name] = archive;
    return archive;
}

} // namespace replica
