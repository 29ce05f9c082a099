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

#ifndef INCLUDED_REPLICA_DIRECTORYARCHIVE_H
#define INCLUDED_REPLICA_DIRECTORYARCHIVE_H

#include <replica/replica_archive.h>

#include <map>
#include <mutex>
#include <string>

namespace replica
{

// An archive kept in a local directory:
//
//   <root>/.replica-index      one line per file: id, modified, deleted, owner, path (tab-separated)
//   <root>/data/<id>           the payload of each live file
//
// Payloads and the index are replaced atomically (write a temporary file, then rename).  The methods may be
// called from several sessions at once.
class DirectoryArchive : public Archive
{
public:
    explicit DirectoryArchive(const std::string &root);
    ~DirectoryArchive();

    // Create the directories if needed and read the index.  Return false if the archive can't be used.
    bool open();

    virtual bool list(const std::string &prefix, std::vector<FileRecord> *records);
    virtual bool findById(const Uuid &id, FileRecord *record);
    virtual bool findByPath(const std::string &path, FileRecord *record);
    virtual bool load(const Uuid &id, std::string *payload);
    virtual bool save(const FileRecord &record, const std::string &payload);
    virtual bool remove(const FileRecord &record);
    virtual bool purge(const Uuid &id);

    // Store a new local file at 'path' under a freshly generated id.  Used by the command-line client to import
    // files into its outgoing archive.
    bool add(const std::string &path, Timestamp modified, const Uuid &owner, const std::string &payload,
             FileRecord *record);

    const std::string &getRoot() const
    {
        return d_root;
    }

private:
    // NOT IMPLEMENTED
    DirectoryArchive(const DirectoryArchive&);
    DirectoryArchive& operator=(const DirectoryArchive&);

    typedef std::map<Uuid, FileRecord> Records;

    bool readIndex();

    // Every change is written to the index as a whole new set of records first; memory and the payload files are
    // only touched once that has succeeded.
    bool writeIndex(const Records &records) const;

    // Make 'records' the current set, leaving the previous one in 'records'.
    void commit(Records *records);

    std::string getPayloadPath(const Uuid &id) const;

    // The caller must hold 'd_mutex'.
    bool saveLocked(const FileRecord &record, const std::string &payload);

    std::string d_root;
    Records d_records;
    std::map<std::string, Uuid> d_paths;
    std::mutex d_mutex;
};

// Maps every archive name to a DirectoryArchive in a subdirectory of the same name.
class DirectoryArchiveProvider : public ArchiveProvider
{
public:
    explicit DirectoryArchiveProvider(const std::string &root);
    ~DirectoryArchiveProvider();

    virtual Archive *open(const std::string &name);

private:
    std::string d_root;
    std::map<std::string, DirectoryArchive*> d_archives;
    std::mutex d_mutex;
};

} // namespace replica
#endif //INCLUDED_REPLICA_DIRECTORYARCHIVE_H
