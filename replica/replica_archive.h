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

#ifndef INCLUDED_REPLICA_ARCHIVE_H
#define INCLUDED_REPLICA_ARCHIVE_H

#include <replica/replica_record.h>
#include <replica/replica_uuid.h>

#include <string>
#include <vector>

namespace replica
{

// The storage engine holding one named file set.  Records handed in and out carry absolute paths.  A method
// returns false if the storage failed or, for the lookups, if there is no such file; the failure is logged by
// the implementation.
class Archive
{
public:
    Archive();
    virtual ~Archive();

    // Append every record (tombstones included) whose path begins with 'prefix'.
    virtual bool list(const std::string &prefix, std::vector<FileRecord> *records) = 0;

    virtual bool findById(const Uuid &id, FileRecord *record) = 0;
    virtual bool findByPath(const std::string &path, FileRecord *record) = 0;

    // Read the payload of a live file.
    virtual bool load(const Uuid &id, std::string *payload) = 0;

    // Create or update the file 'record.getID()' with 'payload'; the stored record is never a tombstone.
    virtual bool save(const FileRecord &record, const std::string &payload) = 0;

    // Turn the file into a tombstone modified at 'record.getModified()' and drop its payload.
    virtual bool remove(const FileRecord &record) = 0;

    // Forget the file entirely.
    virtual bool purge(const Uuid &id) = 0;

private:
    // NOT IMPLEMENTED
    Archive(const Archive&);
    Archive& operator=(const Archive&);
};

// Opens archives by name for the server.  The provider keeps ownership of the archives it returns.
class ArchiveProvider
{
public:
    ArchiveProvider();
    virtual ~ArchiveProvider();

    // Return 0 if there is no archive called 'name'.
    virtual Archive *open(const std::string &name) = 0;

private:
    // NOT IMPLEMENTED
    ArchiveProvider(const ArchiveProvider&);
    ArchiveProvider& operator=(const ArchiveProvider&);
};

} // namespace replica
#endif //INCLUDED_REPLICA_ARCHIVE_H
