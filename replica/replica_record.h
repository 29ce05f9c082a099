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

#ifndef INCLUDED_REPLICA_RECORD_H
#define INCLUDED_REPLICA_RECORD_H

#include <replica/replica_timeutil.h>
#include <replica/replica_uuid.h>

#include <string>

namespace replica
{

// One party's knowledge of one file.  A nil id means the file is unknown to that party, which is not the same as
// a tombstone (a known file marked deleted).
class FileRecord
{
public:

    enum State {
        Absent,
        Tombstone,
        Live
    };

    FileRecord()
        : d_id()
        , d_path()
        , d_modified(0)
        , d_deleted(false)
        , d_owner()
    {
    }

    FileRecord(const Uuid &id, const std::string &path, Timestamp modified, bool deleted)
        : d_id(id)
        , d_path(path)
        , d_modified(modified)
        , d_deleted(deleted)
        , d_owner()
    {
    }

    // Return the state used by the reconciliation table.
    State getState() const
    {
        if (d_id.isNil()) {
            return Absent;
        }
        return d_deleted ? Tombstone : Live;
    }

    // Return 'true' if this record was modified later than 'other'.
    bool isNewerThan(const FileRecord &other) const
    {
        return d_modified > other.d_modified;
    }

    // Compare by path; used for sorting enumerations.
    static bool compareByPath(const FileRecord &lhs, const FileRecord &rhs);

    // A short description for log messages.
    std::string toString() const;

    static const char *getStateName(int state);

    const Uuid &getID() const
    {
        return d_id;
    }

    void setID(const Uuid &id)
    {
        d_id = id;
    }

    const std::string &getPath() const
    {
        return d_path;
    }

    void setPath(const std::string &path)
    {
        d_path = path;
    }

    Timestamp getModified() const
    {
        return d_modified;
    }

    void setModified(Timestamp modified)
    {
        d_modified = modified;
    }

    bool isDeleted() const
    {
        return d_deleted;
    }

    void setDeleted(bool deleted)
    {
        d_deleted = deleted;
    }

    const Uuid &getOwner() const
    {
        return d_owner;
    }

    void setOwner(const Uuid &owner)
    {
        d_owner = owner;
    }

private:
    Uuid d_id;                  // identifier of the file; nil if unknown
    std::string d_path;         // path of the file, relative or absolute depending on the context
    Timestamp d_modified;       // last modified time; 0 means never
    bool d_deleted;             // whether the file is a tombstone
    Uuid d_owner;               // owner identity; never sent over the wire
};

} // namespace replica
#endif //INCLUDED_REPLICA_RECORD_H
