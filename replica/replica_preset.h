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

#ifndef INCLUDED_REPLICA_PRESET_H
#define INCLUDED_REPLICA_PRESET_H

#include <replica/replica_record.h>
#include <replica/replica_timeutil.h>
#include <replica/replica_uuid.h>

#include <string>
#include <vector>

namespace replica
{

// Which end of the channel a session runs on.
enum Role {
    ClientRole,
    ServerRole
};

// The scope of one replication run: which archive, which part of it (the root path, an owner, and a modified
// cutoff), and the hooks of the selected kind.  Paths on the wire are relative to the root; paths in an archive
// are absolute.
class Preset
{
public:

    enum Kind {
        Custom,
        MailClient,             // outgoing mail: push-only, envelopes are purged once delivered
        MailServer              // incoming mail: the peer's inbox, nothing to pull
    };

    Preset();
    Preset(Kind kind, const std::string &archive, const std::string &path, const Uuid &owner, Timestamp cutoff);

    static Preset custom(const std::string &archive, const std::string &path, const Uuid &owner, Timestamp cutoff);
    static Preset mailClient(Timestamp cutoff);
    static Preset mailServer(const Uuid &peer, Timestamp cutoff);

    // Build the preset named 'name' in an RPL_OPERATION for the given role.  'archive', 'path' and 'owner' are
    // only used by "custom"; 'peer' is the authenticated identity of the client and only used on the server.
    // Return false if 'name' is unknown.
    static bool fromOperation(Role role, const std::string &name, const std::string &archive,
                              const std::string &path, const Uuid &owner, Timestamp cutoff, const Uuid &peer,
                              Preset *preset);

    // Map a path relative to the root into the archive, and back.  An absolute path outside the root has no
    // relative form.
    std::string getAbsolutePath(const std::string &relative) const;
    bool getRelativePath(const std::string &absolute, std::string *relative) const;

    // If the absolute 'path' names one file under the root, with no '.' or '..' components.
    bool containsPath(const std::string &path) const;

    // If 'record' (with an absolute path) lies under the root and belongs to the owner, whatever its modified time.
    // The server holds every record it may change on behalf of the client to this.
    bool covers(const FileRecord &record) const;

    // If 'record' (with an absolute path) is inside the scope.
    bool contains(const FileRecord &record) const;

    // The name sent in RPL_OPERATION.
    const char *getWireName() const;

    bool isPullEnabled() const
    {
        return d_kind != MailServer;
    }

    bool purgeAfterPush() const
    {
        return d_kind == MailClient;
    }

    // The server enumerates its archive once, on the first pull request, and hands out one record per request.
    bool isEnumerated() const
    {
        return d_isEnumerated;
    }

    void setEnumeration(const std::vector<FileRecord> &records);

    // Return false once the enumeration is exhausted.
    bool getNextRecord(FileRecord *record);

    Kind getKind() const
    {
        return d_kind;
    }

    const std::string &getArchive() const
    {
        return d_archive;
    }

    const std::string &getPath() const
    {
        return d_path;
    }

    const Uuid &getOwner() const
    {
        return d_owner;
    }

    Timestamp getCutoff() const
    {
        return d_cutoff;
    }

    std::string toString() const;

private:
    Kind d_kind;
    std::string d_archive;
    std::string d_path;                         // always begins and ends with '/'
    Uuid d_owner;                               // nil means all owners
    Timestamp d_cutoff;                         // only files modified after this are in scope; 0 means no cutoff

    bool d_isEnumerated;
    std::vector<FileRecord> d_enumeration;      // the cached enumeration
    size_t d_cursor;                            // next record of 'd_enumeration' to hand out
};

} // namespace replica
#endif //INCLUDED_REPLICA_PRESET_H
