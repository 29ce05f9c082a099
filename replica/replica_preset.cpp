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

#include <replica/replica_log.h>
#include <replica/replica_util.h>

#include <sstream>

namespace replica
{

namespace
{

// Make sure 'path' begins and ends with a '/'.
std::string normalizeRoot(const std::string &path)
{
    std::string root = path;
    if (root.empty() || root[0] != '/') {
        root = "/" + root;
    }
    if (root[root.size() - 1] != '/') {
        root += "/";
    }
    return root;
}

} // unnamed namespace

Preset::Preset()
    : d_kind(Custom)
    , d_archive()
    , d_path("/")
    , d_owner()
    , d_cutoff(0)
    , d_isEnumerated(false)
    , d_enumeration()
    , d_cursor(0)
{
}

Preset::Preset(Kind kind, const std::string &archive, const std::string &path, const Uuid &owner, Timestamp cutoff)
    : d_kind(kind)
    , d_archive(archive)
    , d_path(normalizeRoot(path))
    , d_owner(owner)
    , d_cutoff(cutoff)
    , d_isEnumerated(false)
    , d_enumeration()
    , d_cursor(0)
{
}

Preset Preset::custom(const std::string &archive, const std::string &path, const Uuid &owner, Timestamp cutoff)
{
    return Preset(Custom, archive, path, owner, cutoff);
}

Preset Preset::mailClient(Timestamp cutoff)
{
    return Preset(MailClient, "mail", "/outbox/", Uuid(), cutoff);
}

Preset Preset::mailServer(const Uuid &peer, Timestamp cutoff)
{
    return Preset(MailServer, "mail", "/inbox/", peer, cutoff);
}

bool Preset::fromOperation(Role role, const std::string &name, const std::string &archive,
                           const std::string &path, const Uuid &owner, Timestamp cutoff, const Uuid &peer,
                           Preset *preset)
{
    if (name == "custom") {
        *preset = custom(archive, path, owner, cutoff);
        return true;
    }

    if (name == "mail") {
        *preset = (role == ClientRole) ? mailClient(cutoff) : mailServer(peer, cutoff);
        return true;
    }

    LOG_WARNING(PRESET_UNKNOWN) << "Unknown preset '" << name << "'" << LOG_END
    return false;
}

std::string Preset::getAbsolutePath(const std::string &relative) const
{
    size_t start = relative.find_first_not_of('/');
    if (start == std::string::npos) {
        return d_path;
    }
    return d_path + relative.substr(start);
}

bool Preset::getRelativePath(const std::string &absolute, std::string *relative) const
{
    if (absolute.size() <= d_path.size() || absolute.compare(0, d_path.size(), d_path) != 0) {
        return false;
    }
    *relative = absolute.substr(d_path.size());
    return true;
}

bool Preset::containsPath(const std::string &path) const
{
    std::string relative;
    if (!getRelativePath(path, &relative)) {
        return false;
    }

    // No '.' or '..' components; a path names exactly one file under the root.
    std::vector<std::string> components;
    Util::tokenize(relative, &components, "/");
    for (size_t i = 0; i < components.size(); ++i) {
        if (components[i] == "." || components[i] == "..") {
            return false;
        }
    }
    return true;
}

bool Preset::covers(const FileRecord &record) const
{
    if (!containsPath(record.getPath())) {
        return false;
    }
    return d_owner.isNil() || record.getOwner() == d_owner;
}

bool Preset::contains(const FileRecord &record) const
{
    if (!covers(record)) {
        return false;
    }
    return d_cutoff == 0 || record.getModified() > d_cutoff;
}

const char *Preset::getWireName() const
{
    return d_kind == Custom ? "custom" : "mail";
}

void Preset::setEnumeration(const std::vector<FileRecord> &records)
{
    d_enumeration.clear();
    for (size_t i = 0; i < records.size(); ++i) {
        if (contains(records[i])) {
            d_enumeration.push_back(records[i]);
        }
    }
    d_cursor = 0;
    d_isEnumerated = true;
}

bool Preset::getNextRecord(FileRecord *record)
{
    if (d_cursor >= d_enumeration.size()) {
        return false;
    }
    *record = d_enumeration[d_cursor++];
    return true;
}

std::string Preset::toString() const
{
    std::stringstream stream;
    stream << getWireName() << ":" << d_archive << ":" << d_path;
    if (!d_owner.isNil()) {
        stream << " owner=" << d_owner.toString();
    }
    if (d_cutoff != 0) {
        stream << " after=" << TimeUtil::format(d_cutoff);
    }
    return stream.str();
}

} // namespace replica
