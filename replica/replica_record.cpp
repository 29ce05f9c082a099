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

#include <replica/replica_record.h>

namespace replica
{

bool FileRecord::compareByPath(const FileRecord &lhs, const FileRecord &rhs)
{
    if (lhs.d_path == rhs.d_path) {
        return lhs.d_id < rhs.d_id;
    }
    return lhs.d_path < rhs.d_path;
}

const char *FileRecord::getStateName(int state)
{
    switch (state) {
        case Absent: return "absent";
        case Tombstone: return "tombstone";
        case Live: return "live";
        default: return "undefined";
    }
}

std::string FileRecord::toString() const
{
    if (d_id.isNil()) {
        return "'" + d_path + "' (absent)";
    }
    return "'" + d_path + "' (" + d_id.toString() + ", " + TimeUtil::format(d_modified) +
           (d_deleted ? ", deleted)" : ")");
}

} // namespace replica
