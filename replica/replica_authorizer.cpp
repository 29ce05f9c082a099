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

#include <replica/replica_authorizer.h>

#include <replica/replica_log.h>

namespace replica
{

Authorizer::Authorizer()
{
}

Authorizer::~Authorizer()
{
}

bool AllowAllAuthorizer::acceptOperation(const Preset &)
{
    return true;
}

bool AllowAllAuthorizer::acceptAction(const Preset &, Action, const FileRecord &, const FileRecord &)
{
    return true;
}

OwnerAuthorizer::OwnerAuthorizer(const Uuid &peer)
    : Authorizer()
    , d_peer(peer)
{
}

bool OwnerAuthorizer::acceptOperation(const Preset &preset)
{
    if (d_peer.isNil() || preset.getOwner() != d_peer) {
        LOG_INFO(RPL_DENIED) << "Operation " << preset.toString() << " is not scoped to peer "
                             << d_peer.toString() << LOG_END
        return false;
    }
    return true;
}

bool OwnerAuthorizer::acceptAction(const Preset &, Action action, const FileRecord &clientRecord,
                                   const FileRecord &serverRecord)
{
    if (serverRecord.getState() != FileRecord::Absent && serverRecord.getOwner() != d_peer) {
        LOG_INFO(RPL_DENIED) << Reconciler::getName(action) << " on " << clientRecord.getPath()
                             << ": the file belongs to " << serverRecord.getOwner().toString() << LOG_END
        return false;
    }
    return true;
}

} // namespace replica
