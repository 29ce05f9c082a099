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

#include <replica/replica_reconciler.h>

namespace replica
{

Action Reconciler::decide(const FileRecord &local, const FileRecord &remote)
{
    FileRecord::State localState = local.getState();
    FileRecord::State remoteState = remote.getState();

    if (localState == FileRecord::Absent) {
        return (remoteState == FileRecord::Live) ? ClientCreate : NoAction;
    }

    if (remoteState == FileRecord::Absent) {
        return (localState == FileRecord::Live) ? ServerCreate : NoAction;
    }

    if (localState == FileRecord::Tombstone && remoteState == FileRecord::Tombstone) {
        return NoAction;
    }

    if (local.getModified() == remote.getModified()) {
        return NoAction;
    }

    bool localIsNewer = local.isNewerThan(remote);

    if (localState == FileRecord::Tombstone) {
        // remote is live
        return localIsNewer ? ServerDelete : ClientUpdate;
    }

    if (remoteState == FileRecord::Tombstone) {
        // local is live
        return localIsNewer ? ServerUpdate : ClientDelete;
    }

    return localIsNewer ? ServerUpdate : ClientUpdate;
}

Action Reconciler::mirror(Action action)
{
    switch (action) {
    case ClientCreate: return ServerCreate;
    case ClientUpdate: return ServerUpdate;
    case ClientDelete: return ServerDelete;
    case ServerCreate: return ClientCreate;
    case ServerUpdate: return ClientUpdate;
    case ServerDelete: return ClientDelete;
    case NoAction:
    case ActionCount:
        break;
    }
    return NoAction;
}

const char *Reconciler::getName(int action)
{
    switch (action) {
    case NoAction: return "NoAction";
    case ClientCreate: return "ClientCreate";
    case ClientUpdate: return "ClientUpdate";
    case ClientDelete: return "ClientDelete";
    case ServerCreate: return "ServerCreate";
    case ServerUpdate: return "ServerUpdate";
    case ServerDelete: return "ServerDelete";
    default: return "UNDEFINED";
    }
}

} // namespace replica
