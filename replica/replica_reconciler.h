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

#ifndef INCLUDED_REPLICA_RECONCILER_H
#define INCLUDED_REPLICA_RECONCILER_H

#include <replica/replica_record.h>

namespace replica
{

// What has to happen to one file, always in the client's frame: 'Client*' actions change the client's archive,
// 'Server*' actions change the server's.  The values are the wire encoding.
enum Action {
    NoAction = 0,
    ClientCreate = 1,
    ClientUpdate = 2,
    ClientDelete = 3,
    ServerCreate = 4,
    ServerUpdate = 5,
    ServerDelete = 6,
    ActionCount = 7
};

struct Reconciler
{
    // Decide what to do with a file known as 'local' on the deciding side and as 'remote' on the other side.  The
    // result is expressed as if the deciding side were the client.  A tie on the modified time of two known
    // records means the copies are already consistent.
    static Action decide(const FileRecord &local, const FileRecord &remote);

    // Swap the client and the server variant of 'action'.  The server checks a proposal from the client with
    // 'mirror(decide(serverRecord, clientRecord))'.
    static Action mirror(Action action);

    // If 'action' moves a payload from the server to the client.
    static bool isDownload(Action action)
    {
        return action == ClientCreate || action == ClientUpdate;
    }

    // If 'action' moves a payload from the client to the server.
    static bool isUpload(Action action)
    {
        return action == ServerCreate || action == ServerUpdate;
    }

    static const char *getName(int action);
};

} // namespace replica
#endif //INCLUDED_REPLICA_RECONCILER_H
