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

#ifndef INCLUDED_REPLICA_AUTHORIZER_H
#define INCLUDED_REPLICA_AUTHORIZER_H

#include <replica/replica_preset.h>
#include <replica/replica_reconciler.h>
#include <replica/replica_record.h>

namespace replica
{

// The policy consulted by the server before it confirms an operation or an action.  A refusal is never an error:
// the operation is rejected or the file is skipped.
class Authorizer
{
public:
    Authorizer();
    virtual ~Authorizer();

    virtual bool acceptOperation(const Preset &preset) = 0;

    // 'action' is in the client's frame; 'serverRecord' is the server's authoritative record (nil id if absent).
    virtual bool acceptAction(const Preset &preset, Action action, const FileRecord &clientRecord,
                              const FileRecord &serverRecord) = 0;

private:
    // NOT IMPLEMENTED
    Authorizer(const Authorizer&);
    Authorizer& operator=(const Authorizer&);
};

class AllowAllAuthorizer : public Authorizer
{
public:
    virtual bool acceptOperation(const Preset &preset);
    virtual bool acceptAction(const Preset &preset, Action action, const FileRecord &clientRecord,
                              const FileRecord &serverRecord);
};

// Lets a peer replicate only its own files: the operation must be scoped to the peer's identity, and an existing
// server file must belong to the peer.
class OwnerAuthorizer : public Authorizer
{
public:
    explicit OwnerAuthorizer(const Uuid &peer);

    virtual bool acceptOperation(const Preset &preset);
    virtual bool acceptAction(const Preset &preset, Action action, const FileRecord &clientRecord,
                              const FileRecord &serverRecord);

private:
    Uuid d_peer;
};

} // namespace replica
#endif //INCLUDED_REPLICA_AUTHORIZER_H
