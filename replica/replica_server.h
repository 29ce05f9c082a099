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

#ifndef INCLUDED_REPLICA_SERVER_H
#define INCLUDED_REPLICA_SERVER_H

#include <replica/replica_archive.h>
#include <replica/replica_authorizer.h>
#include <replica/replica_io.h>
#include <replica/replica_session.h>
#include <replica/replica_stream.h>
#include <replica/replica_transfer.h>

namespace replica
{

class ServerSession
{
public:
    // Create a server session answering the client at the other end of 'io'.  Archives are opened through
    // 'provider' and every operation and action is checked with 'authorizer'.  'peer' is the identity the host
    // authenticated the client as.  None of these are owned by the session.
    ServerSession(IO *io, ArchiveProvider *provider, Authorizer *authorizer, const Uuid &peer,
                  int *cancelFlag = 0);
    ~ServerSession();

    // How long to wait for the next packet from the client, in milliseconds.
    void setTimeout(int milliseconds);

    // Serve packets until the client closes or aborts the session.  Return true on RPL_CLOSE.
    bool run();

    const Session &getSession() const
    {
        return d_session;
    }

private:
    // NOT IMPLEMENTED
    ServerSession(const ServerSession&);
    ServerSession& operator=(const ServerSession&);

    void dispatch(const Packet &packet);

    void onInit(const Packet &packet);
    void onOperation(const Packet &packet);
    void onRequest(const Packet &packet);
    void onSync(const Packet &packet);
    void onDownload(const Packet &packet);
    void onGet(const Packet &packet);
    void onUpload(const Packet &packet);
    void onPut(const Packet &packet);
    void onDone(const Packet &packet);
    void onAbort(const Packet &packet);
    void onClose(const Packet &packet);

    // Raise a ProtocolViolation unless the operation has been confirmed.
    void requireOperation(const Packet &packet);

    // Raise a ProtocolViolation unless a transfer in the given direction is open.
    void requireTransfer(const Packet &packet, bool isUpload);

    // Find the server's record of the file the client refers to, by id first and then by path.  The returned
    // record has an absolute path, and a nil id if the server doesn't know the file.  'inScope' is set to false if
    // either the client's path or the record found falls outside the preset.
    FileRecord lookup(const FileRecord &clientRecord, bool *inScope);

    // Return 'record' with its path relative to the preset root.
    FileRecord toWire(const FileRecord &record) const;

    // Abort the open transfer: tell the client why, and drop it.
    void abortTransfer(const std::string &reason);

    // Drop the open transfer, if any, without committing anything.
    void dropTransfer();

    IO *d_io;
    Stream d_stream;
    Session d_session;
    PacketStream d_packets;
    ArchiveProvider *d_provider;
    Authorizer *d_authorizer;
    Uuid d_peer;
    Archive *d_archive;                 // opened by the confirmed operation
    Transfer *d_transfer;               // the open transfer, if any
    bool d_isUpload;                    // direction of 'd_transfer'
};

} // namespace replica

#endif // INCLUDED_REPLICA_SERVER_H
