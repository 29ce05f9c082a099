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

#include <replica/replica_record.h>
#include <replica/replica_uuid.h>

#include <cstring>

#include <testutil/testutil_assert.h>

using namespace replica;

namespace {

const Timestamp T1 = 1000000;
const Timestamp T2 = 2000000;

FileRecord makeRecord(int state, Timestamp modified)
{
    if (state == FileRecord::Absent) {
        return FileRecord();
    }
    return FileRecord(Uuid::generate(), "/docs/a.txt", modified, state == FileRecord::Tombstone);
}

} // unnamed namespace

void testDecisionTable()
{
    struct Row {
        int d_local;
        int d_remote;
        Timestamp d_localTime;
        Timestamp d_remoteTime;
        Action d_expected;
    } ROWS[] = {
        { FileRecord::Absent,    FileRecord::Absent,    0,  0,  NoAction },
        { FileRecord::Absent,    FileRecord::Tombstone, 0,  T1, NoAction },
        { FileRecord::Absent,    FileRecord::Live,      0,  T1, ClientCreate },
        { FileRecord::Tombstone, FileRecord::Absent,    T1, 0,  NoAction },
        { FileRecord::Tombstone, FileRecord::Tombstone, T2, T1, NoAction },
        { FileRecord::Tombstone, FileRecord::Tombstone, T1, T2, NoAction },
        { FileRecord::Tombstone, FileRecord::Live,      T2, T1, ServerDelete },
        { FileRecord::Tombstone, FileRecord::Live,      T1, T2, ClientUpdate },
        { FileRecord::Live,      FileRecord::Absent,    T1, 0,  ServerCreate },
        { FileRecord::Live,      FileRecord::Tombstone, T2, T1, ServerUpdate },
        { FileRecord::Live,      FileRecord::Tombstone, T1, T2, ClientDelete },
        { FileRecord::Live,      FileRecord::Live,      T2, T1, ServerUpdate },
        { FileRecord::Live,      FileRecord::Live,      T1, T2, ClientUpdate },
    };

    for (unsigned int i = 0; i < sizeof(ROWS) / sizeof(ROWS[0]); ++i) {
        FileRecord local = makeRecord(ROWS[i].d_local, ROWS[i].d_localTime);
        FileRecord remote = makeRecord(ROWS[i].d_remote, ROWS[i].d_remoteTime);
        ASSERT(Reconciler::decide(local, remote) == ROWS[i].d_expected);
    }
}

// Equal times between two known records mean the copies are already consistent.
void testTies()
{
    ASSERT(Reconciler::decide(makeRecord(FileRecord::Live, T1), makeRecord(FileRecord::Live, T1)) == NoAction);
    ASSERT(Reconciler::decide(makeRecord(FileRecord::Tombstone, T1), makeRecord(FileRecord::Live, T1)) == NoAction);
    ASSERT(Reconciler::decide(makeRecord(FileRecord::Live, T1), makeRecord(FileRecord::Tombstone, T1)) == NoAction);

    // Rows involving an unknown record don't depend on the time at all.
    ASSERT(Reconciler::decide(makeRecord(FileRecord::Absent, T1), makeRecord(FileRecord::Live, T1)) == ClientCreate);
    ASSERT(Reconciler::decide(makeRecord(FileRecord::Live, T1), makeRecord(FileRecord::Absent, T1)) == ServerCreate);
}

void testCompleteness()
{
    const int STATES[] = { FileRecord::Absent, FileRecord::Tombstone, FileRecord::Live };
    const Timestamp TIMES[][2] = { { T2, T1 }, { T1, T2 }, { T1, T1 } };

    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            for (int k = 0; k < 3; ++k) {
                Action action = Reconciler::decide(makeRecord(STATES[i], TIMES[k][0]),
                                                   makeRecord(STATES[j], TIMES[k][1]));
                ASSERT(action >= NoAction && action < ActionCount);
                ASSERT(::strcmp(Reconciler::getName(action), "UNDEFINED") != 0);
            }
        }
    }
}

// What the client decides and what the server decides from its own frame must be the same action.
void testSymmetry()
{
    const int STATES[] = { FileRecord::Absent, FileRecord::Tombstone, FileRecord::Live };
    const Timestamp TIMES[][2] = { { T2, T1 }, { T1, T2 }, { T1, T1 } };

    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            for (int k = 0; k < 3; ++k) {
                FileRecord client = makeRecord(STATES[i], TIMES[k][0]);
                FileRecord server = makeRecord(STATES[j], TIMES[k][1]);
                Action fromClient = Reconciler::decide(client, server);
                Action fromServer = Reconciler::decide(server, client);
                ASSERT(Reconciler::mirror(fromServer) == fromClient);
            }
        }
    }
}

void testMirror()
{
    for (int action = NoAction; action < ActionCount; ++action) {
        Action mirrored = Reconciler::mirror(static_cast<Action>(action));
        ASSERT(Reconciler::mirror(mirrored) == action);
        ASSERT(Reconciler::isDownload(static_cast<Action>(action)) == Reconciler::isUpload(mirrored));
    }
    ASSERT(Reconciler::mirror(NoAction) == NoAction);
    ASSERT(Reconciler::mirror(ClientDelete) == ServerDelete);
}

int main(int argc, char *argv[])
{
    testDecisionTable();
    testTies();
    testCompleteness();
    testSymmetry();
    testMirror();
    return ASSERT_COUNT;
}
