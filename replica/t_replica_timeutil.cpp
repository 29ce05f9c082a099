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

#include <replica/replica_timeutil.h>

#include <replica/replica_record.h>
#include <replica/replica_uuid.h>

#include <string>

#include <testutil/testutil_assert.h>

using namespace replica;

void testFormat()
{
    ASSERT(TimeUtil::format(0) == "1970-01-01T00:00:00.000000");
    ASSERT(TimeUtil::format(1584177913589793ll) == "2020-03-14T09:25:13.589793");
    ASSERT(TimeUtil::format(-1) == "1969-12-31T23:59:59.999999");
}

void testParse()
{
    Timestamp time = 0;
    ASSERT(TimeUtil::parse("2020-03-14T09:25:13.589793", &time));
    ASSERT(time == 1584177913589793ll);

    ASSERT(TimeUtil::parse("2020-03-14T09:25:13", &time));
    ASSERT(time == 1584177913000000ll);

    ASSERT(TimeUtil::parse("2020-03-14 09:25:13.5Z", &time));
    ASSERT(time == 1584177913500000ll);

    ASSERT(TimeUtil::parse("2020-03-14T09:25:13.589+00:00", &time));
    ASSERT(time == 1584177913589000ll);

    const char *MALFORMED[] = {
        "",
        "yesterday",
        "2020-03-14",
        "2020-13-14T09:25:13",
        "2020-03-14T24:25:13",
        "2020-03-14T09:25:13.",
        "2020-03-14T09:25:13.1234567",
        "2020-03-14T09:25:13+02:00",
        "2020/03/14T09:25:13",
    };
    for (unsigned int i = 0; i < sizeof(MALFORMED) / sizeof(MALFORMED[0]); ++i) {
        ASSERT(!TimeUtil::parse(MALFORMED[i], &time));
    }

    Timestamp now = TimeUtil::getTimeOfDay();
    ASSERT(TimeUtil::parse(TimeUtil::format(now), &time));
    ASSERT(time == now);
}

void testUuid()
{
    Uuid nil;
    ASSERT(nil.isNil());
    ASSERT(nil.toString() == "00000000-0000-0000-0000-000000000000");

    Uuid id = Uuid::generate();
    ASSERT(!id.isNil());
    ASSERT(id != Uuid::generate());

    std::string text = id.toString();
    ASSERT(text.size() == 36);
    ASSERT(text[14] == '4');

    Uuid parsed;
    ASSERT(Uuid::parse(text, &parsed));
    ASSERT(parsed == id);
    ASSERT(!(parsed < id) && !(id < parsed));

    ASSERT(Uuid::parse("0123ABCD-4567-89ab-cdef-0123456789AB", &parsed));
    ASSERT(parsed.toString() == "0123abcd-4567-89ab-cdef-0123456789ab");

    ASSERT(!Uuid::parse("0123abcd-4567-89ab-cdef-0123456789a", &parsed));
    ASSERT(!Uuid::parse("0123abcd+4567-89ab-cdef-0123456789ab", &parsed));
    ASSERT(!Uuid::parse("0123abcd-4567-89ab-cdef-0123456789ag", &parsed));
}

void testRecordState()
{
    FileRecord absent;
    ASSERT(absent.getState() == FileRecord::Absent);

    FileRecord live(Uuid::generate(), "/a.txt", 1000000, false);
    ASSERT(live.getState() == FileRecord::Live);

    FileRecord tombstone(live.getID(), "/a.txt", 2000000, true);
    ASSERT(tombstone.getState() == FileRecord::Tombstone);
    ASSERT(tombstone.isNewerThan(live));
    ASSERT(!live.isNewerThan(tombstone));
    ASSERT(!live.isNewerThan(live));

    // A deleted flag without an id is still unknown.
    FileRecord unknown(Uuid(), "/a.txt", 1000000, true);
    ASSERT(unknown.getState() == FileRecord::Absent);

    FileRecord b(Uuid::generate(), "/b.txt", 0, false);
    ASSERT(FileRecord::compareByPath(live, b));
    ASSERT(!FileRecord::compareByPath(b, live));
}

int main(int argc, char *argv[])
{
    testFormat();
    testParse();
    testUuid();
    testRecordState();
    return ASSERT_COUNT;
}
