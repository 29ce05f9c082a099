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

#ifndef INCLUDED_REPLICA_TIMEUTIL_H
#define INCLUDED_REPLICA_TIMEUTIL_H

#include <string>

#include <stdint.h>

namespace replica
{

// Timestamps are microseconds since the Unix epoch in UTC.  Zero means 'never'.
typedef int64_t Timestamp;

struct TimeUtil
{
    // Return current time in microseconds.
    static int64_t getTimeOfDay();

    // Sleep for the specified time.
    static void sleep(int milliseconds);

    // Format as ISO-8601 with microseconds, e.g. '2020-03-14T09:26:53.589793'.
    static std::string format(Timestamp time);

    // Parse an ISO-8601 timestamp as produced by 'format'.  The fraction is optional and may have 1 to 6 digits;
    // a trailing 'Z' or '+00:00' is accepted.  Return false if 'text' is malformed.
    static bool parse(const std::string &text, Timestamp *time);
};

} // namespace replica
#endif //INCLUDED_REPLICA_TIMEUTIL_H
