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

#include <cstdio>
#include <cstring>

#include <time.h>
#include <sys/time.h>

namespace replica {

namespace {

// Read exactly 'count' digits starting at 'p'.
bool readDigits(const char *p, int count, int *value)
{
    *value = 0;
    for (int i = 0; i < count; ++i) {
        if (p[i] < '0' || p[i] > '9') {
            return false;
        }
        *value = *value * 10 + (p[i] - '0');
    }
    return true;
}

} // unnamed namespace

int64_t TimeUtil::getTimeOfDay()
{
    struct timeval t;
    gettimeofday(&t, 0);
    int64_t value = static_cast<int64_t>(t.tv_sec);
    value = value * 1000000 + t.tv_usec;
    return value;
}

void TimeUtil::sleep(int milliseconds)
{
    struct timespec delay;
    delay.tv_sec = milliseconds / 1000;
    delay.tv_nsec = 1000000 * (milliseconds % 1000);
    nanosleep(&delay, 0);
}

std::string TimeUtil::format(Timestamp time)
{
    int64_t seconds = time / 1000000;
    int64_t micros = time % 1000000;
    if (micros < 0) {
        micros += 1000000;
        --seconds;
    }

    time_t t = static_cast<time_t>(seconds);
    struct tm info;
    gmtime_r(&t, &info);

    char buffer[64];
    ::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%06d",
               info.tm_year + 1900, info.tm_mon + 1, info.tm_mday,
               info.tm_hour, info.tm_min, info.tm_sec, static_cast<int>(micros));
    return buffer;
}

bool TimeUtil::parse(const std::string &text, Timestamp *time)
{
    // YYYY-MM-DDTHH:MM:SS is 19 characters
    if (text.size() < 19) {
        return false;
    }

    const char *p = text.c_str();
    int year, month, day, hour, minute, second;
    if (!readDigits(p, 4, &year) || p[4] != '-' ||
        !readDigits(p + 5, 2, &month) || p[7] != '-' ||
        !readDigits(p + 8, 2, &day) || (p[10] != 'T' && p[10] != ' ') ||
        !readDigits(p + 11, 2, &hour) || p[13] != ':' ||
        !readDigits(p + 14, 2, &minute) || p[16] != ':' ||
        !readDigits(p + 17, 2, &second)) {
        return false;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    p += 19;
    int micros = 0;
    if (*p == '.') {
        ++p;
        int digits = 0;
        while (*p >= '0' && *p <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (*p - '0');
            }
            ++digits;
            ++p;
        }
        if (digits == 0 || digits > 6) {
            return false;
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    if (*p == 'Z') {
        ++p;
    } else if (::strcmp(p, "+00:00") == 0) {
        p += 6;
    }
    if (*p != 0) {
        return false;
    }

    struct tm info;
    ::memset(&info, 0, sizeof(info));
    info.tm_year = year - 1900;
    info.tm_mon = month - 1;
    info.tm_mday = day;
    info.tm_hour = hour;
    info.tm_min = minute;
    info.tm_sec = second;

    *time = static_cast<Timestamp>(timegm(&info)) * 1000000 + micros;
    return true;
}

} // close namespace replica
