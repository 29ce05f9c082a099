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

#include <replica/replica_log.h>

#include <string>
#include <vector>

#include <testutil/testutil_assert.h>

using namespace replica;

namespace {

struct Captured
{
    std::string d_id;
    int d_level;
    std::string d_message;
};

std::vector<Captured> s_captured;

void capture(const char *id, int level, const char *message)
{
    Captured record;
    record.d_id = id;
    record.d_level = level;
    record.d_message = message;
    s_captured.push_back(record);
}

void raiseProtocol(int value)
{
    RAISE_PROTOCOL(TEST_PROTOCOL) << "Unexpected value " << value << LOG_END
}

void raiseIntegrity()
{
    RAISE_INTEGRITY(TEST_INTEGRITY) << "Digest mismatch" << LOG_END
}

void raiseTimeout()
{
    RAISE_TIMEOUT(TEST_TIMEOUT) << "No reply" << LOG_END
}

void logFatal()
{
    LOG_FATAL(TEST_FATAL) << "Out of memory" << LOG_END
}

} // unnamed namespace

void testLevelFilter()
{
    s_captured.clear();
    Log::setLevel(Log::Warning);

    LOG_DEBUG(TEST_DEBUG) << "hidden" << LOG_END
    LOG_INFO(TEST_INFO) << "hidden" << LOG_END
    LOG_WARNING(TEST_WARNING) << "shown " << 3 << LOG_END
    LOG_ERROR(TEST_ERROR) << "shown" << LOG_END

    ASSERT(s_captured.size() == 2);
    ASSERT(s_captured[0].d_id == "TEST_WARNING");
    ASSERT(s_captured[0].d_level == Log::Warning);
    ASSERT(s_captured[0].d_message == "shown 3");
    ASSERT(s_captured[1].d_id == "TEST_ERROR");
}

void testRaisedRecordsIgnoreLevel()
{
    s_captured.clear();
    Log::setLevel(Log::Assert);

    ASSERT_THROWS(raiseProtocol(7), ProtocolViolation);
    ASSERT(s_captured.size() == 1);
    ASSERT(s_captured[0].d_id == "TEST_PROTOCOL");
    ASSERT(s_captured[0].d_level == Log::Error);
    ASSERT(s_captured[0].d_message == "Unexpected value 7");

    ASSERT_THROWS(raiseIntegrity(), IntegrityError);
    ASSERT(s_captured.size() == 2);
    ASSERT(s_captured[1].d_id == "TEST_INTEGRITY");

    // A timeout is caught as a channel failure too.
    ASSERT_THROWS(raiseTimeout(), ChannelError);
    ASSERT(s_captured.size() == 3);

    try {
        raiseIntegrity();
        ASSERT(false);
    } catch (Exception &e) {
        ASSERT(e.getKind() == Exception::Integrity);
        ASSERT(e.getMessage() == "Digest mismatch");
        ASSERT(std::string(e.getID()) == "TEST_INTEGRITY");
    }
}

void testFatalThrows()
{
    s_captured.clear();
    Log::setLevel(Log::Fatal);

    try {
        logFatal();
        ASSERT(false);
    } catch (Exception &e) {
        ASSERT(e.getKind() == Exception::General);
        ASSERT(e.getLevel() == Log::Fatal);
    }
    ASSERT(s_captured.size() == 1);
    ASSERT(s_captured[0].d_level == Log::Fatal);
}

int main(int argc, char *argv[])
{
    Log::out = capture;

    testLevelFilter();
    testRaisedRecordsIgnoreLevel();
    testFatalThrows();

    Log::out = nullptr;
    return ASSERT_COUNT;
}
