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

#include <replica/replica_stream.h>

#include <replica/replica_log.h>
#include <replica/replica_timeutil.h>

#include <string>

#include <cstring>

#include <testutil/testutil_assert.h>

using namespace replica;

// Reads come from 'd_input' and writes go to 'd_output', at most 'd_chunk' bytes at a time.
class StringIO : public IO
{
public:
    explicit StringIO(int chunk = 65536)
        : IO()
        , d_input()
        , d_output()
        , d_position(0)
        , d_chunk(chunk)
        , d_isClosed(false)
    {
    }

    virtual ~StringIO()
    {
    }

    virtual int read(char *buffer, int size)
    {
        int available = static_cast<int>(d_input.size()) - d_position;
        if (available == 0) {
            return d_isClosed ? -1 : 0;
        }
        int bytes = size;
        if (bytes > available) {
            bytes = available;
        }
        if (bytes > d_chunk) {
            bytes = d_chunk;
        }
        ::memcpy(buffer, d_input.data() + d_position, bytes);
        d_position += bytes;
        return bytes;
    }

    virtual int write(const char *buffer, int size)
    {
        if (d_isClosed) {
            return -1;
        }
        int bytes = size < d_chunk ? size : d_chunk;
        d_output += std::string(buffer, bytes);
        return bytes;
    }

    virtual bool isReadable(int timeoutInMilliSeconds)
    {
        if (d_isClosed || d_position < static_cast<int>(d_input.size())) {
            return true;
        }
        TimeUtil::sleep(timeoutInMilliSeconds);
        return false;
    }

    virtual bool isWritable(int)
    {
        return true;
    }

    virtual bool isClosed()
    {
        return d_isClosed;
    }

    // Make everything written so far available for reading.
    void loopBack()
    {
        d_input += d_output;
        d_output.clear();
    }

    void createChannel(const char*) {}

    void closeChannel()
    {
        d_isClosed = true;
    }

    void flush() {}

    std::string d_input;
    std::string d_output;

private:
    // NOT IMPLEMENTED
    StringIO(const StringIO&);
    StringIO& operator=(const StringIO&);

    int d_position;
    int d_chunk;
    bool d_isClosed;
};

void testWireFormat()
{
    StringIO stringIO;
    Stream stream(&stringIO);
    stream.writeFrame("abc");
    stream.writeFrame("");
    ASSERT(stringIO.d_output == std::string("\x00\x00\x00\x03" "abc" "\x00\x00\x00\x00", 11));
}

void testReadWriteFrames()
{
    const int SIZES[] = { 0, 1, 3, 1000, 65535, 65536, 100000, Stream::MaximumFrameSize };

    // Small chunks split frames and length prefixes across reads and writes.
    StringIO stringIO(7001);
    Stream stream(&stringIO);

    for (unsigned int i = 0; i < sizeof(SIZES) / sizeof(SIZES[0]); ++i) {
        stream.writeFrame(std::string(SIZES[i], static_cast<char>('a' + i)));
    }

    stringIO.loopBack();

    for (unsigned int i = 0; i < sizeof(SIZES) / sizeof(SIZES[0]); ++i) {
        std::string payload;
        stream.readFrame(&payload);
        ASSERT(payload == std::string(SIZES[i], static_cast<char>('a' + i)));
    }
}

void testOversizedFrame()
{
    StringIO stringIO;
    Stream stream(&stringIO);

    ASSERT_THROWS(stream.writeFrame(std::string(Stream::MaximumFrameSize + 1, 'x')), FramingError);
    ASSERT(stringIO.d_output.empty());

    stringIO.d_input = std::string("\x00\x10\x00\x01", 4);
    std::string payload;
    ASSERT_THROWS(stream.readFrame(&payload), FramingError);
}

// A frame that is cut off by a timeout is completed by the next read.
void testTimeout()
{
    StringIO stringIO;
    Stream stream(&stringIO);
    stream.setTimeout(300);
    ASSERT(stream.getTimeout() == 300);

    stringIO.d_input = std::string("\x00\x00\x00\x05" "ab", 6);

    std::string payload;
    int64_t start = TimeUtil::getTimeOfDay();
    ASSERT_THROWS(stream.readFrame(&payload), TimeoutError);
    ASSERT(TimeUtil::getTimeOfDay() - start >= 300000);

    stringIO.d_input += "cde";
    stream.readFrame(&payload);
    ASSERT(payload == "abcde");
}

void testClosedChannel()
{
    StringIO stringIO;
    Stream stream(&stringIO);
    stringIO.d_input = std::string("\x00\x00\x00\x02" "ok" "\x00\x00\x00\x09" "trun", 14);
    stringIO.closeChannel();

    std::string payload;
    stream.readFrame(&payload);
    ASSERT(payload == "ok");

    int kind = -1;
    try {
        stream.readFrame(&payload);
    } catch (ChannelError &e) {
        kind = e.getKind();
    }
    ASSERT(kind == Exception::Channel);

    ASSERT_THROWS(stream.writeFrame("late"), ChannelError);
}

void testCancel()
{
    int cancelFlag = 0;
    StringIO stringIO;
    Stream stream(&stringIO, &cancelFlag);
    stream.setTimeout(0);

    stream.writeFrame("before");
    cancelFlag = 1;
    ASSERT_THROWS(stream.writeFrame("after"), ChannelError);

    std::string payload;
    ASSERT_THROWS(stream.readFrame(&payload), ChannelError);
    ASSERT_THROWS(stream.checkCancelFlag(), ChannelError);
}

void testDiscardPending()
{
    StringIO stringIO;
    Stream stream(&stringIO);

    stream.writeFrame("late reply");
    stream.writeFrame("another late reply");
    stringIO.loopBack();
    stringIO.d_input += std::string("\x00\x00\x00\x04" "par", 7);

    ASSERT(stream.discardPending(200) == 2);

    // The partial frame is kept.
    stringIO.d_input += "t";
    std::string payload;
    stream.readFrame(&payload);
    ASSERT(payload == "part");

    StringIO quiet;
    Stream other(&quiet);
    ASSERT(other.discardPending(100) == 0);
}

int main(int argc, char *argv[])
{
    Log::setLevel(Log::Fatal);

    testWireFormat();
    testReadWriteFrames();
    testOversizedFrame();
    testTimeout();
    testClosedChannel();
    testCancel();
    testDiscardPending();
    return ASSERT_COUNT;
}
