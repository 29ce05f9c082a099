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

namespace replica
{

namespace
{

// How long a single wait on the io lasts before the cancel flag and the timeout are checked again
const int g_PollInterval = 100;  // milliseconds

uint32_t decodeLength(const std::string &buffer)
{
    const unsigned char *p = reinterpret_cast<const unsigned char *>(buffer.data());
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

} // unnamed namespace

Stream::Stream(IO* io, int *cancelFlag)
    : d_io(io)
    , d_cancelFlag(cancelFlag)
    , d_timeout(DefaultTimeout)
    , d_readBuffer()
    , d_blockedTime(0)
{
}

Stream::~Stream()
{
}

void Stream::setTimeout(int milliseconds)
{
    d_timeout = milliseconds;
}

void Stream::readFrame(std::string *payload)
{
    d_blockedTime = 0;

    while (!extractFrame(payload)) {
        if (fillReadBuffer() == 0) {
            timedWait(true, "readFrame");
        } else {
            d_blockedTime = 0;
        }
    }
}

void Stream::writeFrame(const std::string &payload)
{
    if (payload.size() > MaximumFrameSize) {
        RAISE_FRAMING(STREAM_FRAME) << "Refusing to send a frame of " << payload.size() << " bytes" << LOG_END
    }

    uint32_t size = static_cast<uint32_t>(payload.size());
    std::string frame;
    frame.reserve(4 + payload.size());
    frame += static_cast<char>((size >> 24) & 0xff);
    frame += static_cast<char>((size >> 16) & 0xff);
    frame += static_cast<char>((size >> 8) & 0xff);
    frame += static_cast<char>(size & 0xff);
    frame += payload;

    writeAll(frame.data(), static_cast<int>(frame.size()));
    d_io->flush();
}

int Stream::discardPending(int graceInMilliSeconds)
{
    int frames = 0;
    std::string payload;

    int64_t deadline = TimeUtil::getTimeOfDay() + static_cast<int64_t>(graceInMilliSeconds) * 1000;
    for (;;) {
        checkCancelFlag();
        while (extractFrame(&payload)) {
            ++frames;
        }

        int64_t remaining = (deadline - TimeUtil::getTimeOfDay()) / 1000;
        if (remaining <= 0) {
            break;
        }
        if (d_io->isReadable(remaining < g_PollInterval ? static_cast<int>(remaining) : g_PollInterval)) {
            fillReadBuffer();
        }
    }

    if (frames > 0) {
        LOG_DEBUG(STREAM_DISCARD) << "Discarded " << frames << " late frame(s)" << LOG_END
    }
    return frames;
}

bool Stream::extractFrame(std::string *payload)
{
    if (d_readBuffer.size() < 4) {
        return false;
    }

    uint32_t size = decodeLength(d_readBuffer);
    if (size > MaximumFrameSize) {
        RAISE_FRAMING(STREAM_FRAME) << "Frame of " << size << " bytes exceeds the limit of " << MaximumFrameSize
                                    << " bytes" << LOG_END
    }

    if (d_readBuffer.size() < 4 + size) {
        return false;
    }

    payload->assign(d_readBuffer, 4, size);
    d_readBuffer.erase(0, 4 + size);
    return true;
}

int Stream::fillReadBuffer()
{
    checkCancelFlag();

    char buffer[65536];
    int rc = d_io->read(buffer, sizeof(buffer));
    if (rc < 0) {
        RAISE_CHANNEL(STREAM_CLOSED) << "The channel has been closed" << LOG_END
    }
    if (rc > 0) {
        d_readBuffer.append(buffer, rc);
    }
    return rc;
}

int Stream::writeAll(const char *buffer, int size)
{
    int bytes = 0;
    d_blockedTime = 0;

    while (bytes < size) {
        checkCancelFlag();
        int rc = d_io->write(buffer + bytes, size - bytes);
        if (rc < 0) {
            RAISE_CHANNEL(STREAM_CLOSED) << "The channel has been closed" << LOG_END
        }
        bytes += rc;
        if (rc == 0) {
            timedWait(false, "writeAll");
        } else {
            d_blockedTime = 0;
        }
    }

    return size;
}

void Stream::timedWait(bool isReading, const char *location)
{
    checkCancelFlag();

    bool result;
    if (isReading) {
        result = d_io->isReadable(g_PollInterval);
    } else {
        result = d_io->isWritable(g_PollInterval);
    }

    checkCancelFlag();

    if (result) {
        return;
    }

    if (d_io->isClosed()) {
        RAISE_CHANNEL(STREAM_CLOSED) << "The channel has been closed (" << location << ")" << LOG_END
    }

    int64_t now = TimeUtil::getTimeOfDay();
    if (d_blockedTime == 0) {
        d_blockedTime = now;
    } else if (d_timeout > 0 && (now - d_blockedTime) / 1000 >= d_timeout) {
        d_blockedTime = 0;
        RAISE_TIMEOUT(STREAM_TIMEOUT) << "The channel has been blocked for more than " << d_timeout
                                      << " milliseconds (" << location << ")" << LOG_END
    }
}

void Stream::checkCancelFlag() const
{
    if (d_cancelFlag && *d_cancelFlag) {
        RAISE_CHANNEL(STREAM_CANCEL) << "The operation was cancelled by user" << LOG_END
    }
}

} // namespace replica
