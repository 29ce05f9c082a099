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

#ifndef INCLUDED_REPLICA_STREAM_H
#define INCLUDED_REPLICA_STREAM_H

#include <replica/replica_io.h>

#include <string>

#include <stdint.h>

namespace replica
{

// Blocking model:
//
// - a frame is a 4-byte big-endian length followed by that many payload bytes
// - readFrame blocks until a whole frame has arrived, the timeout expires (TimeoutError), the channel closes or
//   the cancel flag is set (ChannelError)
// - bytes received beyond the current frame stay in the read buffer; so does a partial frame when a read times
//   out, so that the next read resumes at a frame boundary
// - writeFrame blocks until the whole frame has been handed to the io
class Stream
{
public:

    enum {
        MaximumFrameSize = 1024 * 1024,     // largest payload accepted or sent
        DefaultTimeout = 30000              // in milliseconds
    };

    // Create a stream on top of 'io'.  If 'cancelFlag' is provided, whenever '*cancelFlag' becomes non-zero, any
    // blocking operation will be terminated immediately.
    Stream(IO *io, int *cancelFlag = 0);
    ~Stream();

    // How long to wait for the other side before raising a TimeoutError.  Zero or less means forever.
    void setTimeout(int milliseconds);
    int getTimeout() const
    {
        return d_timeout;
    }

    // Read the next frame into 'payload'.
    void readFrame(std::string *payload);

    // Send 'payload' as one frame.
    void writeFrame(const std::string &payload);

    // Drop any frames that arrive within 'graceInMilliSeconds'.  Used to resynchronize after a reply has timed
    // out, as the late reply may still be on its way.  Return the number of frames dropped.
    int discardPending(int graceInMilliSeconds);

    // Check if '*d_cancelFlag' has been set.
    void checkCancelFlag() const;

private:
    // NOT IMPLEMENTED
    Stream(const Stream&);
    Stream& operator=(const Stream&);

    // Move one complete frame from the read buffer to 'payload'.  Return false if there isn't one yet.
    bool extractFrame(std::string *payload);

    // Append whatever the io has to the read buffer.  Return the number of bytes added.
    int fillReadBuffer();

    // Write 'size' bytes from 'buffer'.  Will throw an exception on timeout.
    int writeAll(const char *buffer, int size);

    // Wait for the io to become ready; raise if the operation has been blocked longer than the timeout.
    void timedWait(bool isReading, const char *location);

    IO *d_io;                           // The io channel

    int *d_cancelFlag;                  // The pointer to the cancellation flag

    int d_timeout;                      // in milliseconds

    std::string d_readBuffer;           // Received bytes not yet returned as frames

    int64_t d_blockedTime;              // The first moment (in microseconds) when read/write becomes blocked
};

} // namespace replica

#endif // INCLUDED_REPLICA_STREAM_H
