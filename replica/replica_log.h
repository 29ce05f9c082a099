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

#ifndef INCLUDED_REPLICA_LOG_H
#define INCLUDED_REPLICA_LOG_H

#include <functional>
#include <string>
#include <sstream>

namespace replica {

// The exception to throw if an error has occurred and the operation can't continue.  The kind tells the session
// how far the failure reaches: a file, a transfer, or the whole session.
class Exception
{
public:
    enum Kind {
        General,
        Framing,            // malformed or truncated packet
        Protocol,           // unexpected packet for the current phase
        Integrity,          // chunk size/order/digest mismatch
        Authorization,      // proposal rejected by the policy
        Channel,            // transport failure or cancellation
        Timeout             // no reply within the configured time
    };

    Exception(const char *id, int level, const char *message, int kind = General)
        : d_id(id)
        , d_level(level)
        , d_kind(kind)
        , d_message(message)
    {
    }

    Exception(const Exception &other)
        : d_id(other.d_id)
        , d_level(other.d_level)
        , d_kind(other.d_kind)
        , d_message(other.d_message)
    {
    }

    virtual ~Exception()
    {
    }

    const char *getID() const
    {
        return d_id;
    }

    int getLevel() const
    {
        return d_level;
    }

    int getKind() const
    {
        return d_kind;
    }

    const std::string& getMessage() const
    {
        return d_message;
    }

private:
    // NOT IMPLEMENTED
    const Exception& operator=(const Exception&);

    const char *d_id;          // id of the log message
    int d_level;               // severity level
    int d_kind;                // one of 'Kind'
    std::string d_message;     // the actual log message
};

class FramingError : public Exception
{
public:
    FramingError(const char *id, int level, const char *message)
        : Exception(id, level, message, Framing)
    {
    }
};

class ProtocolViolation : public Exception
{
public:
    ProtocolViolation(const char *id, int level, const char *message)
        : Exception(id, level, message, Protocol)
    {
    }
};

class IntegrityError : public Exception
{
public:
    IntegrityError(const char *id, int level, const char *message)
        : Exception(id, level, message, Integrity)
    {
    }
};

class AuthorizationDenied : public Exception
{
public:
    AuthorizationDenied(const char *id, int level, const char *message)
        : Exception(id, level, message, Authorization)
    {
    }
};

class ChannelError : public Exception
{
public:
    ChannelError(const char *id, int level, const char *message, int kind = Channel)
        : Exception(id, level, message, kind)
    {
    }
};

// A timeout is a channel failure that the pull/push loops may survive.
class TimeoutError : public ChannelError
{
public:
    TimeoutError(const char *id, int level, const char *message)
        : ChannelError(id, level, message, Timeout)
    {
    }
};

struct Log
{
public:
    enum Level {
        Debug,
        Trace,
        Info,
        Warning,
        Error,
        Fatal,
        Assert
    };

    // Accessors for 's_level'
    static void setLevel(int);
    static int getLevel();

    // Basically the string name of the level
    static const char *getLiteral(int level);

    // Any log message with this level or above will be reported.  Others will be ignored.
    static int s_level;

    // A callback for replacing the default logging handler.
    static std::function<void (const char *id, int level, const char *message)> out;

    // Send the default output to stderr instead of stdout (stdout may be carrying the channel).
    static void useStandardError(bool enabled);
    static bool s_useStandardError;
};

// A helper object that will generate a log message on destruction.  If 'kind' is not negative the destructor
// throws the exception of that kind after the message has been reported.
class LogRecord
{
public:

    LogRecord(const char *id, int level, int kind = -1);

    ~LogRecord() noexcept(false);

    LogRecord& operator<<(const char * message)
    {
        d_message += message;
        return *this;
    }

    LogRecord& operator<<(const std::string& message)
    {
        d_message += message;
        return *this;
    }

    template <class T> LogRecord& operator<<(T n)
    {
        std::stringstream stream;
        stream << n;
        d_message += stream.str();
        return *this;
    }

private:
    // NOT IMPLEMENTED
    LogRecord(const LogRecord&);
    LogRecord& operator=(const LogRecord&);

    const char *d_id;
    int d_level;
    int d_kind;
    std::string d_message;
};

#define REPLICA_LOG(ID, LEVEL) \
    if (LEVEL >= replica::Log::getLevel()) { \
        replica::LogRecord(ID, LEVEL)

// Raising is never filtered by the log level; the record is reported and then thrown.
#define REPLICA_RAISE(KIND, ID) \
    if (true) { \
        replica::LogRecord(#ID, replica::Log::Error, replica::Exception::KIND)

// Use these macros for creating log messages.
#define LOG_DEBUG(ID) REPLICA_LOG(#ID, replica::Log::Debug)
#define LOG_TRACE(ID) REPLICA_LOG(#ID, replica::Log::Trace)
#define LOG_INFO(ID) REPLICA_LOG(#ID, replica::Log::Info)
#define LOG_WARNING(ID) REPLICA_LOG(#ID, replica::Log::Warning)
#define LOG_ERROR(ID) REPLICA_LOG(#ID, replica::Log::Error)
#define LOG_FATAL(ID) REPLICA_LOG(#ID, replica::Log::Fatal)
#define LOG_ASSERT(ID) REPLICA_LOG(#ID, replica::Log::Assert)

#define RAISE_FRAMING(ID) REPLICA_RAISE(Framing, ID)
#define RAISE_PROTOCOL(ID) REPLICA_RAISE(Protocol, ID)
#define RAISE_INTEGRITY(ID) REPLICA_RAISE(Integrity, ID)
#define RAISE_CHANNEL(ID) REPLICA_RAISE(Channel, ID)
#define RAISE_TIMEOUT(ID) REPLICA_RAISE(Timeout, ID)

#define LOG_END ""; }


}

#endif // INCLUDED_REPLICA_LOG_H
