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

#ifndef INCLUDED_REPLICA_UUID_H
#define INCLUDED_REPLICA_UUID_H

#include <string>

#include <stdint.h>

namespace replica
{

// A 128-bit identifier for files and owners.  The all-zero value is the nil id.
class Uuid
{
public:
    enum { Size = 16 };

    // Create the nil id.
    Uuid();

    // Create an id from 16 raw bytes.
    explicit Uuid(const char *bytes);

    // Generate a random (version 4) id.
    static Uuid generate();

    // Parse the canonical 8-4-4-4-12 hex form.  Return false if 'text' is malformed.
    static bool parse(const std::string &text, Uuid *id);

    bool isNil() const;

    const unsigned char *getBytes() const
    {
        return d_bytes;
    }

    // Return the canonical lowercase 8-4-4-4-12 form.
    std::string toString() const;

    bool operator==(const Uuid &other) const;
    bool operator!=(const Uuid &other) const
    {
        return !(*this == other);
    }
    bool operator<(const Uuid &other) const;

private:
    unsigned char d_bytes[Size];
};

} // namespace replica

#endif // INCLUDED_REPLICA_UUID_H
