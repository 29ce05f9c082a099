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

#include <replica/replica_uuid.h>

#include <replica/replica_log.h>
#include <replica/replica_util.h>

#include <cstring>

namespace replica
{

namespace
{

int getHexValue(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // unnamed namespace

Uuid::Uuid()
{
    ::memset(d_bytes, 0, sizeof(d_bytes));
}

Uuid::Uuid(const char *bytes)
{
    ::memcpy(d_bytes, bytes, sizeof(d_bytes));
}

Uuid Uuid::generate()
{
    Uuid id;
    if (!Util::getRandomBytes(id.d_bytes, Size)) {
        LOG_FATAL(UUID_RANDOM) << "Failed to obtain random bytes for a new id" << LOG_END
    }
    id.d_bytes[6] = (id.d_bytes[6] & 0x0f) | 0x40;
    id.d_bytes[8] = (id.d_bytes[8] & 0x3f) | 0x80;
    return id;
}

bool Uuid::parse(const std::string &text, Uuid *id)
{
    if (text.size() != 36) {
        return false;
    }

    int n = 0;
    for (size_t i = 0; i < text.size(); ) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return false;
            }
            ++i;
            continue;
        }
        int high = getHexValue(text[i]);
        int low = getHexValue(text[i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        id->d_bytes[n++] = static_cast<unsigned char>(high * 16 + low);
        i += 2;
    }
    return n == Size;
}

bool Uuid::isNil() const
{
    for (int i = 0; i < Size; ++i) {
        if (d_bytes[i]) {
            return false;
        }
    }
    return true;
}

std::string Uuid::toString() const
{
    std::string hex = Util::toHex(reinterpret_cast<const char *>(d_bytes), Size);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

bool Uuid::operator==(const Uuid &other) const
{
    return ::memcmp(d_bytes, other.d_bytes, Size) == 0;
}

bool Uuid::operator<(const Uuid &other) const
{
    return ::memcmp(d_bytes, other.d_bytes, Size) < 0;
}

} // namespace replica
