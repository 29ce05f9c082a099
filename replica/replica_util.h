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

#ifndef INCLUDED_REPLICA_UTIL_H
#define INCLUDED_REPLICA_UTIL_H

#include <string>
#include <vector>

#include <stdint.h>

namespace replica
{

struct Util
{
    // Protocol versions understood by this implementation.  Version 1 checks transfers with the legacy one-byte
    // additive sum; version 2 uses SHA-256.
    enum {
        MinimumVersion = 1,
        MaximumVersion = 2
    };

    // For calculating the transfer digest based on the protocol version.
    struct DigestContext
    {
        int d_version;
        uint32_t d_sum;             // running byte sum for version 1
        void *d_evp;                // EVP_MD_CTX for version 2
    };
    static void digestInit(int version, DigestContext *context);
    static void digestUpdate(DigestContext *context, const char *data, int size);
    static std::string digestFinal(DigestContext *context);

    // Convenience method for a payload held in memory.
    static std::string digest(int version, const std::string &payload);

    // Fill 'buffer' with 'size' random bytes.
    static bool getRandomBytes(unsigned char *buffer, int size);

    // For proper intialization and shutdown of dependency libraries.
    static void startup();
    static void cleanup();

    // Return the last error in a readable format.
    static std::string getLastError();

    // Break up a string separated by the delimiters.
    static void tokenize(const std::string line, std::vector<std::string> *results, const char *delimiters);

    // Convert to a hexical string for easy display.
    static std::string toHex(const char *buffer, int size);
};

}

#endif //INCLUDED_REPLICA_UTIL_H
