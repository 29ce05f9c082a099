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

#include <replica/replica_util.h>

#include <replica/replica_log.h>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>

#include <string.h>
#include <errno.h>

namespace replica
{

void Util::digestInit(int version, DigestContext *context)
{
    context->d_version = version;
    context->d_sum = 0;
    context->d_evp = 0;
    if (version >= 2) {
        EVP_MD_CTX *evp = EVP_MD_CTX_new();
        if (!evp || EVP_DigestInit_ex(evp, EVP_sha256(), NULL) != 1) {
            EVP_MD_CTX_free(evp);
            LOG_FATAL(REPLICA_DIGEST) << "Failed to initialize the SHA-256 context" << LOG_END
        }
        context->d_evp = evp;
    }
}

void Util::digestUpdate(DigestContext *context, const char *data, int size)
{
    if (context->d_version >= 2) {
        EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(context->d_evp), data, size);
    } else {
        const unsigned char *p = reinterpret_cast<const unsigned char *>(data);
        for (int i = 0; i < size; ++i) {
            context->d_sum += p[i];
        }
    }
}

std::string Util::digestFinal(DigestContext *context)
{
    if (context->d_version >= 2) {
        EVP_MD_CTX *evp = static_cast<EVP_MD_CTX*>(context->d_evp);
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        EVP_DigestFinal_ex(evp, digest, &length);
        EVP_MD_CTX_free(evp);
        context->d_evp = 0;
        return std::string(reinterpret_cast<char *>(digest), length);
    }
    return std::string(1, static_cast<char>(context->d_sum & 0xff));
}

std::string Util::digest(int version, const std::string &payload)
{
    DigestContext context;
    digestInit(version, &context);
    // Fed a megabyte at a time so that no slice overflows an int.
    const size_t sliceSize = 1 << 20;
    for (size_t offset = 0; offset < payload.size(); offset += sliceSize) {
        size_t size = std::min(sliceSize, payload.size() - offset);
        digestUpdate(&context, payload.data() + offset, static_cast<int>(size));
    }
    return digestFinal(&context);
}

bool Util::getRandomBytes(unsigned char *buffer, int size)
{
    return RAND_bytes(buffer, size) == 1;
}

void Util::startup()
{
    OpenSSL_add_all_digests();
}

void Util::cleanup()
{
    EVP_cleanup();
}

std::string Util::getLastError()
{
    return strerror(errno);
}

void Util::tokenize(const std::string line, std::vector<std::string> *results, const char *delimiters)
{
    size_t begin = 0;
    while(begin != std::string::npos) {
        size_t end = line.find_first_of(delimiters, begin);
        if (end == std::string::npos) {
            std::string token = line.substr(begin, end);
            if (token.size()) {
                results->push_back(token);
            }
            return;
        }
        if (end != begin) {
            results->push_back(line.substr(begin, end - begin));
        }
        begin = line.find_first_not_of(delimiters, end);
    }
}

std::string Util::toHex(const char *buffer, int size)
{
    const char *hex = "0123456789abcdef";
    std::string str;
    for (int i = 0; i < size; ++i) {
        unsigned char c = buffer[i];
        str += hex[c / 16];
        str += hex[c % 16];
    }
    return str;
}

} // close namespace replica
