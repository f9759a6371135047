/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Hmac.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <strings.h>

namespace oath {

static const EVP_MD *
hashAlgorithmMd(HashAlgorithm algorithm)
{
    switch (algorithm)
    {
    case HashAlgorithm::sha1:
        return EVP_sha1();
    case HashAlgorithm::sha256:
        return EVP_sha256();
    case HashAlgorithm::sha512:
        return EVP_sha512();
    }
    return nullptr;
}

Status
hmac(DataChunk &result, HashAlgorithm algorithm,
    DataSlice key, DataSlice message)
{
    const EVP_MD *md = hashAlgorithmMd(algorithm);
    if (!md)
        return OATH_ERROR(OATH_CC_HashError, "Unknown hash algorithm");

    // OpenSSL rejects a null key pointer, even with zero length:
    static const uint8_t emptyKey[1] = {0};
    const uint8_t *keyData = key.empty() ? emptyKey : key.data();

    DataChunk out(EVP_MAX_MD_SIZE);
    unsigned size = 0;
    if (!HMAC(md, keyData, static_cast<int>(key.size()),
        message.data(), message.size(), out.data(), &size))
        return OATH_ERROR(OATH_CC_HashError, "HMAC failed");

    out.resize(size);
    result = std::move(out);
    return Status();
}

KeyedHash
hmacFunction(HashAlgorithm algorithm)
{
    return [algorithm](DataChunk &result, DataSlice key, DataSlice message)
    {
        return hmac(result, algorithm, key, message);
    };
}

const char *
hashAlgorithmName(HashAlgorithm algorithm)
{
    switch (algorithm)
    {
    case HashAlgorithm::sha1:
        return "SHA1";
    case HashAlgorithm::sha256:
        return "SHA256";
    case HashAlgorithm::sha512:
        return "SHA512";
    }
    return "unknown";
}

Status
hashAlgorithmParse(HashAlgorithm &result, const std::string &name)
{
    const HashAlgorithm all[] =
    {
        HashAlgorithm::sha1, HashAlgorithm::sha256, HashAlgorithm::sha512
    };
    for (auto algorithm: all)
    {
        if (!strcasecmp(name.c_str(), hashAlgorithmName(algorithm)))
        {
            result = algorithm;
            return Status();
        }
    }

    return OATH_ERROR(OATH_CC_InvalidConfig,
        "Unknown hash algorithm " + name);
}

} // namespace oath
