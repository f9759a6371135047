/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Keyed-hash primitives for one-time password generation.
 */

#ifndef OATH_CRYPTO_HMAC_HPP
#define OATH_CRYPTO_HMAC_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"
#include <functional>

namespace oath {

/**
 * The hash functions rfc4226 and rfc6238 define test vectors for.
 */
enum class HashAlgorithm
{
    sha1,
    sha256,
    sha512
};

/**
 * Computes a digest over `message` using the secret `key`.
 * Any function with this shape can drive the code generator.
 */
typedef std::function<Status (DataChunk &result,
    DataSlice key, DataSlice message)> KeyedHash;

/**
 * Computes an HMAC using OpenSSL.
 */
Status
hmac(DataChunk &result, HashAlgorithm algorithm,
    DataSlice key, DataSlice message);

/**
 * Binds `hmac` to a particular hash algorithm.
 */
KeyedHash
hmacFunction(HashAlgorithm algorithm);

/**
 * Returns the canonical name ("SHA1", "SHA256", "SHA512").
 */
const char *
hashAlgorithmName(HashAlgorithm algorithm);

/**
 * Looks up an algorithm by name, ignoring case.
 */
Status
hashAlgorithmParse(HashAlgorithm &result, const std::string &name);

} // namespace oath

#endif
