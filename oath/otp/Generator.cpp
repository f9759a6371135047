/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Generator.hpp"
#include "../crypto/Encoding.hpp"
#include "../util/Debug.hpp"
#include "../util/Util.hpp"
#include <openssl/crypto.h>
#include <sstream>

namespace oath {

static uint64_t
decimalModulus(unsigned digits)
{
    uint64_t out = 1;
    for (unsigned i = 0; i < digits; ++i)
        out *= 10;
    return out;
}

Status
truncate(uint32_t &result, DataSlice digest)
{
    if (digest.empty())
        return OATH_ERROR(OATH_CC_DigestTooShort, "Empty digest");

    unsigned offset = digest[digest.size() - 1] & 0xf;
    if (digest.size() < offset + 4)
        return OATH_ERROR(OATH_CC_DigestTooShort,
            "Digest of " + std::to_string(digest.size()) +
            " bytes is too short for offset " + std::to_string(offset));

    result =
        static_cast<uint32_t>(digest[offset] & 0x7f) << 24 |
        static_cast<uint32_t>(digest[offset + 1]) << 16 |
        static_cast<uint32_t>(digest[offset + 2]) << 8 |
        static_cast<uint32_t>(digest[offset + 3]);
    return Status();
}

Status
Generator::create(std::shared_ptr<const Generator> &result,
    const GeneratorConfig &config)
{
    if (!config.digits)
        return OATH_ERROR(OATH_CC_InvalidConfig, "Codes need at least one digit");
    if (generatorMaxDigits < config.digits)
        return OATH_ERROR(OATH_CC_InvalidConfig,
            "Codes cannot have more than " +
            std::to_string(generatorMaxDigits) + " digits");
    if (!config.hash)
        return OATH_ERROR(OATH_CC_InvalidConfig, "No keyed-hash function");

    OATH_DebugLog("Generator: %u digits", config.digits);
    result.reset(new Generator(config.digits, config.hash));
    return Status();
}

Generator::Generator(unsigned digits, const KeyedHash &hash):
    digits_(digits),
    modulus_(decimalModulus(digits)),
    hash_(hash)
{}

Status
Generator::generate(std::string &result, DataSlice key, uint64_t counter) const
{
    const auto message = bigEndian64(counter);

    DataChunk digest;
    uint32_t binary = 0;
    Status status = hash_(digest, key, message);
    if (status)
        status = truncate(binary, digest);
    dataWipe(digest);
    OATH_CHECK(status);

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(digits_);
    ss.fill('0');
    ss << binary % modulus_;
    result = ss.str();
    return Status();
}

bool
Generator::validate(DataSlice key, const std::string &code,
    uint64_t counter) const
{
    std::string expected;
    if (!generate(expected, key, counter).log())
        return false;

    if (code.size() != expected.size())
        return false;
    return !CRYPTO_memcmp(code.data(), expected.data(), code.size());
}

} // namespace oath
