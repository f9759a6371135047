/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OATH_OTP_GENERATOR_HPP
#define OATH_OTP_GENERATOR_HPP

#include "../crypto/Hmac.hpp"
#include <memory>

namespace oath {

/**
 * Largest supported code length.
 * At 10 digits the modulus already exceeds the 31-bit truncated value,
 * so longer codes would only add zero padding.
 */
constexpr unsigned generatorMaxDigits = 10;

/**
 * Options for the counter-based generator.
 */
struct GeneratorConfig
{
    unsigned digits = 6;
    KeyedHash hash = hmacFunction(HashAlgorithm::sha1);
};

/**
 * Applies the rfc4226 "dynamic truncation" to a digest,
 * producing a 31-bit value.
 * Fails if the digest is too short for the offset in its last byte.
 */
Status
truncate(uint32_t &result, DataSlice digest);

/**
 * Implements the HOTP algorithm defined by rfc4226.
 * Instances are immutable, and can be shared between threads.
 */
class Generator
{
public:
    static Status
    create(std::shared_ptr<const Generator> &result,
        const GeneratorConfig &config=GeneratorConfig());

    unsigned digits() const { return digits_; }

    /**
     * Produces the zero-padded code for a counter value.
     */
    Status
    generate(std::string &result, DataSlice key, uint64_t counter) const;

    /**
     * Returns true if `code` is exactly the code for the counter value.
     */
    bool
    validate(DataSlice key, const std::string &code, uint64_t counter) const;

private:
    const unsigned digits_;
    const uint64_t modulus_;
    const KeyedHash hash_;

    Generator(unsigned digits, const KeyedHash &hash);
};

} // namespace oath

#endif
