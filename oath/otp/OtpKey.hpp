/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OATH_OTP_OTPKEY_HPP
#define OATH_OTP_OTPKEY_HPP

#include "Generator.hpp"
#include "TimeWindow.hpp"

namespace oath {

/**
 * Holds a shared OTP secret.
 * The key bytes are wiped when the object goes away.
 */
class OtpKey
{
public:
    ~OtpKey();
    OtpKey() {}
    OtpKey(DataSlice key): key_(key.begin(), key.end()) {}
    OtpKey(const OtpKey &copy): key_(copy.key_) {}
    OtpKey &operator=(const OtpKey &copy);

    /**
     * Initializes the key with a base32-encoded string.
     * Accepts the lower-case, unpadded and space-separated forms
     * that authenticator apps display.
     */
    Status
    decodeBase32(const std::string &key);

    /**
     * Encodes the key as a base32 string.
     */
    std::string
    encodeBase32() const;

    /**
     * Produces a counter-based password.
     */
    Status
    hotp(std::string &result, const Generator &generator,
        uint64_t counter) const;

    /**
     * Produces a time-based password for the current time.
     */
    Status
    totp(std::string &result, const Generator &generator,
        const TimeWindow &window) const;

    /**
     * Obtains access to the underlying binary key.
     */
    DataSlice
    key() const { return key_; }

private:
    DataChunk key_;
};

} // namespace oath

#endif
