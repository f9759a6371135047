/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKey.hpp"
#include "../crypto/Encoding.hpp"
#include "../util/Util.hpp"
#include <ctype.h>

namespace oath {

OtpKey::~OtpKey()
{
    dataWipe(key_);
}

OtpKey &
OtpKey::operator=(const OtpKey &copy)
{
    if (this != &copy)
    {
        dataWipe(key_);
        key_ = copy.key_;
    }
    return *this;
}

Status
OtpKey::decodeBase32(const std::string &key)
{
    std::string normal;
    normal.reserve(key.size() + 8);
    for (char c: key)
    {
        if (isspace(static_cast<unsigned char>(c)))
            continue;
        normal += static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    if (normal.find('=') == std::string::npos)
        normal.append(-normal.size() % 8, '=');

    DataChunk out;
    Status status = base32Decode(out, normal);
    guaranteedMemset(&normal[0], 0, normal.size());
    OATH_CHECK(status);

    dataWipe(key_);
    key_ = std::move(out);
    return Status();
}

std::string
OtpKey::encodeBase32() const
{
    return base32Encode(key_);
}

Status
OtpKey::hotp(std::string &result, const Generator &generator,
    uint64_t counter) const
{
    OATH_CHECK(generator.generate(result, key_, counter));
    return Status();
}

Status
OtpKey::totp(std::string &result, const Generator &generator,
    const TimeWindow &window) const
{
    uint64_t counter;
    OATH_CHECK(window.now(counter));
    OATH_CHECK(generator.generate(result, key_, counter));
    return Status();
}

} // namespace oath
