/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <algorithm>

namespace oath {

DataArray<8>
bigEndian64(uint64_t value)
{
    DataArray<8> out =
    {{
        static_cast<uint8_t>(value >> 56),
        static_cast<uint8_t>(value >> 48),
        static_cast<uint8_t>(value >> 40),
        static_cast<uint8_t>(value >> 32),
        static_cast<uint8_t>(value >> 24),
        static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value)
    }};
    return out;
}

std::string
base32Encode(DataSlice data)
{
    const char base32Sym[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    auto chunks = (data.size() + 4) / 5; // Rounding up
    out.reserve(8 * chunks);

    auto i = data.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != data.end() || 0 < bits)
    {
        // Reload the buffer if we need more bits:
        if (i != data.end() && bits < 5)
        {
            buffer |= *i++ << (8 - bits);
            bits += 8;
        }

        // Write out 5 most-significant bits in the buffer:
        out += base32Sym[buffer >> 11];
        buffer <<= 5;
        bits -= 5;
    }

    // Pad the final string to a multiple of 8 characters long:
    out.append(-out.size() % 8, '=');
    return out;
}

Status
base32Decode(DataChunk &result, const std::string &in)
{
    if (in.size() % 8)
        return OATH_ERROR(OATH_CC_ParseError,
            "Base32 length must be a multiple of 8");

    DataChunk out;
    out.reserve(5 * (in.size() / 8));

    auto i = in.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != in.end())
    {
        // Read one character from the string:
        int value = 0;
        if ('A' <= *i && *i <= 'Z')
            value = *i++ - 'A';
        else if ('2' <= *i && *i <= '7')
            value = 26 + *i++ - '2';
        else
            break;

        // Append the bits to the buffer:
        buffer |= value << (11 - bits);
        bits += 5;

        // Write out some bits if the buffer has a byte's worth:
        if (8 <= bits)
        {
            out.push_back(buffer >> 8);
            buffer <<= 8;
            bits -= 8;
        }
    }

    if (!std::all_of(i, in.end(), [](char c){ return '=' == c; }))
        return OATH_ERROR(OATH_CC_ParseError, "Bad base32 character");

    // Valid padding lengths leave 0, 2, 4 or 7 characters short of a group:
    auto padding = in.end() - i;
    if (padding != 0 && padding != 1 && padding != 3 &&
        padding != 4 && padding != 6)
        return OATH_ERROR(OATH_CC_ParseError, "Bad base32 padding");

    result = std::move(out);
    return Status();
}

} // namespace oath
