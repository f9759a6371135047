/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OATH_CRYPTO_ENCODING_HPP
#define OATH_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace oath {

/**
 * Serializes an integer as 8 bytes in network byte order.
 */
DataArray<8>
bigEndian64(uint64_t value);

/**
 * Encodes data into a base-32 string according to rfc4648.
 */
std::string
base32Encode(DataSlice data);

/**
 * Decodes a base-32 string as defined by rfc4648.
 */
Status
base32Decode(DataChunk &result, const std::string &in);

} // namespace oath

#endif
