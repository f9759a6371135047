/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Memory-hygiene helpers for secret material.
 */

#ifndef OATH_UTIL_UTIL_HPP
#define OATH_UTIL_UTIL_HPP

#include "Data.hpp"
#include <stddef.h>

namespace oath {

/**
 * A memset that the compiler cannot optimize away.
 */
void *
guaranteedMemset(void *v, int c, size_t n);

/**
 * Overwrites a buffer with zeros and empties it.
 */
void
dataWipe(DataChunk &data);

} // namespace oath

#endif
