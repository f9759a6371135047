/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef OATH_UTIL_DEBUG_HPP
#define OATH_UTIL_DEBUG_HPP

#include "Status.hpp"
#include "Data.hpp"

namespace oath {

/**
 * Starts mirroring the debug log into a file.
 * The previous log, if any, is kept as `<path>.prev`.
 */
Status
debugInitialize(const std::string &logPath);

void
debugTerminate();

/**
 * Returns the contents of the previous and current log files.
 */
DataChunk
debugLogLoad();

void OATH_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace oath

#endif
