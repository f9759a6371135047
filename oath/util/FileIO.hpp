/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef OATH_UTIL_FILEIO_HPP
#define OATH_UTIL_FILEIO_HPP

#include "Data.hpp"
#include "Status.hpp"
#include <mutex>

namespace oath {

extern std::recursive_mutex gFileMutex;
typedef std::lock_guard<std::recursive_mutex> AutoFileLock;

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

/**
 * Reads a file from disk.
 */
Status
fileLoad(DataChunk &result, const std::string &path);

/**
 * Writes a file to disk.
 */
Status
fileSave(DataSlice data, const std::string &path);

/**
 * Deletes a single file, if it exists.
 */
Status
fileDelete(const std::string &path);

} // namespace oath

#endif
