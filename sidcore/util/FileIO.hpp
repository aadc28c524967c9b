/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SIDCORE_UTIL_FILE_IO_HPP
#define SIDCORE_UTIL_FILE_IO_HPP

#include "Status.hpp"
#include <mutex>

namespace sidcore {

extern std::recursive_mutex gFileMutex;
typedef std::lock_guard<std::recursive_mutex> AutoFileLock;

/**
 * Adds a trailing slash to a directory name, if it lacks one.
 */
std::string
fileSlashify(const std::string &path);

/**
 * Creates a directory if it does not exist yet.
 */
Status
fileEnsureDir(const std::string &dir);

bool
fileExists(const std::string &path);

} // namespace sidcore

#endif
