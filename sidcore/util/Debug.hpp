/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SIDCORE_UTIL_DEBUG_HPP
#define SIDCORE_UTIL_DEBUG_HPP

#include "Status.hpp"

#ifndef DEBUG_LEVEL
#define DEBUG_LEVEL 1
#endif

#define SID_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        SID_DebugLog(__VA_ARGS__);  \
    }                               \
}

namespace sidcore {

/**
 * Opens the log file in the context root directory.
 * Only debug builds keep a log file.
 */
Status
debugInitialize();

void
debugTerminate();

void SID_DebugLog(const char *format, ...);

} // namespace sidcore

#endif
