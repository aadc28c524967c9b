/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers for the C API layer.
 */

#ifndef SIDCORE_UTIL_UTIL_HPP
#define SIDCORE_UTIL_UTIL_HPP

#include "../../src/SID.h"
#include "Debug.hpp"
#include <string.h>
#include <string>

namespace sidcore {

#ifdef DEBUG
#define SID_LOG_ERROR(code, err_string) \
    { \
        SID_DebugLog("Error: %s, code: %d, func: %s, source: %s, line: %d", err_string, code, __FUNCTION__, __FILE__, __LINE__); \
    }
#else
    #define SID_LOG_ERROR(code, err_string) { }
#endif

#define SID_SET_ERR_CODE(err, set_code) \
    if (err != NULL) { \
        err->code = set_code; \
    }

#define SID_RET_ERROR(err, desc) \
    { \
        if (pError) \
        { \
            Status(err, desc, __FILE__, __FUNCTION__, __LINE__).toError(*pError); \
        } \
        cc = err; \
        SID_LOG_ERROR(cc, desc); \
        goto exit; \
    }

#define SID_CHECK_ASSERT(assert, err, desc) \
    { \
        if (!(assert)) \
        { \
            SID_RET_ERROR(err, desc); \
        } \
    } \

#define SID_CHECK_NULL(arg) \
    { \
        SID_CHECK_ASSERT(arg != NULL, SID_CC_NULLPtr, "NULL pointer"); \
    } \

/**
 * Copies a string into a malloc'ed buffer for the C API.
 * The caller frees the result with free().
 */
char *
stringCopy(const char *string);

char *
stringCopy(const std::string &string);

} // namespace sidcore

#endif
