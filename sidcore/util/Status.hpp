/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef SIDCORE_UTIL_STATUS_HPP
#define SIDCORE_UTIL_STATUS_HPP

// We need tSID_CC and tSID_Error:
#include "../../src/SID.h"
#include <ostream>
#include <string>

namespace sidcore {

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tSID_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tSID_CC value()             const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == SID_CC_Ok; }

    /**
     * Write this status to the debug log if it represents an error.
     */
    const Status &log() const;

    /**
     * Unpacks this status into a tSID_Error structure.
     */
    void toError(tSID_Error &error) const;

    /**
     * Converts a tSID_Error structure into a Status.
     */
    static Status fromError(const tSID_Error &error);

private:
    // Error information:
    tSID_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define SID_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define SID_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Use when an old-style function calls a new-style sidcore::Status function.
 */
#define SID_CHECK_NEW(f, pError) \
    do { \
        Status s = (f); \
        if (!s) { \
            if (pError) s.toError(*pError); \
            cc = s.value(); \
            goto exit; \
        } \
    } while (false)

} // namespace sidcore

#endif
