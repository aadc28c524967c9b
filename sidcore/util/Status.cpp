/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>

#include <string.h>

namespace sidcore {

Status::Status() :
    value_(SID_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tSID_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::ostringstream text;
        text << *this;
        SID_DebugLog("%s", text.str().c_str());
    }
    return *this;
}

void Status::toError(tSID_Error &error) const
{
    error.code = value_;
    strncpy(error.szDescription, message_.c_str(), SID_MAX_STRING_LENGTH);
    strncpy(error.szSourceFunc, function_, SID_MAX_STRING_LENGTH);
    strncpy(error.szSourceFile, file_, SID_MAX_STRING_LENGTH);
    error.nSourceLine = line_;

    error.szDescription[SID_MAX_STRING_LENGTH] = 0;
    error.szSourceFunc[SID_MAX_STRING_LENGTH] = 0;
    error.szSourceFile[SID_MAX_STRING_LENGTH] = 0;
}

Status Status::fromError(const tSID_Error &error)
{
    static char file[SID_MAX_STRING_LENGTH + 1];
    static char function[SID_MAX_STRING_LENGTH + 1];
    strncpy(file, error.szSourceFile, SID_MAX_STRING_LENGTH);
    strncpy(function, error.szSourceFunc, SID_MAX_STRING_LENGTH);
    file[SID_MAX_STRING_LENGTH] = 0;
    function[SID_MAX_STRING_LENGTH] = 0;

    return Status(error.code, error.szDescription,
        file, function, error.nSourceLine);
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace sidcore
