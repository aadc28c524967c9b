/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Uri.hpp"
#include <errno.h>
#include <stdlib.h>
#include <sstream>
#include <iomanip>

namespace sidcore {

// These character classification functions correspond to RFC 3986.
// They avoid C standard library character classification functions,
// since those give different answers based on the current locale.
static bool is_base16(const char c)
{
    return
        ('0' <= c && c <= '9') ||
        ('A' <= c && c <= 'F') ||
        ('a' <= c && c <= 'f');
}
static bool is_alpha(const char c)
{
    return
        ('A' <= c && c <= 'Z') ||
        ('a' <= c && c <= 'z');
}
static bool is_unreserved(const char c)
{
    return
        is_alpha(c) || ('0' <= c && c <= '9') ||
        '-' == c || '.' == c || '_' == c || '~' == c;
}

static unsigned
base16Value(const char c)
{
    if ('0' <= c && c <= '9')
        return c - '0';
    if ('A' <= c && c <= 'F')
        return c - 'A' + 10;
    return c - 'a' + 10;
}

std::string
uriEncodeComponent(const std::string &in)
{
    std::ostringstream stream;
    stream << std::hex << std::uppercase << std::setfill('0');
    for (auto c: in)
    {
        if (is_unreserved(c))
            stream << c;
        else
            stream << '%' << std::setw(2) <<
                   static_cast<unsigned>(static_cast<unsigned char>(c));
    }
    return stream.str();
}

std::string
uriDecodeComponent(const std::string &in)
{
    std::string out;
    out.reserve(in.size());

    auto i = in.begin();
    while (in.end() != i)
    {
        if ('%' == *i &&
            2 < in.end() - i && is_base16(i[1]) && is_base16(i[2]))
        {
            out.push_back(static_cast<char>(
                base16Value(i[1]) << 4 | base16Value(i[2])));
            i += 3;
        }
        else
        {
            out.push_back('+' == *i ? ' ' : *i);
            i += 1;
        }
    }
    return out;
}

Status
queryDecode(QueryMap &result, const std::string &query)
{
    QueryMap out;

    size_t start = 0;
    while (start <= query.size())
    {
        auto end = query.find('&', start);
        if (std::string::npos == end)
            end = query.size();

        const auto pair = query.substr(start, end - start);
        const auto equals = pair.find('=');
        if (std::string::npos != equals)
        {
            const auto key = pair.substr(0, equals);
            if (!out.insert(QueryMap::value_type(key, pair.substr(equals + 1))).second)
                return SID_ERROR(SID_CC_ParseError,
                                 "Query parameter " + key + " appears twice");
        }

        start = end + 1;
    }

    result = out;
    return Status();
}

Status
queryIntegerDecode(int64_t &result, const std::string &value)
{
    // strtoll skips leading space, so check the first character ourselves:
    if (value.empty() ||
        !(('0' <= value[0] && value[0] <= '9') ||
          '-' == value[0] || '+' == value[0]))
        return SID_ERROR(SID_CC_ParseError, "Not an integer: " + value);

    errno = 0;
    char *end = nullptr;
    const long long out = strtoll(value.c_str(), &end, 10);
    if (ERANGE == errno)
        return SID_ERROR(SID_CC_ParseError, "Integer out of range: " + value);
    if (value.c_str() + value.size() != end)
        return SID_ERROR(SID_CC_ParseError, "Not an integer: " + value);

    result = out;
    return Status();
}

std::string
uriLowercase(const std::string &in)
{
    auto out = in;
    for (auto &c: out)
        if ('A' <= c && c <= 'Z')
            c = c - 'A' + 'a';
    return out;
}

} // namespace sidcore
