/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SIDCORE_HTTP_URI_HPP
#define SIDCORE_HTTP_URI_HPP

#include "../util/Status.hpp"
#include <stdint.h>
#include <map>
#include <string>

namespace sidcore {

/**
 * Percent-encodes a string for use as a URI query value.
 * Only the RFC 3986 unreserved characters pass through unchanged.
 */
std::string
uriEncodeComponent(const std::string &in);

/**
 * Decodes RFC 3986 escape sequences in a query value.
 * A '+' decodes to a space, as HTML forms write it.
 * Malformed escape sequences are passed through as-is,
 * so all strings are valid and this function cannot fail.
 */
std::string
uriDecodeComponent(const std::string &in);

typedef std::map<std::string, std::string> QueryMap;

/**
 * Splits a query string into key-value pairs.
 * Pairs are separated by '&', and the first '=' separates a key
 * from its value. Pairs without an '=' are skipped.
 * Keys and values are left escaped.
 * @return SID_CC_ParseError if a key appears more than once.
 */
Status
queryDecode(QueryMap &result, const std::string &query);

/**
 * Reads a base-10 signed 64-bit integer query value.
 * The entire value must be the number, with no surrounding space.
 */
Status
queryIntegerDecode(int64_t &result, const std::string &value);

/**
 * Lowercases the ASCII letters in a string.
 */
std::string
uriLowercase(const std::string &in);

} // namespace sidcore

#endif
