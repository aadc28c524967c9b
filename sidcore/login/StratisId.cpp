/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "StratisId.hpp"
#include "../http/Uri.hpp"
#include "../util/Debug.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace sidcore {

static const std::string schemePrefix = "sid:";
static const std::string protocolPrefix = "web+sid:";
static const std::string httpsPrefix = "https://";

static const char uidKey[] = "uid";
static const char expKey[] = "exp";
static const char redirectSchemeKey[] = "redirectScheme";
static const char redirectUriKey[] = "redirectUri";

/**
 * Case-insensitive prefix test, since URI schemes ignore case.
 */
static bool
hasPrefix(const std::string &text, const std::string &prefix)
{
    return prefix.size() <= text.size() &&
           uriLowercase(text.substr(0, prefix.size())) == prefix;
}

static bool
hasAuthority(const std::string &text)
{
    return 0 == text.compare(0, 2, "//");
}

static bool
isBlank(const std::string &text)
{
    return std::all_of(text.begin(), text.end(), [](char c)
    {
        return ' ' == c || '\t' == c || '\n' == c ||
               '\v' == c || '\f' == c || '\r' == c;
    });
}

static int64_t
unixSeconds(StratisId::Clock::time_point time)
{
    using namespace std::chrono;
    const auto since = time.time_since_epoch();
    auto out = duration_cast<seconds>(since);

    // duration_cast rounds towards zero, but we want the floor:
    if (since < out)
        out -= seconds(1);
    return out.count();
}

/**
 * Validates the parts of a StratisId and puts them in normal form.
 */
static Status
stratisIdParts(std::string &path, std::string &scheme, std::string &remainder,
               const std::string &callbackPath, const std::string &uid,
               const std::string &redirectUri)
{
    path = hasPrefix(callbackPath, httpsPrefix) ?
           callbackPath.substr(httpsPrefix.size()) : callbackPath;
    const auto start = path.find_first_not_of('/');
    path.erase(0, std::string::npos == start ? path.size() : start);

    if (path.empty())
        return SID_ERROR(SID_CC_InvalidArgument, "Missing callback path");
    if (std::string::npos != path.find_first_of("?#"))
        return SID_ERROR(SID_CC_InvalidArgument,
                         "Callback path cannot contain '?' or '#'");

    if (isBlank(uid))
        return SID_ERROR(SID_CC_InvalidArgument, "Missing uid");
    if (std::string::npos != uid.find_first_of("&?#"))
        return SID_ERROR(SID_CC_InvalidArgument,
                         "Uid cannot contain '&', '?' or '#'");

    scheme.clear();
    remainder.clear();
    if (redirectUri.empty())
        return Status();

    const auto colon = redirectUri.find(':');
    if (std::string::npos == colon ||
        std::string::npos != redirectUri.find(':', colon + 1))
        return SID_ERROR(SID_CC_InvalidArgument,
                         "Redirect URI must be a valid URI");

    scheme = redirectUri.substr(0, colon);
    if (isBlank(scheme))
        return SID_ERROR(SID_CC_InvalidArgument,
                         "Redirect URI must contain a valid scheme");
    if (std::string::npos != scheme.find_first_of("&?#"))
        return SID_ERROR(SID_CC_InvalidArgument,
                         "Redirect scheme cannot contain '&', '?' or '#'");

    remainder = redirectUri.substr(colon + 1);
    if (hasAuthority(remainder))
        remainder.erase(0, 2);

    return Status();
}

StratisId::StratisId(const std::string &callbackPath, const std::string &uid,
                     const std::string &redirectUri):
    expiry_(0),
    expiryOk_(false),
    redirectOk_(false)
{
    init(callbackPath, uid, redirectUri);
}

StratisId::StratisId(const std::string &callbackPath, const std::string &uid,
                     int64_t expiry, const std::string &redirectUri):
    expiry_(expiry),
    expiryOk_(true),
    redirectOk_(false)
{
    init(callbackPath, uid, redirectUri);
}

StratisId::StratisId(const std::string &callbackPath, const std::string &uid,
                     Clock::time_point expiry, const std::string &redirectUri):
    StratisId(callbackPath, uid, unixSeconds(expiry), redirectUri)
{
}

void
StratisId::init(const std::string &callbackPath, const std::string &uid,
                const std::string &redirectUri)
{
    Status s = stratisIdParts(callbackPath_, redirectScheme_, redirectRemainder_,
                              callbackPath, uid, redirectUri);
    if (!s)
        throw std::invalid_argument(s.message());

    uid_ = uid;
    redirectOk_ = !redirectUri.empty();
}

std::string
StratisId::callback() const
{
    std::ostringstream out;
    out << callbackPath_ << '?' << uidKey << '=' << uid_;
    if (expiryOk_)
        out << '&' << expKey << '=' << expiry_;
    return out.str();
}

StratisId::Clock::time_point
StratisId::expiry() const
{
    using namespace std::chrono;
    if (!expiryOk_)
        return Clock::time_point::max();

    // Clamp timestamps the clock cannot represent:
    const auto limit = duration_cast<seconds>(Clock::duration::max()).count();
    if (limit <= expiry_)
        return Clock::time_point::max();
    if (expiry_ <= -limit)
        return Clock::time_point::min();

    return Clock::time_point(duration_cast<Clock::duration>(seconds(expiry_)));
}

bool
StratisId::expired() const
{
    using namespace std::chrono;
    if (!expiryOk_)
        return false;

    const auto now = Clock::now().time_since_epoch();
    const auto whole = duration_cast<seconds>(now);
    if (whole.count() != expiry_)
        return expiry_ < whole.count();

    // Same second, so any fraction puts us past the expiry:
    return whole < now;
}

std::string
StratisId::redirectUri() const
{
    if (!redirectOk_)
        return "";
    return redirectScheme_ + "://" + redirectRemainder_;
}

std::string
StratisId::encodeUri() const
{
    return schemePrefix + callback();
}

std::string
StratisId::encodeProtocol() const
{
    std::ostringstream out;
    out << protocolPrefix << callback();
    if (redirectOk_)
    {
        out << '&' << redirectSchemeKey << '=' << redirectScheme_;
        if (!redirectRemainder_.empty())
            out << '&' << redirectUriKey << '=' <<
                uriEncodeComponent(redirectRemainder_);
    }
    return out.str();
}

bool
StratisId::operator==(const StratisId &other) const
{
    if (uriLowercase(callback()) != uriLowercase(other.callback()))
        return false;
    if (redirectOk_ != other.redirectOk_)
        return false;
    return !redirectOk_ ||
           uriLowercase(redirectUri()) == uriLowercase(other.redirectUri());
}

size_t
StratisId::hash() const
{
    std::hash<std::string> hasher;
    size_t out = hasher(uriLowercase(callback()));
    if (redirectOk_)
        out ^= hasher(uriLowercase(redirectUri())) +
               0x9e3779b9 + (out << 6) + (out >> 2);
    return out;
}

Status
stratisIdCheck(const std::string &callbackPath, const std::string &uid,
               const std::string &redirectUri)
{
    std::string path, scheme, remainder;
    return stratisIdParts(path, scheme, remainder,
                          callbackPath, uid, redirectUri);
}

Status
stratisIdParse(std::unique_ptr<StratisId> &result, const std::string &text)
{
    // Fragments are not part of the format:
    if (std::string::npos != text.find('#'))
        return SID_ERROR(SID_CC_ParseError, "StratisId cannot have a fragment");

    // Strip the scheme:
    std::string callback;
    if (hasPrefix(text, schemePrefix))
    {
        callback = text.substr(schemePrefix.size());
    }
    else if (hasPrefix(text, protocolPrefix))
    {
        // Older protocol handlers write "web+sid://host/path":
        callback = text.substr(protocolPrefix.size());
        if (hasAuthority(callback))
            callback.erase(0, 2);
    }
    else
    {
        callback = text;
        if (hasAuthority(callback))
            callback.erase(0, 2);
    }
    if (hasAuthority(callback))
        return SID_ERROR(SID_CC_ParseError,
                         "StratisId callback cannot have an authority part");

    // Split off the query string:
    const auto question = callback.find('?');
    if (std::string::npos == question ||
        std::string::npos != callback.find('?', question + 1))
        return SID_ERROR(SID_CC_ParseError,
                         "StratisId needs exactly one query string");
    const auto path = callback.substr(0, question);

    QueryMap query;
    SID_CHECK(queryDecode(query, callback.substr(question + 1)));

    const auto uid = query.find(uidKey);
    if (query.end() == uid || isBlank(uid->second))
        return SID_ERROR(SID_CC_ParseError, "StratisId has no uid");

    int64_t expiry = 0;
    const auto exp = query.find(expKey);
    if (query.end() != exp)
        SID_CHECK(queryIntegerDecode(expiry, exp->second));

    // Put the redirect back together:
    std::string redirectUri;
    const auto scheme = query.find(redirectSchemeKey);
    const auto remainder = query.find(redirectUriKey);
    if (query.end() != scheme)
    {
        if (isBlank(scheme->second))
            return SID_ERROR(SID_CC_ParseError, "Blank redirect scheme");
        redirectUri = scheme->second + "://";
        if (query.end() != remainder)
            redirectUri += uriDecodeComponent(remainder->second);
    }
    else if (query.end() != remainder)
    {
        return SID_ERROR(SID_CC_ParseError, "Redirect URI has no scheme");
    }

    Status s = stratisIdCheck(path, uid->second, redirectUri);
    if (!s)
        return SID_ERROR(SID_CC_ParseError, s.message());

    if (query.end() != exp)
        result.reset(new StratisId(path, uid->second, expiry, redirectUri));
    else
        result.reset(new StratisId(path, uid->second, redirectUri));

    SID_DebugLevel(1, "Parsed StratisId %s", result->callback().c_str());
    return Status();
}

bool
stratisIdEqual(const StratisId *a, const StratisId *b)
{
    if (!a || !b)
        return !a && !b;
    return *a == *b;
}

} // namespace sidcore
