/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SIDCORE_LOGIN_STRATIS_ID_HPP
#define SIDCORE_LOGIN_STRATIS_ID_HPP

#include "../util/Status.hpp"
#include <stdint.h>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace sidcore {

/**
 * A pending signature-auth request, as a relying party hands it
 * to a signer. Written in one of three forms:
 *
 *   api.example.com/auth?uid=123&exp=1635200000
 *   sid:api.example.com/auth?uid=123&exp=1635200000
 *   web+sid:api.example.com/auth?uid=123&redirectScheme=app&redirectUri=x
 *
 * Instances are immutable.
 */
class StratisId
{
public:
    typedef std::chrono::system_clock Clock;

    /**
     * Builds a StratisId from its parts.
     * Throws std::invalid_argument if a part is missing or malformed.
     * @param callbackPath authority and path of the callback URL.
     * A leading "https://" or leading slashes are removed.
     * @param redirectUri the URI to send the user to once the
     * out-of-band flow completes, or empty for none.
     */
    StratisId(const std::string &callbackPath, const std::string &uid,
              const std::string &redirectUri="");

    /**
     * @param expiry a Unix timestamp, in seconds.
     */
    StratisId(const std::string &callbackPath, const std::string &uid,
              int64_t expiry, const std::string &redirectUri="");

    /**
     * @param expiry truncated to whole seconds.
     */
    StratisId(const std::string &callbackPath, const std::string &uid,
              Clock::time_point expiry, const std::string &redirectUri="");

    const std::string &callbackPath() const { return callbackPath_; }
    const std::string &uid() const { return uid_; }

    /**
     * The callback path with its query string, uid first:
     * "<callbackPath>?uid=<uid>[&exp=<expiry>]"
     */
    std::string callback() const;

    /**
     * Returns the expiry time, or Clock::time_point::max()
     * if this StratisId never expires.
     */
    Clock::time_point expiry() const;
    bool expiryOk() const { return expiryOk_; }

    /**
     * Returns the expiry as a Unix timestamp. Only valid if expiryOk().
     */
    int64_t expiryUnix() const { return expiry_; }

    /**
     * True if the current time is past the expiry.
     * Checks the clock on every call.
     */
    bool expired() const;

    /**
     * The full redirect URI, "<scheme>://<remainder>".
     * Empty if redirectOk() is false.
     */
    std::string redirectUri() const;
    bool redirectOk() const { return redirectOk_; }
    const std::string &redirectScheme() const { return redirectScheme_; }

    /**
     * The redirect URI after "<scheme>://", possibly empty.
     */
    const std::string &redirectRemainder() const { return redirectRemainder_; }

    /**
     * Returns the bare callback form.
     */
    std::string encode() const { return callback(); }

    /**
     * Returns the "sid:" form. Never carries the redirect.
     */
    std::string encodeUri() const;

    /**
     * Returns the "web+sid:" protocol-handler form,
     * including the redirect parameters if there are any.
     */
    std::string encodeProtocol() const;

    /**
     * Compares the callback and redirect URI, ignoring case.
     */
    bool operator==(const StratisId &other) const;
    bool operator!=(const StratisId &other) const { return !(*this == other); }

    size_t hash() const;

private:
    std::string callbackPath_;
    std::string uid_;
    int64_t expiry_;
    bool expiryOk_;
    std::string redirectScheme_;
    std::string redirectRemainder_;
    bool redirectOk_;

    void init(const std::string &callbackPath, const std::string &uid,
              const std::string &redirectUri);
};

/**
 * Checks that the parts would make a valid StratisId,
 * without constructing one.
 * @return SID_CC_InvalidArgument describing the first bad part.
 */
Status
stratisIdCheck(const std::string &callbackPath, const std::string &uid,
               const std::string &redirectUri="");

/**
 * Decodes a StratisId from any of its three forms.
 * Leaves the result untouched on failure.
 * @return SID_CC_ParseError if the text is not a StratisId.
 */
Status
stratisIdParse(std::unique_ptr<StratisId> &result, const std::string &text);

/**
 * Compares two possibly-missing StratisIds.
 * Two missing ids are equal; a missing id never equals a present one.
 */
bool
stratisIdEqual(const StratisId *a, const StratisId *b);

} // namespace sidcore

namespace std {

template<>
struct hash<sidcore::StratisId>
{
    size_t operator()(const sidcore::StratisId &id) const
    {
        return id.hash();
    }
};

} // namespace std

#endif
