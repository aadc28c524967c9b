/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef SIDCORE_LOGIN_SIGNATURE_AUTH_HPP
#define SIDCORE_LOGIN_SIGNATURE_AUTH_HPP

#include "../json/JsonObject.hpp"
#include <stdint.h>
#include <memory>

namespace sidcore {

class StratisId;

/**
 * The HTTPS URL the signer posts its signature to.
 */
std::string
callbackUrl(const StratisId &id);

/**
 * The query parameters a relying party receives on its callback URL.
 */
struct CallbackQuery
{
    std::string uid;
    int64_t exp = 0;
    bool expOk = false;
};

/**
 * Reads the callback query parameters out of a raw query string.
 * The uid is required and kept exactly as written, matching `callbackUrl`.
 * The expiry must be an integer if present.
 */
Status
callbackQueryDecode(CallbackQuery &result, const std::string &query);

/**
 * Rebuilds the StratisId a relying party handed out,
 * given the callback query it received.
 */
Status
callbackStratisId(std::unique_ptr<StratisId> &result,
                  const std::string &callbackPath, const CallbackQuery &query);

/**
 * The JSON body a signer posts to the callback URL.
 * The signature and public key are opaque to this library.
 */
struct CallbackBodyJson:
    public JsonObject
{
    SID_JSON_STRING(signature, "signature", "")
    SID_JSON_STRING(publicKey, "publicKey", "")
};

/**
 * Decodes a callback body, requiring a non-empty signature and public key.
 */
Status
callbackBodyDecode(CallbackBodyJson &result, const std::string &json);

} // namespace sidcore

#endif
