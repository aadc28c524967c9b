/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "SignatureAuth.hpp"
#include "StratisId.hpp"
#include "../http/Uri.hpp"
#include <utility>

namespace sidcore {

std::string
callbackUrl(const StratisId &id)
{
    return "https://" + id.callback();
}

Status
callbackQueryDecode(CallbackQuery &result, const std::string &query)
{
    QueryMap map;
    SID_CHECK(queryDecode(map, '?' == query[0] ? query.substr(1) : query));

    CallbackQuery out;
    const auto uid = map.find("uid");
    if (map.end() == uid || uid->second.empty())
        return SID_ERROR(SID_CC_ParseError, "Callback query has no uid");
    // The uid goes out unescaped in the callback URL, so it comes back as-is:
    out.uid = uid->second;

    const auto exp = map.find("exp");
    if (map.end() != exp)
    {
        SID_CHECK(queryIntegerDecode(out.exp, exp->second));
        out.expOk = true;
    }

    result = out;
    return Status();
}

Status
callbackStratisId(std::unique_ptr<StratisId> &result,
                  const std::string &callbackPath, const CallbackQuery &query)
{
    SID_CHECK(stratisIdCheck(callbackPath, query.uid));

    if (query.expOk)
        result.reset(new StratisId(callbackPath, query.uid, query.exp));
    else
        result.reset(new StratisId(callbackPath, query.uid));
    return Status();
}

Status
callbackBodyDecode(CallbackBodyJson &result, const std::string &json)
{
    CallbackBodyJson out;
    SID_CHECK(out.decode(json));
    SID_CHECK(out.signatureOk());
    SID_CHECK(out.publicKeyOk());
    if (!*out.signature())
        return SID_ERROR(SID_CC_JSONError, "Empty signature");
    if (!*out.publicKey())
        return SID_ERROR(SID_CC_JSONError, "Empty public key");

    result = std::move(out);
    return Status();
}

} // namespace sidcore
