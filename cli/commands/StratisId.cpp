/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../sidcore/http/Uri.hpp"
#include "../../sidcore/login/SignatureAuth.hpp"
#include "../../sidcore/login/StratisId.hpp"
#include "../../src/SID.h"
#include <stdlib.h>
#include <time.h>
#include <iostream>

using namespace sidcore;

static void
printStratisId(const StratisId &id)
{
    std::cout << "Callback path: " << id.callbackPath() << std::endl;
    std::cout << "Uid: " << id.uid() << std::endl;
    if (id.expiryOk())
        std::cout << "Expiry: " << id.expiryUnix() <<
                  (id.expired() ? " (expired)" : "") << std::endl;
    else
        std::cout << "Expiry: (none)" << std::endl;
    if (id.redirectOk())
        std::cout << "Redirect: " << id.redirectUri() << std::endl;
    std::cout << "Callback URL: " << callbackUrl(id) << std::endl;
}

COMMAND(InitLevel::none, SidCreate, "sid-create",
        " <uid> [<exp>]")
{
    if (argc < 1 || 2 < argc)
        return SID_ERROR(SID_CC_Error, helpString(*this));
    const auto uid = argv[0];
    if (session.callbackPath.empty())
        return SID_ERROR(SID_CC_Error, "No callback path given, " +
                         helpString(*this));

    bool expiryOk = false;
    int64_t expiry = 0;
    if (2 == argc)
    {
        SID_CHECK(queryIntegerDecode(expiry, argv[1]));
        expiryOk = true;
    }
    else if (session.lifetimeOk)
    {
        expiry = time(nullptr) + session.lifetime;
        expiryOk = true;
    }

    SID_CHECK(stratisIdCheck(session.callbackPath, uid, session.redirectUri));
    const auto id = expiryOk ?
                    StratisId(session.callbackPath, uid, expiry, session.redirectUri) :
                    StratisId(session.callbackPath, uid, session.redirectUri);

    std::cout << id.encode() << std::endl;
    std::cout << id.encodeUri() << std::endl;
    std::cout << id.encodeProtocol() << std::endl;

    return Status();
}

COMMAND(InitLevel::none, SidParse, "sid-parse",
        " <text>")
{
    if (argc != 1)
        return SID_ERROR(SID_CC_Error, helpString(*this));

    std::unique_ptr<StratisId> id;
    SID_CHECK(stratisIdParse(id, argv[0]));
    printStratisId(*id);

    return Status();
}

COMMAND(InitLevel::none, SidCallback, "sid-callback",
        " <callback-path> <query>")
{
    if (argc != 2)
        return SID_ERROR(SID_CC_Error, helpString(*this));

    CallbackQuery query;
    SID_CHECK(callbackQueryDecode(query, argv[1]));

    std::unique_ptr<StratisId> id;
    SID_CHECK(callbackStratisId(id, argv[0], query));
    std::cout << id->encodeUri() << std::endl;
    if (id->expired())
        return SID_ERROR(SID_CC_Error, "StratisId has expired");

    return Status();
}

COMMAND(InitLevel::context, SidBody, "sid-body",
        " <signature> <public-key>")
{
    if (argc != 2)
        return SID_ERROR(SID_CC_Error, helpString(*this));

    tSID_Error error;
    char *szJson = nullptr;
    if (SID_CC_Ok != SID_CallbackBody(argv[0], argv[1], &szJson, &error))
        return Status::fromError(error);
    std::cout << szJson << std::endl;
    free(szJson);

    return Status();
}
