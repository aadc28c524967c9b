/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../src/SID.h"
#include <catch2/catch.hpp>
#include <stdlib.h>
#include <fstream>
#include <sstream>
#include <string>

static std::string
tempDir()
{
    char path[] = "/tmp/sidcore-test-XXXXXX";
    REQUIRE(mkdtemp(path));
    return std::string(path) + "/core";
}

TEST_CASE("C API lifecycle", "[api]")
{
    tSID_Error error;
    char *szText = nullptr;

    SECTION("not initialized")
    {
        REQUIRE(SID_CC_NotInitialized ==
                SID_CreateStratisId("api.opdex.com/auth", "1", false, 0,
                                    nullptr, SID_StratisIdForm_Uri,
                                    &szText, &error));
        REQUIRE(SID_CC_NotInitialized == error.code);
    }
    SECTION("null root")
    {
        REQUIRE(SID_CC_NULLPtr == SID_Initialize(nullptr, &error));
    }
    SECTION("reinitialization")
    {
        const auto dir = tempDir();
        REQUIRE(SID_CC_Ok == SID_Initialize(dir.c_str(), &error));
        REQUIRE(SID_CC_Reinitialization == SID_Initialize(dir.c_str(), &error));
        SID_Terminate();
    }
}

TEST_CASE("C API StratisId functions", "[api]")
{
    tSID_Error error;
    const auto dir = tempDir();
    REQUIRE(SID_CC_Ok == SID_Initialize(dir.c_str(), &error));

    SECTION("create")
    {
        char *szText = nullptr;
        REQUIRE(SID_CC_Ok ==
                SID_CreateStratisId("api.opdex.com/auth", "4e8a8b", true,
                                    1637240507, "myapp://callback",
                                    SID_StratisIdForm_Protocol,
                                    &szText, &error));
        REQUIRE(std::string(szText) ==
                "web+sid:api.opdex.com/auth?uid=4e8a8b&exp=1637240507"
                "&redirectScheme=myapp&redirectUri=callback");
        free(szText);

        REQUIRE(SID_CC_Ok ==
                SID_CreateStratisId("api.opdex.com/auth", "4e8a8b", false, 0,
                                    nullptr, SID_StratisIdForm_Uri,
                                    &szText, &error));
        REQUIRE(std::string(szText) == "sid:api.opdex.com/auth?uid=4e8a8b");
        free(szText);
    }
    SECTION("create errors")
    {
        char *szText = nullptr;
        REQUIRE(SID_CC_InvalidArgument ==
                SID_CreateStratisId("api.opdex.com/auth", " ", false, 0,
                                    nullptr, SID_StratisIdForm_Uri,
                                    &szText, &error));
        REQUIRE(SID_CC_InvalidArgument == error.code);
        REQUIRE(SID_CC_NULLPtr ==
                SID_CreateStratisId(nullptr, "1", false, 0,
                                    nullptr, SID_StratisIdForm_Uri,
                                    &szText, &error));
        REQUIRE(!szText);
    }
    SECTION("parse")
    {
        tSID_StratisIdInfo *pInfo = nullptr;
        REQUIRE(SID_CC_Ok ==
                SID_ParseStratisId("web+sid://api.opdex.com/auth?uid=abc&exp=5"
                                   "&redirectScheme=myapp&redirectUri=open%2Fhere",
                                   &pInfo, &error));
        REQUIRE(pInfo);
        REQUIRE(std::string(pInfo->szCallbackPath) == "api.opdex.com/auth");
        REQUIRE(std::string(pInfo->szUid) == "abc");
        REQUIRE(std::string(pInfo->szCallbackUrl) ==
                "https://api.opdex.com/auth?uid=abc&exp=5");
        REQUIRE(pInfo->bHasExpiry);
        REQUIRE(pInfo->expiry == 5);
        REQUIRE(std::string(pInfo->szRedirectUri) == "myapp://open/here");
        SID_FreeStratisIdInfo(pInfo);

#ifdef DEBUG
        std::ifstream logFile(dir + "/sid.log");
        std::stringstream text;
        text << logFile.rdbuf();
        REQUIRE(std::string::npos !=
                text.str().find("Parsed StratisId api.opdex.com/auth?uid=abc&exp=5"));
#endif
    }
    SECTION("parse errors")
    {
        tSID_StratisIdInfo *pInfo = nullptr;
        REQUIRE(SID_CC_ParseError ==
                SID_ParseStratisId("sid://api.opdex.com/auth?uid=abc",
                                   &pInfo, &error));
        REQUIRE(SID_CC_ParseError == error.code);
        REQUIRE(!pInfo);
    }
    SECTION("expiry")
    {
        bool expired = false;
        REQUIRE(SID_CC_Ok ==
                SID_StratisIdExpired("sid:api.opdex.com/auth?uid=1&exp=5",
                                     &expired, &error));
        REQUIRE(expired);
        REQUIRE(SID_CC_Ok ==
                SID_StratisIdExpired("sid:api.opdex.com/auth?uid=1",
                                     &expired, &error));
        REQUIRE_FALSE(expired);
    }
    SECTION("callback body")
    {
        char *szJson = nullptr;
        REQUIRE(SID_CC_Ok ==
                SID_CallbackBody("H9xjd==", "PVwyqb", &szJson, &error));
        REQUIRE(std::string(szJson) ==
                "{\"publicKey\":\"PVwyqb\",\"signature\":\"H9xjd==\"}");
        free(szJson);
    }

    SID_Terminate();
}
