/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../sidcore/login/SignatureAuth.hpp"
#include "../sidcore/login/StratisId.hpp"
#include <catch2/catch.hpp>
#include <string.h>

using namespace sidcore;

TEST_CASE("Callback URL", "[login][callback]")
{
    REQUIRE(callbackUrl(StratisId("api.opdex.com/auth", "1", 2)) ==
            "https://api.opdex.com/auth?uid=1&exp=2");
    REQUIRE(callbackUrl(StratisId("localhost:5001/v1/auth", "abc")) ==
            "https://localhost:5001/v1/auth?uid=abc");
}

TEST_CASE("Callback query decoding", "[login][callback]")
{
    CallbackQuery query;

    SECTION("leading question mark")
    {
        REQUIRE(callbackQueryDecode(query, "?uid=a1b2&exp=1637240507"));
        REQUIRE(query.uid == "a1b2");
        REQUIRE(query.expOk);
        REQUIRE(query.exp == 1637240507);
    }
    SECTION("no expiry")
    {
        REQUIRE(callbackQueryDecode(query, "uid=xyz"));
        REQUIRE(query.uid == "xyz");
        REQUIRE_FALSE(query.expOk);
    }
    SECTION("uid kept as written")
    {
        REQUIRE(callbackQueryDecode(query, "uid=a+b%20c"));
        REQUIRE(query.uid == "a+b%20c");
    }
    SECTION("missing uid")
    {
        auto s = callbackQueryDecode(query, "exp=1");
        REQUIRE(!s);
        REQUIRE(SID_CC_ParseError == s.value());
    }
    SECTION("bad expiry")
    {
        REQUIRE_FALSE(callbackQueryDecode(query, "uid=1&exp=soon"));
    }
    SECTION("empty query")
    {
        REQUIRE_FALSE(callbackQueryDecode(query, ""));
    }
}

static std::unique_ptr<StratisId>
rebuilt(const StratisId &issued)
{
    const std::string url = callbackUrl(issued);
    const auto split = url.find('?');
    const auto path = url.substr(strlen("https://"), split - strlen("https://"));

    CallbackQuery query;
    REQUIRE(callbackQueryDecode(query, url.substr(split)));

    std::unique_ptr<StratisId> id;
    REQUIRE(callbackStratisId(id, path, query));
    REQUIRE(id);
    return id;
}

TEST_CASE("Callback StratisId reconstruction", "[login][callback]")
{
    SECTION("plain uid")
    {
        const StratisId issued("api.opdex.com/auth", "4e8a8b", 1637240507);
        auto id = rebuilt(issued);
        REQUIRE(*id == issued);
        REQUIRE(id->expiryUnix() == 1637240507);
    }
    SECTION("uid with a plus")
    {
        const StratisId issued("api.opdex.com/auth", "a+b", 1637240507);
        auto id = rebuilt(issued);
        REQUIRE(id->uid() == "a+b");
        REQUIRE(*id == issued);
    }
    SECTION("uid with an escape")
    {
        const StratisId issued("api.opdex.com/auth", "50%25", 1637240507);
        auto id = rebuilt(issued);
        REQUIRE(id->uid() == "50%25");
        REQUIRE(*id == issued);
    }
    SECTION("no expiry")
    {
        const StratisId issued("api.opdex.com/auth", "4e8a8b");
        auto id = rebuilt(issued);
        REQUIRE_FALSE(id->expiryOk());
        REQUIRE(*id == issued);
    }
    SECTION("bad path")
    {
        CallbackQuery query;
        REQUIRE(callbackQueryDecode(query, "uid=4e8a8b"));

        std::unique_ptr<StratisId> other;
        auto s = callbackStratisId(other, "///", query);
        REQUIRE(!s);
        REQUIRE(SID_CC_InvalidArgument == s.value());
        REQUIRE(!other);
    }
}

TEST_CASE("Callback body decoding", "[login][callback]")
{
    CallbackBodyJson body;

    SECTION("good body")
    {
        REQUIRE(callbackBodyDecode(body,
            "{\"signature\": \"H9xjd==\", \"publicKey\": \"PVwyqbwu5CazeACoAMRonaQSyRvTHZvAUh\"}"));
        REQUIRE(std::string(body.signature()) == "H9xjd==");
        REQUIRE(std::string(body.publicKey()) == "PVwyqbwu5CazeACoAMRonaQSyRvTHZvAUh");
    }
    SECTION("missing public key")
    {
        auto s = callbackBodyDecode(body, "{\"signature\": \"H9xjd==\"}");
        REQUIRE(!s);
        REQUIRE(SID_CC_JSONError == s.value());
    }
    SECTION("empty signature")
    {
        REQUIRE_FALSE(callbackBodyDecode(body,
            "{\"signature\": \"\", \"publicKey\": \"P\"}"));
    }
    SECTION("not an object")
    {
        REQUIRE_FALSE(callbackBodyDecode(body, "[1, 2]"));
    }
}
