/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../sidcore/http/Uri.hpp"
#include <catch2/catch.hpp>

TEST_CASE("URI component encoding", "[util][uri]")
{
    struct TestCase
    {
        const char *data;
        const char *text;
    };
    TestCase cases[] =
    {
        {"", ""},
        {"redirect.com/path", "redirect.com%2Fpath"},
        {"a b", "a%20b"},
        {"-._~", "-._~"},
        {"?&=#:", "%3F%26%3D%23%3A"},
        {"\xc3\xa9", "%C3%A9"}
    };

    for (auto &test: cases)
        REQUIRE(test.text == sidcore::uriEncodeComponent(test.data));
    for (auto &test: cases)
        REQUIRE(test.data == sidcore::uriDecodeComponent(test.text));
}

TEST_CASE("URI component decoding", "[util][uri]")
{
    SECTION("lowercase escapes")
    {
        REQUIRE(sidcore::uriDecodeComponent("redirect.com%2fpath") ==
                "redirect.com/path");
    }
    SECTION("plus is a space")
    {
        REQUIRE(sidcore::uriDecodeComponent("a+b") == "a b");
    }
    SECTION("messy escapes pass through")
    {
        REQUIRE(sidcore::uriDecodeComponent("100%") == "100%");
        REQUIRE(sidcore::uriDecodeComponent("%zz%4") == "%zz%4");
    }
}

TEST_CASE("Query string decoding", "[util][uri]")
{
    sidcore::QueryMap map;

    SECTION("messy query")
    {
        REQUIRE(sidcore::queryDecode(map, "&&x=y&z&=w&a=b=c&e="));
        REQUIRE(map.end() == map.find("z"));
        REQUIRE(map["x"] == "y");
        REQUIRE(map[""] == "w");
        REQUIRE(map["a"] == "b=c");
        REQUIRE(map["e"] == "");
    }
    SECTION("empty query")
    {
        REQUIRE(sidcore::queryDecode(map, ""));
        REQUIRE(map.empty());
    }
    SECTION("values stay escaped")
    {
        REQUIRE(sidcore::queryDecode(map, "x=a%20b"));
        REQUIRE(map["x"] == "a%20b");
    }
    SECTION("duplicate key")
    {
        map["old"] = "value";
        auto s = sidcore::queryDecode(map, "x=1&x=2");
        REQUIRE(!s);
        REQUIRE(SID_CC_ParseError == s.value());
        REQUIRE(map["old"] == "value");
    }
}

TEST_CASE("Query integer decoding", "[util][uri]")
{
    int64_t value = 7;

    REQUIRE(sidcore::queryIntegerDecode(value, "1637240507"));
    REQUIRE(value == 1637240507);
    REQUIRE(sidcore::queryIntegerDecode(value, "-12"));
    REQUIRE(value == -12);
    REQUIRE(sidcore::queryIntegerDecode(value, "+3"));
    REQUIRE(value == 3);

    REQUIRE_FALSE(sidcore::queryIntegerDecode(value, ""));
    REQUIRE_FALSE(sidcore::queryIntegerDecode(value, "-"));
    REQUIRE_FALSE(sidcore::queryIntegerDecode(value, " 1"));
    REQUIRE_FALSE(sidcore::queryIntegerDecode(value, "1 "));
    REQUIRE_FALSE(sidcore::queryIntegerDecode(value, "1.5"));
    REQUIRE_FALSE(sidcore::queryIntegerDecode(value, "9223372036854775808"));
    REQUIRE(value == 3);
}

TEST_CASE("ASCII lowercasing", "[util][uri]")
{
    REQUIRE(sidcore::uriLowercase("Web+SID:Api.Opdex.COM") == "web+sid:api.opdex.com");
}
