/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../sidcore/login/SignatureAuth.hpp"
#include <catch2/catch.hpp>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <utility>

using namespace sidcore;

TEST_CASE("JsonPtr ownership", "[util][json]")
{
    JsonPtr a(json_string("H9xjd=="));
    REQUIRE(1 == a.get()->refcount);

    SECTION("move constructor")
    {
        JsonPtr b(std::move(a));
        REQUIRE(!a);
        REQUIRE(1 == b.get()->refcount);
        REQUIRE(b.encode(true) == "\"H9xjd==\"");
    }
    SECTION("move assignment")
    {
        JsonPtr b(json_integer(1));
        b = std::move(a);
        REQUIRE(!a);
        REQUIRE(json_is_string(b.get()));
    }
    SECTION("reset")
    {
        a.reset();
        REQUIRE(!a);
        REQUIRE(a.decode("[1, 2]"));
        REQUIRE(json_is_array(a.get()));
    }
}

TEST_CASE("Callback body records", "[util][json]")
{
    CallbackBodyJson body;

    SECTION("empty record")
    {
        REQUIRE(json_is_object(body.get()));
        REQUIRE(body.encode(true) == "{}");
        REQUIRE(std::string(body.signature()) == "");
        REQUIRE_FALSE(body.signatureOk());
    }
    SECTION("keys come out sorted")
    {
        REQUIRE(body.signatureSet("H9xjd=="));
        REQUIRE(body.publicKeySet(std::string("PVwyqb")));
        REQUIRE(body.encode(true) ==
                "{\"publicKey\":\"PVwyqb\",\"signature\":\"H9xjd==\"}");
    }
    SECTION("wrong type falls back")
    {
        REQUIRE(body.decode("{\"signature\": 42}"));
        REQUIRE_FALSE(body.signatureOk());
        REQUIRE(std::string(body.signature()) == "");
    }
    SECTION("set on a non-object root")
    {
        REQUIRE(body.decode("[1]"));
        REQUIRE(body.publicKeySet("PVwyqb"));
        REQUIRE(body.encode(true) == "{\"publicKey\":\"PVwyqb\"}");
    }
    SECTION("malformed text")
    {
        auto s = body.decode("{\"signature\": ");
        REQUIRE(!s);
        REQUIRE(SID_CC_JSONError == s.value());
    }
}

TEST_CASE("JSON file loading", "[util][json]")
{
    char path[] = "/tmp/sidcore-json-XXXXXX";
    int fd = mkstemp(path);
    REQUIRE(0 <= fd);
    FILE *file = fdopen(fd, "w");
    REQUIRE(file);
    fputs("{\"signature\": \"H9xjd==\", \"publicKey\": \"PVwyqb\"}\n", file);
    fclose(file);

    CallbackBodyJson body;
    REQUIRE(body.load(path));
    REQUIRE(body.signatureOk());
    REQUIRE(std::string(body.publicKey()) == "PVwyqb");

    SECTION("malformed file")
    {
        file = fopen(path, "w");
        REQUIRE(file);
        fputs("{\"signature\": ", file);
        fclose(file);

        auto s = body.load(path);
        REQUIRE(!s);
        REQUIRE(SID_CC_JSONError == s.value());
        REQUIRE(std::string(body.publicKey()) == "PVwyqb");
    }
    SECTION("missing file")
    {
        unlink(path);
        auto s = body.load(path);
        REQUIRE(!s);
        REQUIRE(SID_CC_FileDoesNotExist == s.value());
    }

    unlink(path);
}
