/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../oath/json/JsonObject.hpp"
#include "../oath/otp/OtpSettings.hpp"
#include "../oath/util/FileIO.hpp"
#include <catch.hpp>
#include <stdlib.h>
#include <unistd.h>

TEST_CASE("JsonPtr lifetime", "[util][json]")
{
    oath::JsonPtr a(json_integer(42));
    REQUIRE(1 == a.get()->refcount);
    REQUIRE(json_is_integer(a.get()));

    SECTION("move constructor")
    {
        oath::JsonPtr b(std::move(a));
        REQUIRE(1 == b.get()->refcount);
        REQUIRE(json_is_integer(b.get()));
        REQUIRE(!a.get());
    }
    SECTION("copy constructor")
    {
        oath::JsonPtr b(a);
        REQUIRE(2 == b.get()->refcount);
        REQUIRE(json_is_integer(b.get()));
        REQUIRE(json_is_integer(a.get()));
    }
    SECTION("assignment operator")
    {
        oath::JsonPtr b;
        b = a;
        REQUIRE(2 == b.get()->refcount);

        b = nullptr;
        REQUIRE(!b.get());
        REQUIRE(1 == a.get()->refcount);
    }
}

TEST_CASE("JsonObject manipulation", "[util][json]")
{
    struct TestJson:
        public oath::JsonObject
    {
        OATH_JSON_STRING (string,  "string",  "default")
        OATH_JSON_INTEGER(integer, "integer", 42)
    };
    TestJson test;

    SECTION("defaults")
    {
        REQUIRE_FALSE(test.stringOk());
        REQUIRE_FALSE(test.integerOk());
        REQUIRE(test.string() == std::string("default"));
        REQUIRE(test.integer() == 42);
    }
    SECTION("decode")
    {
        REQUIRE(test.decode("{ \"string\": \"value\", \"integer\": 7 }"));
        REQUIRE(test.stringOk());
        REQUIRE(test.string() == std::string("value"));
        REQUIRE(test.integer() == 7);
    }
    SECTION("wrong type")
    {
        REQUIRE(test.decode("{ \"integer\": \"7\" }"));
        REQUIRE_FALSE(test.integerOk());
        REQUIRE(test.integer() == 42);
    }
    SECTION("set")
    {
        REQUIRE(test.integerSet(65537));
        REQUIRE(test.integer() == 65537);
        REQUIRE(test.encode() == "{\n    \"integer\": 65537\n}");
    }
    SECTION("bad syntax")
    {
        auto s = test.decode("{ \"integer\": ");
        REQUIRE(s.value() == oath::OATH_CC_JSONError);
    }
}

TEST_CASE("OTP settings defaults", "[otp][json][config]")
{
    oath::OtpSettingsJson settings;
    oath::GeneratorConfig generatorConfig;
    oath::TimeWindowConfig windowConfig;
    REQUIRE(settings.generatorConfig(generatorConfig));
    REQUIRE(settings.timeWindowConfig(windowConfig));
    REQUIRE(generatorConfig.digits == 6);
    REQUIRE(windowConfig.epoch == 0);
    REQUIRE(windowConfig.timeStep == 30);

    std::shared_ptr<const oath::Generator> generator;
    REQUIRE(oath::Generator::create(generator, generatorConfig));
    std::string code;
    REQUIRE(generator->generate(code, std::string("12345678901234567890"), 0));
    REQUIRE(code == "755224");
}

TEST_CASE("OTP settings parsing", "[otp][json][config]")
{
    oath::OtpSettingsJson settings;
    oath::GeneratorConfig generatorConfig;
    oath::TimeWindowConfig windowConfig;

    SECTION("full document")
    {
        REQUIRE(settings.decode(
            "{\"digits\": 8, \"algorithm\": \"sha256\","
            " \"epoch\": 10, \"timeStep\": 60}"));
        REQUIRE(settings.generatorConfig(generatorConfig));
        REQUIRE(settings.timeWindowConfig(windowConfig));
        REQUIRE(generatorConfig.digits == 8);
        REQUIRE(windowConfig.epoch == 10);
        REQUIRE(windowConfig.timeStep == 60);

        // rfc6238 sha256 vector at t = 59:
        std::shared_ptr<const oath::Generator> generator;
        REQUIRE(oath::Generator::create(generator, generatorConfig));
        std::string code;
        REQUIRE(generator->generate(code,
            std::string("12345678901234567890123456789012"), 1));
        REQUIRE(code == "46119246");
    }
    SECTION("zero digits")
    {
        REQUIRE(settings.decode("{\"digits\": 0}"));
        auto s = settings.generatorConfig(generatorConfig);
        REQUIRE(s.value() == oath::OATH_CC_InvalidConfig);
    }
    SECTION("too many digits")
    {
        REQUIRE(settings.decode("{\"digits\": 11}"));
        auto s = settings.generatorConfig(generatorConfig);
        REQUIRE(s.value() == oath::OATH_CC_InvalidConfig);
    }
    SECTION("unknown algorithm")
    {
        REQUIRE(settings.decode("{\"algorithm\": \"MD5\"}"));
        auto s = settings.generatorConfig(generatorConfig);
        REQUIRE(s.value() == oath::OATH_CC_InvalidConfig);
    }
    SECTION("mistyped field")
    {
        REQUIRE(settings.decode("{\"digits\": \"8\"}"));
        auto s = settings.generatorConfig(generatorConfig);
        REQUIRE(s.value() == oath::OATH_CC_JSONError);
    }
    SECTION("not an object")
    {
        REQUIRE(settings.decode("[8]"));
        auto s = settings.timeWindowConfig(windowConfig);
        REQUIRE(s.value() == oath::OATH_CC_JSONError);
    }
    SECTION("zero time step")
    {
        REQUIRE(settings.decode("{\"timeStep\": 0}"));
        auto s = settings.timeWindowConfig(windowConfig);
        REQUIRE(s.value() == oath::OATH_CC_InvalidConfig);
    }
    SECTION("negative epoch")
    {
        REQUIRE(settings.decode("{\"epoch\": -1}"));
        auto s = settings.timeWindowConfig(windowConfig);
        REQUIRE(s.value() == oath::OATH_CC_InvalidConfig);
    }
}

TEST_CASE("OTP settings files", "[otp][json][config]")
{
    char path[] = "/tmp/oath-settings-XXXXXX";
    int fd = mkstemp(path);
    REQUIRE(0 <= fd);
    close(fd);

    oath::TimeWindowConfig window;
    window.epoch = 100;
    window.timeStep = 15;

    oath::OtpSettingsJson out;
    REQUIRE(out.fromConfig(7, oath::HashAlgorithm::sha512, window));
    REQUIRE(out.save(path));

    oath::OtpSettingsJson in;
    REQUIRE(in.load(path));
    REQUIRE(in.digits() == 7);
    REQUIRE(in.algorithm() == std::string("SHA512"));

    oath::TimeWindowConfig loaded;
    REQUIRE(in.timeWindowConfig(loaded));
    REQUIRE(loaded.epoch == 100);
    REQUIRE(loaded.timeStep == 15);

    REQUIRE(oath::fileDelete(path));
    REQUIRE_FALSE(oath::fileExists(path));

    auto s = in.load(path);
    REQUIRE(s.value() == oath::OATH_CC_JSONError);
}
