/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../oath/util/Debug.hpp"
#include "../oath/util/FileIO.hpp"
#include "../oath/util/Util.hpp"
#include <catch.hpp>
#include <sstream>
#include <stdlib.h>
#include <unistd.h>

TEST_CASE("Status reporting", "[util][status]")
{
    oath::Status ok;
    REQUIRE(ok);
    REQUIRE(ok.value() == oath::OATH_CC_Ok);

    auto error = OATH_ERROR(oath::OATH_CC_ParseError, "bad input");
    REQUIRE_FALSE(error);
    REQUIRE(error.message() == "bad input");
    REQUIRE(error.line() != 0);

    std::stringstream ss;
    ss << error;
    REQUIRE(ss.str().find("returned error 6 (bad input)") != std::string::npos);

    struct Checker
    {
        static oath::Status
        propagate(oath::Status inner, bool &reached)
        {
            OATH_CHECK(inner);
            reached = true;
            return oath::Status();
        }
    };
    bool reached = false;
    REQUIRE(Checker::propagate(ok, reached));
    REQUIRE(reached);

    reached = false;
    auto s = Checker::propagate(error, reached);
    REQUIRE(s.value() == oath::OATH_CC_ParseError);
    REQUIRE_FALSE(reached);
}

TEST_CASE("Data wiping", "[util]")
{
    oath::DataChunk data(32, 0xaa);
    oath::guaranteedMemset(data.data(), 0, data.size());
    REQUIRE(data == oath::DataChunk(32, 0));

    oath::dataWipe(data);
    REQUIRE(data.empty());
}

TEST_CASE("File access", "[util][file]")
{
    char path[] = "/tmp/oath-file-XXXXXX";
    int fd = mkstemp(path);
    REQUIRE(0 <= fd);
    close(fd);

    REQUIRE(oath::fileSave(std::string("payload"), path));
    oath::DataChunk data;
    REQUIRE(oath::fileLoad(data, path));
    REQUIRE(oath::toString(data) == "payload");

    REQUIRE(oath::fileDelete(path));
    REQUIRE(oath::fileDelete(path));
    auto s = oath::fileLoad(data, path);
    REQUIRE(s.value() == oath::OATH_CC_FileOpenError);
    REQUIRE(oath::toString(data) == "payload");
}

TEST_CASE("Debug log file", "[util][debug]")
{
    char path[] = "/tmp/oath-log-XXXXXX";
    int fd = mkstemp(path);
    REQUIRE(0 <= fd);
    close(fd);

    REQUIRE(oath::debugInitialize(path));
    oath::OATH_DebugLog("hello %d", 42);
    auto log = oath::toString(oath::debugLogLoad());
    oath::debugTerminate();

#ifdef DEBUG
    REQUIRE(log.find("OATH_Log: hello 42\n") != std::string::npos);
#else
    REQUIRE(log.empty());
#endif

    oath::fileDelete(path).log();
    oath::fileDelete(std::string(path) + ".prev").log();
}
