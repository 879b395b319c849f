/**
 * @file TestControlWord.cpp
 * @brief Unit tests for control word decoding.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/hal/ControlWord.hpp>

using namespace rlog;

TEST_CASE("Control word 37 decodes to enabled, test and DS attached", "[hal][controlword]")
{
    const auto cw = hal::decodeControlWord(37);

    REQUIRE(cw.enabled);
    REQUIRE_FALSE(cw.autonomous);
    REQUIRE(cw.test);
    REQUIRE_FALSE(cw.emergencyStop);
    REQUIRE_FALSE(cw.fmsAttached);
    REQUIRE(cw.dsAttached);
}

TEST_CASE("Control word bit positions", "[hal][controlword]")
{
    SECTION("zero is all false")
    {
        REQUIRE(hal::decodeControlWord(0) == hal::ControlWord{});
    }

    SECTION("each bit maps to one flag")
    {
        REQUIRE(hal::decodeControlWord(1u << 1).autonomous);
        REQUIRE(hal::decodeControlWord(1u << 3).emergencyStop);
        REQUIRE(hal::decodeControlWord(1u << 4).fmsAttached);
    }

    SECTION("bits above 5 are ignored")
    {
        REQUIRE(hal::decodeControlWord(0xFFFFFFC0u) == hal::ControlWord{});
    }

    SECTION("encode inverts decode")
    {
        for (core::u32 word = 0; word < 64; ++word)
        {
            REQUIRE(hal::encodeControlWord(hal::decodeControlWord(word)) == word);
        }
    }
}
