/**
 * @file TestExpected.cpp
 * @brief Unit tests for Error, Expected and the RLOG_TRY macros.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/core/Expected.hpp>

#include <string>

using namespace rlog;

namespace {

core::ExpectedVoid requireValid(int raw)
{
    if (raw < 0 || raw > 5)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "port " + std::to_string(raw));
    }
    return {};
}

core::Expected<int> parsePort(int raw)
{
    RLOG_TRY_VOID(requireValid(raw));
    return raw;
}

core::Expected<int> doubledPort(int raw)
{
    const int port = RLOG_TRY(parsePort(raw));
    return port * 2;
}

core::ExpectedVoid checkPort(int raw)
{
    RLOG_TRY_VOID(requireValid(raw));
    return {};
}

} // namespace

TEST_CASE("RLOG_TRY propagates errors", "[core][expected]")
{
    SECTION("value path")
    {
        auto result = doubledPort(2);
        REQUIRE(result.has_value());
        REQUIRE(result.value() == 4);
        REQUIRE(checkPort(3).has_value());
    }

    SECTION("error path")
    {
        auto result = doubledPort(9);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kOutOfRange);
        REQUIRE(result.error().message() == "port 9");
        REQUIRE(checkPort(-1).error().code() == core::ErrorCode::kOutOfRange);
    }
}

TEST_CASE("ErrorCode names", "[core][error]")
{
    REQUIRE(std::string{core::toString(core::ErrorCode::kTypeMismatch)} == "TypeMismatch");
    REQUIRE(std::string{core::toString(core::ErrorCode::kSinkRejected)} == "SinkRejected");
}
