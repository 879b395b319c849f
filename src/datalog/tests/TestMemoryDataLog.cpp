/**
 * @file TestMemoryDataLog.cpp
 * @brief Unit tests for the in-memory instrumentation log.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/datalog/MemoryDataLog.hpp>
#include <rlog/datalog/LogEntry.hpp>

using namespace rlog;

TEST_CASE("MemoryDataLog stores typed entries", "[datalog][memory]")
{
    datalog::MemoryDataLog log;

    datalog::DoubleLogEntry volts{log, "voltage-left", "Volt"};
    datalog::StringLogEntry state{log, "state"};

    REQUIRE(volts.append(1.0).has_value());
    REQUIRE(volts.append(2.5).has_value());
    REQUIRE(state.append("none").has_value());

    auto entry = log.entry("voltage-left");
    REQUIRE(entry.has_value());
    REQUIRE(entry->type == datalog::EntryType::kDouble);
    REQUIRE(entry->metadata == "Volt");
    REQUIRE(entry->doubles == std::vector<core::f64>{1.0, 2.5});
    REQUIRE(log.entry("state")->strings == std::vector<std::string>{"none"});
    REQUIRE(log.entryCount() == 2);
}

TEST_CASE("MemoryDataLog reuses an entry opened twice", "[datalog][memory]")
{
    datalog::MemoryDataLog log;

    const auto first = log.startEntry("position", datalog::EntryType::kDouble, "Meter");
    const auto second = log.startEntry("position", datalog::EntryType::kDouble, "Meter");

    REQUIRE(first == second);
    REQUIRE(log.entryCount() == 1);
    REQUIRE(log.entry("position")->opens == 2);
    REQUIRE(log.totalOpens() == 2);
}

TEST_CASE("MemoryDataLog append errors", "[datalog][memory]")
{
    datalog::MemoryDataLog log;
    const auto id = log.startEntry("state", datalog::EntryType::kString, "");

    SECTION("unknown entry")
    {
        auto result = log.appendDouble(id + 1, 1.0);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kNotFound);
    }

    SECTION("wrong type")
    {
        auto result = log.appendDouble(id, 1.0);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kTypeMismatch);
    }

    SECTION("missing name")
    {
        REQUIRE(log.entry("absent").error().code() == core::ErrorCode::kNotFound);
    }
}
