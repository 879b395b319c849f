/**
 * @file TestKeyTypeRegistry.cpp
 * @brief Unit tests for cross-cycle key type tracking.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/logger/KeyTypeRegistry.hpp>

using namespace rlog;

TEST_CASE("KeyTypeRegistry accepts stable types", "[logger][keytypes]")
{
    logger::KeyTypeRegistry registry;

    log::LogTable table;
    table.put("MatchTime", 10.0);
    table.put("Enabled", true);

    REQUIRE(registry.check("DriverStation", table).has_value());
    REQUIRE(registry.size() == 2);

    table.put("MatchTime", 9.98);
    REQUIRE(registry.check("DriverStation", table).has_value());
    REQUIRE(registry.typeOf("DriverStation/MatchTime").value() == log::LogType::kDouble);
}

TEST_CASE("KeyTypeRegistry rejects a key that changes type", "[logger][keytypes]")
{
    logger::KeyTypeRegistry registry;

    log::LogTable first;
    first.put("Value", core::i64{1});
    REQUIRE(registry.check("Sensor", first).has_value());

    log::LogTable second;
    second.put("Other", true);
    second.put("Value", 1.0);

    auto result = registry.check("Sensor", second);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kTypeMismatch);

    // A rejected table registers nothing.
    REQUIRE_FALSE(registry.typeOf("Sensor/Other").has_value());
    REQUIRE(registry.typeOf("Sensor/Value").value() == log::LogType::kInteger);
}

TEST_CASE("KeyTypeRegistry scopes keys by prefix", "[logger][keytypes]")
{
    logger::KeyTypeRegistry registry;

    log::LogTable a;
    a.put("Name", "pad");
    log::LogTable b;
    b.put("Name", core::i64{3});

    REQUIRE(registry.check("DriverStation/Joystick0", a).has_value());
    REQUIRE(registry.check("DriverStation/Joystick1", b).has_value());
    REQUIRE(logger::KeyTypeRegistry::fullKey("A", "B") == "A/B");

    registry.clear();
    REQUIRE(registry.size() == 0);
}
