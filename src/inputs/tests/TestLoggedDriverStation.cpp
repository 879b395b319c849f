/**
 * @file TestLoggedDriverStation.cpp
 * @brief Record and replay tests for the driver station subsystem.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/inputs/LoggedDriverStation.hpp>
#include <rlog/logger/Logger.hpp>
#include <rlog/logger/LoggerConfig.hpp>
#include <rlog/serial/ReplayRecorder.hpp>
#include <rlog/serial/ReplayPlayer.hpp>
#include <rlog/hal/SimHardwareSource.hpp>
#include <rlog/hal/ControlWord.hpp>

using namespace rlog;

namespace {

hal::SimJoystick makeGamepad()
{
    hal::SimJoystick pad;
    pad.name        = "Xbox Controller";
    pad.type        = 1;
    pad.xbox        = true;
    pad.axisValues  = {0.5f, -0.25f};
    pad.axisTypes   = {0, 1};
    pad.povs        = {0};
    pad.buttons     = 0b1001;
    pad.buttonCount = 4;
    return pad;
}

void cycle(logger::Logger& logger, inputs::LoggedDriverStation& ds)
{
    logger.periodicBeforeUser();
    ds.periodic();
    logger.periodicAfterUser();
}

} // namespace

TEST_CASE("LoggedDriverStation prefixes", "[inputs][loggedds]")
{
    REQUIRE(inputs::LoggedDriverStation::kPrefix == "DriverStation");
    REQUIRE(inputs::LoggedDriverStation::joystickPrefix(0) == "DriverStation/Joystick0");
    REQUIRE(inputs::LoggedDriverStation::joystickPrefix(5) == "DriverStation/Joystick5");
}

TEST_CASE("LoggedDriverStation reads and records hardware", "[inputs][loggedds]")
{
    hal::SimHardwareSource hw;
    hw.setAllianceStation(1);
    hw.setEventName("SIM");
    hw.setMatchTime(12.0);
    hw.setControlWord(37);
    REQUIRE(hw.connectJoystick(0, makeGamepad()).has_value());

    serial::ReplayRecorder recorder;
    logger::Logger logger{logger::LoggerConfig::Builder{}.addSink(&recorder).build()};
    inputs::LoggedDriverStation ds{logger, &hw};

    cycle(logger, ds);

    SECTION("accessors reflect the control word")
    {
        REQUIRE(ds.isEnabled());
        REQUIRE(ds.isTest());
        REQUIRE(ds.isDSAttached());
        REQUIRE_FALSE(ds.isAutonomous());
        REQUIRE_FALSE(ds.isEStopped());
        REQUIRE_FALSE(ds.isFMSAttached());
        REQUIRE(ds.allianceStation() == 1);
        REQUIRE_THAT(ds.matchTime(), Catch::Matchers::WithinAbs(12.0, 1e-12));
    }

    SECTION("buttons are unpacked from the mask")
    {
        const auto& pad = ds.joystick(0);
        REQUIRE(pad.buttons == std::vector<bool>{true, false, false, true});
        REQUIRE(pad.xbox);
        REQUIRE_THAT(pad.axisValues[0], Catch::Matchers::WithinAbs(0.5, 1e-6));
    }

    SECTION("disconnected ports are empty")
    {
        const auto& pad = ds.joystick(3);
        REQUIRE(pad.name.empty());
        REQUIRE(pad.type == 0);
        REQUIRE(pad.buttons.empty());
        REQUIRE(pad.axisValues.empty());
        REQUIRE(pad.povs.empty());
    }

    SECTION("one table per prefix per cycle")
    {
        REQUIRE(recorder.frameCount() == 1);
        REQUIRE(recorder.frame(0).tables.size() == 1 + core::kJoystickPorts);
        const auto* table = recorder.find(0, "DriverStation/Joystick0");
        REQUIRE(table != nullptr);
        REQUIRE(table->getString("Name", "") == "Xbox Controller");
    }
}

TEST_CASE("LoggedDriverStation replays without hardware", "[inputs][loggedds]")
{
    hal::SimHardwareSource hw;
    hw.setControlWord(hal::kEnabledBit | hal::kAutonomousBit);
    REQUIRE(hw.connectJoystick(1, makeGamepad()).has_value());

    serial::ReplayRecorder recorder;
    {
        logger::Logger logger{logger::LoggerConfig::Builder{}.addSink(&recorder).build()};
        inputs::LoggedDriverStation ds{logger, &hw};
        cycle(logger, ds);

        hw.setControlWord(0);
        hw.disconnectJoystick(1);
        cycle(logger, ds);
    }

    serial::ReplayPlayer player;
    REQUIRE(player.load(recorder).has_value());
    logger::Logger logger{logger::LoggerConfig::Builder{}.replaySource(&player).build()};
    inputs::LoggedDriverStation ds{logger, nullptr};

    cycle(logger, ds);
    REQUIRE(ds.isEnabled());
    REQUIRE(ds.isAutonomous());
    REQUIRE(ds.joystick(1).buttons.size() == 4);

    cycle(logger, ds);
    REQUIRE_FALSE(ds.isEnabled());
    REQUIRE(ds.joystick(1).buttons.empty());
    REQUIRE(ds.joystick(1).name.empty());
}
