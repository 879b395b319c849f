/**
 * @file TestSysIdRoutineLog.cpp
 * @brief Unit tests for the sysid named counter streams.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/sysid/SysIdRoutineLog.hpp>
#include <rlog/datalog/MemoryDataLog.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace rlog;
using State = sysid::SysIdRoutineLog::State;

TEST_CASE("SysId state strings", "[sysid][state]")
{
    REQUIRE(std::string{sysid::toString(State::kQuasistaticForward)} == "quasistatic-forward");
    REQUIRE(std::string{sysid::toString(State::kQuasistaticReverse)} == "quasistatic-reverse");
    REQUIRE(std::string{sysid::toString(State::kDynamicForward)} == "dynamic-forward");
    REQUIRE(std::string{sysid::toString(State::kDynamicReverse)} == "dynamic-reverse");
    REQUIRE(std::string{sysid::toString(State::kNone)} == "none");
}

TEST_CASE("SysId streams are opened once", "[sysid][streams]")
{
    datalog::MemoryDataLog log;
    sysid::SysIdRoutineLog routine{"shooter", log};

    routine.motor("flywheel").value("voltage", 1.0, "Volt");
    routine.motor("flywheel").value("voltage", 2.0, "Volt");
    routine.motor("flywheel").value("voltage", 3.0, "Volt");

    auto entry = log.entry("voltage-flywheel-shooter");
    REQUIRE(entry.has_value());
    REQUIRE(entry->opens == 1);
    REQUIRE(entry->metadata == "Volt");
    REQUIRE(entry->doubles == std::vector<core::f64>{1.0, 2.0, 3.0});
    REQUIRE(log.totalOpens() == 1);
}

TEST_CASE("SysId typed helpers", "[sysid][streams]")
{
    datalog::MemoryDataLog log;
    sysid::SysIdRoutineLog routine{"arm", log};

    routine.motor("pivot")
        .voltage(4.0)
        .angularPosition(0.25)
        .angularVelocity(1.5)
        .angularAcceleration(3.0)
        .current(20.0);
    routine.motor("slide")
        .linearPosition(0.5)
        .linearVelocity(0.1)
        .linearAcceleration(0.2);

    REQUIRE(log.entry("voltage-pivot-arm")->metadata == "Volt");
    REQUIRE(log.entry("position-pivot-arm")->metadata == "Rotation");
    REQUIRE(log.entry("velocity-pivot-arm")->metadata == "Rotation per Second");
    REQUIRE(log.entry("acceleration-pivot-arm")->metadata == "Rotation per Second per Second");
    REQUIRE(log.entry("current-pivot-arm")->metadata == "Amp");
    REQUIRE(log.entry("position-slide-arm")->metadata == "Meter");
    REQUIRE(log.entry("velocity-slide-arm")->metadata == "Meter per Second");
    REQUIRE(log.entry("acceleration-slide-arm")->metadata == "Meter per Second per Second");
    REQUIRE(log.entryCount() == 8);
}

TEST_CASE("SysId state stream", "[sysid][state]")
{
    datalog::MemoryDataLog log;
    sysid::SysIdRoutineLog routine{"drive", log};

    REQUIRE_FALSE(log.entry(routine.stateEntryName()).has_value());

    routine.recordState(State::kQuasistaticForward);
    routine.recordState(State::kDynamicReverse);
    routine.recordState(State::kNone);

    auto entry = log.entry("sysid-test-state-drive");
    REQUIRE(entry.has_value());
    REQUIRE(entry->opens == 1);
    REQUIRE(entry->type == datalog::EntryType::kString);
    REQUIRE(entry->strings == std::vector<std::string>{"quasistatic-forward", "dynamic-reverse", "none"});
}

TEST_CASE("SysId stream creation from several threads", "[sysid][concurrency]")
{
    datalog::MemoryDataLog log;
    sysid::SysIdRoutineLog routine{"elevator", log};

    constexpr int kThreads = 4;
    constexpr int kSamples = 200;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&routine]()
        {
            for (int i = 0; i < kSamples; ++i)
            {
                routine.motor("lift").voltage(static_cast<core::f64>(i));
            }
        });
    }
    for (auto& worker : workers)
    {
        worker.join();
    }

    auto entry = log.entry("voltage-lift-elevator");
    REQUIRE(entry.has_value());
    REQUIRE(entry->opens == 1);
    REQUIRE(entry->doubles.size() == static_cast<core::usize>(kThreads * kSamples));
}
