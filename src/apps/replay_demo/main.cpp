// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Record/replay round trip on a scripted simulated driver station.
///
/// Records a run from SimHardwareSource while logging a sysid routine,
/// replays it without hardware and checks every logged table and every
/// sysid stream for divergence. Usage: rlog_replay_demo [cycles]
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/engine/Robot.hpp>
#include <rlog/engine/Config.hpp>
#include <rlog/logger/Logger.hpp>
#include <rlog/logger/LoggerConfig.hpp>
#include <rlog/serial/ReplayRecorder.hpp>
#include <rlog/serial/ReplayPlayer.hpp>
#include <rlog/hal/SimHardwareSource.hpp>
#include <rlog/hal/ControlWord.hpp>
#include <rlog/datalog/MemoryDataLog.hpp>
#include <rlog/sysid/SysIdRoutineLog.hpp>
#include <rlog/core/Log.hpp>
#include <rlog/core/Types.hpp>

#include <charconv>
#include <cstdio>
#include <cstring>
#include <string>

using namespace rlog;

namespace {

constexpr core::u64 kDefaultCycles = 100;

hal::SimJoystick makeGamepad(core::u32 buttonCount)
{
    hal::SimJoystick pad;
    pad.connected   = true;
    pad.name        = "Sim Gamepad";
    pad.type        = 1;
    pad.xbox        = true;
    pad.axisValues  = {0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
    pad.axisTypes   = {0, 1, 2, 3, 4, 5};
    pad.povs        = {-1};
    pad.buttonCount = buttonCount;
    return pad;
}

/// @brief Advances the simulated field state to @p cycle.
void script(hal::SimHardwareSource& hw, core::u64 cycle, core::u64 total)
{
    const bool autonomous = cycle < total / 2;

    hal::ControlWord word;
    word.enabled    = true;
    word.autonomous = autonomous;
    word.dsAttached = true;
    hw.setControlWord(hal::encodeControlWord(word));
    hw.setMatchTime(15.0 - static_cast<core::f64>(cycle) * 0.02);

    if (cycle == total / 2)
    {
        // Controller swap mid-match: 10 buttons become 12.
        if (auto r = hw.connectJoystick(0, makeGamepad(12)); !r)
        {
            core::Log::error("Demo", r.error().message());
        }
    }

    if (auto* pad = hw.joystick(0))
    {
        pad->axisValues[1] = static_cast<core::f32>(cycle % 20) / 20.0f;
        pad->buttons       = static_cast<core::u32>(cycle) & 0x7u;
    }
}

sysid::SysIdRoutineLog::State stateFor(core::u64 cycle, core::u64 total)
{
    using State = sysid::SysIdRoutineLog::State;
    const core::u64 quarter = total / 4 == 0 ? 1 : total / 4;
    switch (cycle / quarter)
    {
        case 0:  return State::kQuasistaticForward;
        case 1:  return State::kQuasistaticReverse;
        case 2:  return State::kDynamicForward;
        case 3:  return State::kDynamicReverse;
        default: return State::kNone;
    }
}

/// @brief User code: derives a motor command from the driver station only.
engine::Robot::PeriodicFn makeUserCode(sysid::SysIdRoutineLog& routine, core::u64 total)
{
    return [&routine, total](engine::Robot& robot)
    {
        auto& ds = robot.driverStation();
        const auto& pad = ds.joystick(0);

        const core::f64 throttle = pad.axisValues.size() > 1 ? pad.axisValues[1] : 0.0;
        const core::f64 volts = ds.isEnabled() ? throttle * 12.0 : 0.0;
        const core::u64 cycle = robot.logger().cycle();

        robot.logger().recordOutput("Drive/Voltage", volts);
        robot.logger().recordOutput("Drive/Autonomous", ds.isAutonomous());
        robot.logger().recordOutput("Drive/ButtonCount", static_cast<core::i64>(pad.buttons.size()));

        routine.motor("drive-left")
            .voltage(volts)
            .angularPosition(static_cast<core::f64>(cycle) * 0.1)
            .angularVelocity(throttle * 5.0)
            .current(volts * 0.5);
        routine.recordState(stateFor(cycle, total));
    };
}

core::u64 parseCycles(int argc, char* argv[])
{
    if (argc < 2)
    {
        return kDefaultCycles;
    }

    core::u64 cycles = 0;
    const char* begin = argv[1];
    const char* end = begin + std::strlen(begin);
    const auto [ptr, ec] = std::from_chars(begin, end, cycles);
    if (ec != std::errc{} || ptr != end || cycles == 0)
    {
        core::Log::warn("Demo", std::string{"invalid cycle count '"} + begin + "', using default");
        return kDefaultCycles;
    }
    return cycles;
}

/// @return Number of tables that differ between the two runs.
core::usize compareTables(const serial::ReplayRecorder& recorded,
                          const serial::ReplayRecorder& replayed)
{
    core::usize mismatches = 0;

    for (const auto& frame : recorded.frames())
    {
        for (const auto& [prefix, table] : frame.tables)
        {
            std::string replayPrefix = prefix;
            if (prefix == logger::Logger::kRealOutputsPrefix)
            {
                replayPrefix = std::string{logger::Logger::kReplayOutputsPrefix};
            }

            const auto* other = replayed.find(frame.cycle, replayPrefix);
            const core::u64 expected = table.hash();
            const core::u64 actual = other != nullptr ? other->hash() : 0;
            const bool ok = other != nullptr && expected == actual;
            if (!ok)
            {
                ++mismatches;
            }

            std::printf("  cycle %4llu  %-26s %016llx  %016llx  %s\n",
                        static_cast<unsigned long long>(frame.cycle),
                        prefix.c_str(),
                        static_cast<unsigned long long>(expected),
                        static_cast<unsigned long long>(actual),
                        ok ? "ok" : "DIVERGED");
        }
    }
    return mismatches;
}

core::usize compareStreams(const datalog::MemoryDataLog& recorded,
                           const datalog::MemoryDataLog& replayed,
                           const sysid::SysIdRoutineLog& routine)
{
    core::usize mismatches = 0;
    const std::string names[] = {
        routine.entryName("drive-left", "voltage"),
        routine.entryName("drive-left", "position"),
        routine.entryName("drive-left", "velocity"),
        routine.entryName("drive-left", "current"),
        routine.stateEntryName(),
    };

    for (const auto& name : names)
    {
        auto a = recorded.entry(name);
        auto b = replayed.entry(name);
        const bool ok = a && b && a->doubles == b->doubles && a->strings == b->strings;
        if (!ok)
        {
            ++mismatches;
        }
        std::printf("  stream %-40s %s\n", name.c_str(), ok ? "ok" : "DIVERGED");
    }
    return mismatches;
}

} // namespace

int main(int argc, char* argv[])
{
    core::Log::info("Demo", "=== rlog replay demo ===");

    const core::u64 cycles = parseCycles(argc, argv);
    const auto config = engine::Config::Builder{}
        .loopRate(core::kLoopRate)
        .maxCycles(cycles)
        .build();

    // Record ---------------------------------------------------------------

    hal::SimHardwareSource hardware;
    hardware.setAllianceStation(2);
    hardware.setEventName("SIM");
    hardware.setGameSpecificMessage("LRL");
    hardware.setMatchInfo(12, 0, 2);
    if (auto r = hardware.connectJoystick(0, makeGamepad(10)); !r)
    {
        core::Log::error("Demo", r.error().message());
        return 1;
    }

    script(hardware, 0, cycles);

    serial::ReplayRecorder recording;
    datalog::MemoryDataLog recordedStreams;
    {
        logger::Logger logger{logger::LoggerConfig::Builder{}.addSink(&recording).build()};
        sysid::SysIdRoutineLog routine{"demo", recordedStreams};
        engine::Robot robot{config, logger, &hardware};

        auto userCode = makeUserCode(routine, cycles);
        robot.run([&](engine::Robot& r)
        {
            userCode(r);
            script(hardware, logger.cycle() + 1, cycles);
        });
    }

    // Replay ---------------------------------------------------------------

    serial::ReplayPlayer player;
    if (auto r = player.load(recording); !r)
    {
        core::Log::error("Demo", r.error().message());
        return 1;
    }

    serial::ReplayRecorder replayed;
    datalog::MemoryDataLog replayedStreams;
    sysid::SysIdRoutineLog replayRoutine{"demo", replayedStreams};
    {
        logger::Logger logger{logger::LoggerConfig::Builder{}
            .replaySource(&player)
            .addSink(&replayed)
            .build()};
        engine::Robot robot{config, logger, nullptr};
        robot.run(makeUserCode(replayRoutine, cycles));
    }

    // Compare --------------------------------------------------------------

    std::printf("\n  %-10s %-26s %-16s  %-16s\n", "cycle", "prefix", "recorded", "replayed");
    const core::usize tableMismatches = compareTables(recording, replayed);
    const core::usize streamMismatches = compareStreams(recordedStreams, replayedStreams, replayRoutine);

    if (tableMismatches + streamMismatches != 0)
    {
        core::Log::error("Demo", "replay diverged: " + std::to_string(tableMismatches) +
                                 " tables, " + std::to_string(streamMismatches) + " streams");
        return 1;
    }

    core::Log::info("Demo", "replay matched " + std::to_string(recording.frameCount()) + " cycles");
    return 0;
}
