/**
 * @file TestLogger.cpp
 * @brief Unit tests for the record/replay dispatcher.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/logger/Logger.hpp>
#include <rlog/logger/LoggerConfig.hpp>
#include <rlog/serial/ReplayRecorder.hpp>
#include <rlog/serial/ReplayPlayer.hpp>
#include <rlog/core/Log.hpp>

#include <string>
#include <vector>

using namespace rlog;

namespace {

struct SensorInputs final : public log::ILoggableInputs
{
    core::f64 position{0.0};
    core::i64 ticks{0};
    std::vector<core::f64> samples;

    void toLog(log::LogTable& table) const override
    {
        table.put("Position", position);
        table.put("Ticks", ticks);
        table.put("Samples", samples);
    }

    void fromLog(const log::LogTable& table) override
    {
        position = table.getDouble("Position", position);
        ticks    = table.getInteger("Ticks", ticks);
        samples  = table.getDoubleArray("Samples", samples);
    }
};

class RejectingSink final : public serial::ILogSink
{
public:
    core::Expected<void> putTable(core::u64, std::string_view, const log::LogTable&) override
    {
        ++calls;
        return core::makeError(core::ErrorCode::kSinkRejected, "disk full");
    }

    int calls{0};
};

class CapturingLogger final : public core::ILogger
{
public:
    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        if (level == core::LogLevel::kWarn)
        {
            warnings.emplace_back(std::string{tag} + ": " + std::string{message});
        }
    }

    std::vector<std::string> warnings;
};

void runCycle(logger::Logger& logger, SensorInputs& inputs)
{
    logger.periodicBeforeUser();
    logger.processInputs("Sensor", inputs);
    logger.periodicAfterUser();
}

} // namespace

TEST_CASE("Logger records inputs to every sink", "[logger][record]")
{
    serial::ReplayRecorder first;
    serial::ReplayRecorder second;
    logger::Logger logger{logger::LoggerConfig::Builder{}.addSink(&first).addSink(&second).build()};

    REQUIRE_FALSE(logger.hasReplaySource());

    SensorInputs inputs;
    inputs.position = 1.5;
    inputs.ticks = 42;
    inputs.samples = {0.1, 0.2};
    runCycle(logger, inputs);

    inputs.ticks = 43;
    runCycle(logger, inputs);

    REQUIRE(logger.cycle() == 2);
    REQUIRE(first.frameCount() == 2);
    REQUIRE(second.frameCount() == 2);

    const auto* table = first.find(1, "Sensor");
    REQUIRE(table != nullptr);
    REQUIRE(table->getInteger("Ticks", 0) == 43);
    REQUIRE(table->getDoubleArray("Samples", {}).size() == 2);

    // Record mode leaves the caller's values untouched.
    REQUIRE(inputs.ticks == 43);
}

TEST_CASE("Logger replays recorded inputs", "[logger][replay]")
{
    serial::ReplayRecorder recorder;
    {
        logger::Logger logger{logger::LoggerConfig::Builder{}.addSink(&recorder).build()};
        SensorInputs live;
        for (core::i64 i = 0; i < 3; ++i)
        {
            live.ticks = i * 10;
            live.position = static_cast<core::f64>(i) * 0.5;
            runCycle(logger, live);
        }
    }

    serial::ReplayPlayer player;
    REQUIRE(player.load(recorder).has_value());

    serial::ReplayRecorder replayed;
    logger::Logger logger{logger::LoggerConfig::Builder{}.replaySource(&player).addSink(&replayed).build()};
    REQUIRE(logger.hasReplaySource());

    SensorInputs restored;
    for (core::u64 cycle = 0; cycle < 3; ++cycle)
    {
        logger.periodicBeforeUser();
        REQUIRE_FALSE(logger.replayFinished());
        logger.processInputs("Sensor", restored);

        REQUIRE(restored.ticks == static_cast<core::i64>(cycle) * 10);
        REQUIRE_THAT(restored.position, Catch::Matchers::WithinAbs(static_cast<core::f64>(cycle) * 0.5, 1e-12));
        REQUIRE(replayed.find(cycle, "Sensor")->hash() == recorder.find(cycle, "Sensor")->hash());

        logger.periodicAfterUser();
    }

    logger.periodicBeforeUser();
    REQUIRE(logger.replayFinished());
}

TEST_CASE("Logger replay keeps fields missing from the log", "[logger][replay]")
{
    serial::ReplayRecorder recorder;
    log::LogTable partial;
    partial.put("Ticks", core::i64{7});
    REQUIRE(recorder.putTable(0, "Sensor", partial).has_value());

    serial::ReplayPlayer player;
    REQUIRE(player.load(recorder).has_value());
    logger::Logger logger{logger::LoggerConfig::Builder{}.replaySource(&player).build()};

    SensorInputs inputs;
    inputs.position = 9.75;
    inputs.samples = {1.0, 2.0, 3.0};

    logger.periodicBeforeUser();
    logger.processInputs("Sensor", inputs);
    logger.processInputs("Unrecorded", inputs);

    REQUIRE(inputs.ticks == 7);
    REQUIRE_THAT(inputs.position, Catch::Matchers::WithinAbs(9.75, 1e-12));
    REQUIRE(inputs.samples == std::vector<core::f64>{1.0, 2.0, 3.0});
}

TEST_CASE("Logger keeps running when a sink fails", "[logger][sink]")
{
    CapturingLogger capture;
    core::Log::setLogger(&capture);

    RejectingSink rejecting;
    serial::ReplayRecorder recorder;
    logger::Logger logger{logger::LoggerConfig::Builder{}.addSink(&rejecting).addSink(&recorder).build()};

    SensorInputs inputs;
    inputs.ticks = 5;
    runCycle(logger, inputs);

    core::Log::setLogger(nullptr);

    REQUIRE(rejecting.calls == 1);
    REQUIRE(recorder.find(0, "Sensor") != nullptr);
    REQUIRE(capture.warnings.size() == 1);
    REQUIRE(capture.warnings.front().find("disk full") != std::string::npos);
}

TEST_CASE("Logger outputs", "[logger][outputs]")
{
    serial::ReplayRecorder recorder;

    SECTION("record mode writes RealOutputs")
    {
        logger::Logger logger{logger::LoggerConfig::Builder{}.addSink(&recorder).build()};
        logger.periodicBeforeUser();
        logger.recordOutput("Drive/Voltage", 6.0);
        logger.recordOutput("Drive/Mode", "auto");
        logger.periodicAfterUser();

        const auto* outputs = recorder.find(0, logger::Logger::kRealOutputsPrefix);
        REQUIRE(outputs != nullptr);
        REQUIRE(outputs->size() == 2);
        REQUIRE(outputs->getString("Drive/Mode", "") == "auto");

        // Outputs are cleared between cycles; an idle cycle writes nothing.
        logger.periodicBeforeUser();
        logger.periodicAfterUser();
        REQUIRE(recorder.find(1, logger::Logger::kRealOutputsPrefix) == nullptr);
    }

    SECTION("replay mode writes ReplayOutputs")
    {
        log::LogTable inputs;
        inputs.put("Ticks", core::i64{1});
        serial::ReplayRecorder source;
        REQUIRE(source.putTable(0, "Sensor", inputs).has_value());
        serial::ReplayPlayer player;
        REQUIRE(player.load(source).has_value());

        logger::Logger logger{logger::LoggerConfig::Builder{}.replaySource(&player).addSink(&recorder).build()};
        logger.periodicBeforeUser();
        logger.recordOutput("Drive/Voltage", 6.0);
        logger.periodicAfterUser();

        REQUIRE(recorder.find(0, logger::Logger::kReplayOutputsPrefix) != nullptr);
        REQUIRE(recorder.find(0, logger::Logger::kRealOutputsPrefix) == nullptr);
    }
}
