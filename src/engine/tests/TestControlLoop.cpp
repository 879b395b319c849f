/**
 * @file TestControlLoop.cpp
 * @brief Unit tests for the control loop and its configuration.
 *
 * @version 0.1.0
 * @copyright MIT License
 */

#include <catch2/catch.hpp>

#include <rlog/engine/ControlLoop.hpp>
#include <rlog/engine/Config.hpp>

#include <string>

using namespace rlog;

TEST_CASE("Config builder", "[engine][config]")
{
    SECTION("defaults")
    {
        const auto config = engine::Config::Builder{}.build();
        REQUIRE(config.loopRate() == core::kLoopRate);
        REQUIRE(config.maxCycles() == 0);
        REQUIRE_FALSE(config.realTime());
        REQUIRE_THAT(config.period(), Catch::Matchers::WithinAbs(0.02, 1e-12));
    }

    SECTION("overrides")
    {
        const auto config = engine::Config::Builder{}.loopRate(100).maxCycles(7).realTime(true).build();
        REQUIRE(config.loopRate() == 100);
        REQUIRE(config.maxCycles() == 7);
        REQUIRE(config.realTime());
    }
}

TEST_CASE("ControlLoop calls back in cycle order", "[engine][loop]")
{
    engine::ControlLoop loop{engine::Config::Builder{}.maxCycles(3).build(), false};

    std::string trace;
    engine::LoopCallbacks callbacks;
    callbacks.beforeUser = [&]() { trace += 'b'; };
    callbacks.user       = [&]() { trace += 'u'; };
    callbacks.afterUser  = [&]() { trace += 'a'; };

    loop.run(callbacks);

    REQUIRE(trace == "buabuabua");
    REQUIRE(loop.cycleCount() == 3);
    REQUIRE_FALSE(loop.isRunning());
}

TEST_CASE("ControlLoop stops early", "[engine][loop]")
{
    engine::ControlLoop loop{engine::Config::Builder{}.build(), false};
    int userCalls = 0;

    SECTION("shouldStop skips the user step")
    {
        int before = 0;
        engine::LoopCallbacks callbacks;
        callbacks.beforeUser = [&]() { ++before; };
        callbacks.shouldStop = [&]() { return before > 2; };
        callbacks.user       = [&]() { ++userCalls; };

        loop.run(callbacks);
        REQUIRE(before == 3);
        REQUIRE(userCalls == 2);
        REQUIRE(loop.cycleCount() == 2);
    }

    SECTION("requestStop ends after the current cycle")
    {
        engine::LoopCallbacks callbacks;
        callbacks.user = [&]()
        {
            if (++userCalls == 5)
            {
                loop.requestStop();
            }
        };

        loop.run(callbacks);
        REQUIRE(userCalls == 5);
        REQUIRE(loop.cycleCount() == 5);
    }
}
