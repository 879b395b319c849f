// /////////////////////////////////////////////////////////////////////////////
/// @file Robot.cpp
/// @brief Robot façade implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/engine/Robot.hpp>
#include <rlog/engine/ControlLoop.hpp>
#include <rlog/core/Log.hpp>

#include <utility>

namespace rlog::engine {

struct Robot::Impl
{
    Config config;
    logger::Logger& logger;
    inputs::LoggedDriverStation driverStation;
    ControlLoop loop;

    Impl(Config cfg, logger::Logger& log, const hal::IHardwareSource* hardware)
        : config{std::move(cfg)}
        , logger{log}
        , driverStation{log, hardware}
        , loop{config, config.realTime() && !log.hasReplaySource()}
    {
    }
};

Robot::Robot(Config config, logger::Logger& logger, const hal::IHardwareSource* hardware)
    : impl_{std::make_unique<Impl>(std::move(config), logger, hardware)}
{
}

Robot::~Robot() = default;

void Robot::run(PeriodicFn periodic)
{
    core::Log::info("Robot", impl_->logger.hasReplaySource() ? "starting replay" : "starting");

    LoopCallbacks callbacks;

    callbacks.beforeUser = [this]()
    {
        impl_->logger.periodicBeforeUser();
    };

    callbacks.shouldStop = [this]()
    {
        return impl_->logger.replayFinished();
    };

    callbacks.user = [this, &periodic]()
    {
        impl_->driverStation.periodic();
        if (periodic)
        {
            periodic(*this);
        }
    };

    callbacks.afterUser = [this]()
    {
        impl_->logger.periodicAfterUser();
    };

    impl_->loop.run(callbacks);
}

void Robot::requestShutdown() noexcept
{
    impl_->loop.requestStop();
}

logger::Logger& Robot::logger() noexcept
{
    return impl_->logger;
}

inputs::LoggedDriverStation& Robot::driverStation() noexcept
{
    return impl_->driverStation;
}

const Config& Robot::config() const noexcept
{
    return impl_->config;
}

core::u64 Robot::cycleCount() const noexcept
{
    return impl_->loop.cycleCount();
}

} // namespace rlog::engine
