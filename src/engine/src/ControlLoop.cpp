// /////////////////////////////////////////////////////////////////////////////
/// @file ControlLoop.cpp
/// @brief ControlLoop implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/engine/ControlLoop.hpp>
#include <rlog/core/Assert.hpp>
#include <rlog/core/Log.hpp>

#include <chrono>
#include <string>
#include <thread>

namespace rlog::engine {

ControlLoop::ControlLoop(const Config& config, bool paced)
    : period_{config.period()}
    , maxCycles_{config.maxCycles()}
    , paced_{paced}
{
    RLOG_VERIFY(config.loopRate() > 0);
}

ControlLoop::~ControlLoop() = default;

void ControlLoop::run(const LoopCallbacks& callbacks)
{
    RLOG_ASSERT(callbacks.user);
    running_ = true;
    cycleCount_ = 0;

    using Clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<core::f64>(period_));
    auto deadline = Clock::now() + period;

    while (running_)
    {
        if (maxCycles_ != 0 && cycleCount_ >= maxCycles_)
        {
            break;
        }

        if (callbacks.beforeUser)
        {
            callbacks.beforeUser();
        }

        if (callbacks.shouldStop && callbacks.shouldStop())
        {
            break;
        }

        callbacks.user();

        if (callbacks.afterUser)
        {
            callbacks.afterUser();
        }

        ++cycleCount_;

        if (paced_)
        {
            std::this_thread::sleep_until(deadline);
            deadline += period;
        }
    }

    running_ = false;
    core::Log::info("ControlLoop", "stopped after " + std::to_string(cycleCount_) + " cycles");
}

void ControlLoop::requestStop() noexcept
{
    running_ = false;
}

bool ControlLoop::isRunning() const noexcept
{
    return running_;
}

core::u64 ControlLoop::cycleCount() const noexcept
{
    return cycleCount_;
}

} // namespace rlog::engine
