/**
 * @file ControlLoop.hpp
 * @brief Fixed-rate cooperative control loop.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_ENGINE_CONTROLLOOP_HPP
    #define RLOG_ENGINE_CONTROLLOOP_HPP

#include <rlog/engine/Config.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/NonCopyable.hpp>

#include <functional>

namespace rlog::engine {

/** @brief Callbacks the control loop invokes each cycle, in field order. */
struct LoopCallbacks
{
    /** @brief Start of cycle (logger bookkeeping). */
    std::function<void()> beforeUser;

    /** @brief Consulted after beforeUser; true ends the loop before user code runs. */
    std::function<bool()> shouldStop;

    /** @brief Subsystem updates and user periodic code. Required. */
    std::function<void()> user;

    /** @brief End of cycle (output flush, cycle advance). */
    std::function<void()> afterUser;
};

/** @brief Runs capture cycles back to back or paced to the loop period. */
class ControlLoop final : public core::NonCopyable<ControlLoop>
{
public:
    /**
     * @param config Provides the loop rate and the cycle limit.
     * @param paced  Sleep until the next period boundary between cycles.
     */
    ControlLoop(const Config& config, bool paced);
    ~ControlLoop();

    /**
     * @brief Run cycles until a stop is requested, shouldStop returns true
     *        or the configured cycle limit is reached.
     */
    void run(const LoopCallbacks& callbacks);

    /** @brief Request termination after the current cycle. */
    void requestStop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /** @brief Cycles completed since run() was called. */
    [[nodiscard]] core::u64 cycleCount() const noexcept;

private:
    core::f64 period_;
    core::u64 maxCycles_;
    bool      paced_;
    bool      running_{false};
    core::u64 cycleCount_{0};
};

} // namespace rlog::engine

#endif // RLOG_ENGINE_CONTROLLOOP_HPP
