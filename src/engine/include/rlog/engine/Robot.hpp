// /////////////////////////////////////////////////////////////////////////////
/// @file Robot.hpp
/// @brief Top-level robot program façade.
///
/// Wires the logger, the driver station subsystem and the control loop
/// together and runs the per-cycle protocol in the right order.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/engine/Config.hpp>
#include <rlog/inputs/LoggedDriverStation.hpp>
#include <rlog/logger/Logger.hpp>
#include <rlog/hal/IHardwareSource.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/NonCopyable.hpp>

#include <functional>
#include <memory>

namespace rlog::engine {

/// @brief Owns the driver station subsystem and the control loop.
///
/// Each cycle runs logger.periodicBeforeUser(), driverStation().periodic(),
/// the user periodic callback, then logger.periodicAfterUser(). In replay
/// mode the program stops once the replay source has no more cycles.
class Robot final : public core::NonCopyable<Robot>
{
public:
    using PeriodicFn = std::function<void(Robot&)>;

    /// @param config   Loop rate, cycle limit and pacing.
    /// @param logger   Must outlive the robot.
    /// @param hardware Live source; may be null when the logger replays.
    Robot(Config config, logger::Logger& logger, const hal::IHardwareSource* hardware);
    ~Robot();

    /// @brief Run the control loop (blocks until it stops).
    /// @param periodic User code executed once per cycle; may be empty.
    void run(PeriodicFn periodic);

    /// @brief Request graceful shutdown after the current cycle.
    void requestShutdown() noexcept;

    [[nodiscard]] logger::Logger& logger() noexcept;
    [[nodiscard]] inputs::LoggedDriverStation& driverStation() noexcept;
    [[nodiscard]] const Config& config() const noexcept;

    /// @brief Cycles completed by the last run().
    [[nodiscard]] core::u64 cycleCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rlog::engine
