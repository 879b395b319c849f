// /////////////////////////////////////////////////////////////////////////////
/// @file Logger.hpp
/// @brief Per-cycle record/replay dispatcher.
///
/// Decides, for every input bundle of every cycle, whether the bundle is
/// serialised to the log (record mode) or restored from the replay source
/// (replay mode). Exactly one Logger exists per program; subsystems receive
/// it by reference at construction.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/logger/LoggerConfig.hpp>
#include <rlog/log/ILoggableInputs.hpp>
#include <rlog/log/LogTable.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/NonCopyable.hpp>

#include <memory>
#include <string_view>
#include <utility>

namespace rlog::logger {

// /////////////////////////////////////////////////////////////////////////////
/// @class Logger
/// @brief Owns the replay flag, the cycle index and the table lifecycle.
///
/// The mode is fixed by the configuration at construction and cannot be
/// changed during the run.
///
/// Cycle protocol, driven by the control loop:
///   periodicBeforeUser()  ->  processInputs(...) for every bundle
///   ->  user code (recordOutput(...))  ->  periodicAfterUser()
// /////////////////////////////////////////////////////////////////////////////
class Logger final : public core::NonCopyable<Logger>
{
public:
    static constexpr std::string_view kRealOutputsPrefix   = "RealOutputs";
    static constexpr std::string_view kReplayOutputsPrefix = "ReplayOutputs";

    explicit Logger(LoggerConfig config);
    ~Logger();

    /// @brief True when values come from a replay source instead of hardware.
    [[nodiscard]] bool hasReplaySource() const noexcept;

    /// @brief Index of the cycle currently being processed.
    [[nodiscard]] core::u64 cycle() const noexcept;

    /// @brief True once the replay source has no data for the current cycle.
    [[nodiscard]] bool replayFinished() const noexcept;

    /// @brief Record or replay one input bundle for the current cycle.
    ///
    /// Record mode: @p inputs must already hold this cycle's hardware values;
    /// they are serialised and handed to every sink. Replay mode: the table
    /// recorded under @p prefix for this cycle is restored into @p inputs.
    void processInputs(std::string_view prefix, log::ILoggableInputs& inputs);

    /// @brief Log a value computed by user code. Outputs are never replayed.
    template <typename T>
    void recordOutput(std::string_view key, T&& value)
    {
        outputs().put(key, std::forward<T>(value));
    }

    /// @brief Start of a cycle; detects the end of a replay.
    void periodicBeforeUser();

    /// @brief End of a cycle; flushes outputs and advances the cycle index.
    void periodicAfterUser();

private:
    [[nodiscard]] log::LogTable& outputs() noexcept;
    void dispatch(std::string_view prefix, const log::LogTable& table);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rlog::logger
