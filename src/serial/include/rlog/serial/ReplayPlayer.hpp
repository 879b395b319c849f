// /////////////////////////////////////////////////////////////////////////////
/// @file ReplayPlayer.hpp
/// @brief Deterministic replay source over recorded frames.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/serial/IReplaySource.hpp>
#include <rlog/serial/ReplayRecorder.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/Expected.hpp>

#include <memory>
#include <span>
#include <string_view>

namespace rlog::serial {

/// @brief Serves recorded tables back to the Logger during replay.
///
/// Frames are copied on load; the player never changes afterwards, which is
/// what makes every fetch() for the same address return the same table.
class ReplayPlayer final : public IReplaySource
{
public:
    ReplayPlayer();
    ~ReplayPlayer() override;

    ReplayPlayer(const ReplayPlayer&) = delete;
    ReplayPlayer& operator=(const ReplayPlayer&) = delete;

    /// @brief Load a recorded session, replacing any previous one.
    /// @param frames Frames with strictly increasing cycle numbers.
    /// @return Success, or kInvalidArgument if the cycles are not ordered.
    [[nodiscard]] core::Expected<void> load(std::span<const ReplayFrame> frames);

    /// @brief Load everything a recorder captured.
    [[nodiscard]] core::Expected<void> load(const ReplayRecorder& recorder);

    // IReplaySource ─────────────────────────────────────────────────────────
    [[nodiscard]] log::LogTable fetch(std::string_view prefix, core::u64 cycle) const override;
    [[nodiscard]] bool hasCycle(core::u64 cycle) const override;

    /// @brief Total number of frames in the loaded session.
    [[nodiscard]] core::usize totalFrames() const noexcept;

    /// @brief Last cycle of the session, kNotFound if nothing is loaded.
    [[nodiscard]] core::Expected<core::u64> lastCycle() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rlog::serial
