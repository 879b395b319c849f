// /////////////////////////////////////////////////////////////////////////////
/// @file ReplayRecorder.hpp
/// @brief Records the logged tables of every cycle for later replay.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/serial/ILogSink.hpp>
#include <rlog/log/LogTable.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/Expected.hpp>

#include <map>
#include <span>
#include <string>
#include <vector>

namespace rlog::serial {

/// @brief All tables logged during one cycle, keyed by prefix.
struct ReplayFrame
{
    core::u64 cycle{0};
    std::map<std::string, log::LogTable, std::less<>> tables;
};

/// @brief In-memory ILogSink keeping one ReplayFrame per cycle.
///
/// Cycles must arrive in non-decreasing order and a prefix may be written
/// only once per cycle.
class ReplayRecorder final : public ILogSink
{
public:
    ReplayRecorder();
    ~ReplayRecorder() override;

    ReplayRecorder(const ReplayRecorder&) = delete;
    ReplayRecorder& operator=(const ReplayRecorder&) = delete;
    ReplayRecorder(ReplayRecorder&&) noexcept = default;
    ReplayRecorder& operator=(ReplayRecorder&&) noexcept = default;

    // ILogSink ──────────────────────────────────────────────────────────────
    [[nodiscard]] core::Expected<void> putTable(
        core::u64 cycle, std::string_view prefix, const log::LogTable& table) override;

    /// @brief Total recorded frames.
    [[nodiscard]] core::usize frameCount() const noexcept;

    /// @brief Access a recorded frame by index.
    [[nodiscard]] const ReplayFrame& frame(core::usize index) const;

    /// @brief All recorded frames, in cycle order.
    [[nodiscard]] std::span<const ReplayFrame> frames() const noexcept;

    /// @brief Table logged under @p prefix at @p cycle, nullptr if none.
    [[nodiscard]] const log::LogTable* find(core::u64 cycle, std::string_view prefix) const;

    /// @brief Clear all recorded data.
    void clear() noexcept;

private:
    std::vector<ReplayFrame> frames_;
};

} // namespace rlog::serial
