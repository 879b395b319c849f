// /////////////////////////////////////////////////////////////////////////////
/// @file ILogSink.hpp
/// @brief Destination of the per-cycle logged tables.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/log/LogTable.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/Expected.hpp>

#include <string_view>

namespace rlog::serial {

/// @brief Receives one table per prefix per cycle, in cycle order.
///
/// The prefix and the table keys together form the persisted key names,
/// so they must stay stable between the recording and any later replay.
class ILogSink
{
public:
    virtual ~ILogSink() = default;

    /// @brief Store @p table under @p prefix for @p cycle.
    /// @return Success or a sink-specific error; the caller keeps running.
    [[nodiscard]] virtual core::Expected<void> putTable(
        core::u64 cycle, std::string_view prefix, const log::LogTable& table) = 0;
};

} // namespace rlog::serial
