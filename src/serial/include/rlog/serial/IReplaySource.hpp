// /////////////////////////////////////////////////////////////////////////////
/// @file IReplaySource.hpp
/// @brief Previously recorded tables addressed by (prefix, cycle).
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/log/LogTable.hpp>
#include <rlog/core/Types.hpp>

#include <string_view>

namespace rlog::serial {

/// @brief Read side of a recorded session.
///
/// Lookups depend on (prefix, cycle) only, so repeated queries for the same
/// address always return the same table.
class IReplaySource
{
public:
    virtual ~IReplaySource() = default;

    /// @brief Recorded table for @p prefix at @p cycle, empty if none.
    [[nodiscard]] virtual log::LogTable fetch(std::string_view prefix, core::u64 cycle) const = 0;

    /// @brief True if the session holds any data for @p cycle.
    [[nodiscard]] virtual bool hasCycle(core::u64 cycle) const = 0;
};

} // namespace rlog::serial
