// /////////////////////////////////////////////////////////////////////////////
/// @file KeyTypeRegistry.hpp
/// @brief Remembers the type first logged under every full key.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/log/LogTable.hpp>
#include <rlog/log/LogValue.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/Expected.hpp>

#include <string>
#include <string_view>
#include <unordered_map>

namespace rlog::logger {

/// @brief Detects a key whose type changes from one cycle to the next.
///
/// A replay reads every key back with the type its component expects, so a
/// key that changed type mid-recording can never replay correctly.
class KeyTypeRegistry
{
public:
    /// @brief Record the types in @p table under @p prefix.
    /// @return kTypeMismatch naming the first key whose type differs from an
    ///         earlier cycle; nothing is registered from @p table in that case.
    [[nodiscard]] core::Expected<void> check(std::string_view prefix, const log::LogTable& table);

    /// @brief Type registered for a full "<prefix>/<key>", kNotFound if none.
    [[nodiscard]] core::Expected<log::LogType> typeOf(std::string_view fullKey) const;

    [[nodiscard]] core::usize size() const noexcept;

    void clear() noexcept;

    /// @brief "<prefix>/<key>", or just @p key for an empty prefix.
    [[nodiscard]] static std::string fullKey(std::string_view prefix, std::string_view key);

private:
    std::unordered_map<std::string, log::LogType> types_;
};

} // namespace rlog::logger
