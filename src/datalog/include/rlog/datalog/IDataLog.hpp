// /////////////////////////////////////////////////////////////////////////////
/// @file IDataLog.hpp
/// @brief Append-only store of named, typed instrumentation streams.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/core/Types.hpp>
#include <rlog/core/Expected.hpp>

#include <string_view>

namespace rlog::datalog {

using EntryId = core::i32;

enum class EntryType : core::u8 {
    kDouble,
    kString
};

[[nodiscard]] constexpr const char* toString(EntryType type) noexcept
{
    switch (type)
    {
        case EntryType::kDouble: return "double";
        case EntryType::kString: return "string";
    }
    return "unknown";
}

/// @brief Instrumentation sink written by the sysid routine log.
///
/// An entry is opened once by name, then receives values of its declared
/// type. Opening a name that is already open returns the same id.
class IDataLog
{
public:
    virtual ~IDataLog() = default;

    /// @param metadata Free-form text stored with the entry (unit label).
    [[nodiscard]] virtual EntryId startEntry(std::string_view name,
                                             EntryType type,
                                             std::string_view metadata) = 0;

    [[nodiscard]] virtual core::Expected<void> appendDouble(EntryId entry, core::f64 value) = 0;
    [[nodiscard]] virtual core::Expected<void> appendString(EntryId entry, std::string_view value) = 0;
};

} // namespace rlog::datalog
