// /////////////////////////////////////////////////////////////////////////////
/// @file MemoryDataLog.hpp
/// @brief IDataLog kept entirely in memory, for tests and the demo.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/datalog/IDataLog.hpp>
#include <rlog/core/NonCopyable.hpp>
#include <rlog/core/Types.hpp>

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rlog::datalog {

// /////////////////////////////////////////////////////////////////////////////
/// @class MemoryDataLog
/// @brief Keeps every entry, its values and how many times it was opened.
///
/// All members are safe to call from several threads.
// /////////////////////////////////////////////////////////////////////////////
class MemoryDataLog final : public IDataLog, public core::NonCopyable<MemoryDataLog>
{
public:
    struct Entry {
        std::string              name;
        EntryType                type{EntryType::kDouble};
        std::string              metadata;
        core::u32                opens{0};
        std::vector<core::f64>   doubles;
        std::vector<std::string> strings;
    };

    MemoryDataLog() = default;

    [[nodiscard]] EntryId startEntry(std::string_view name,
                                     EntryType type,
                                     std::string_view metadata) override;

    [[nodiscard]] core::Expected<void> appendDouble(EntryId entry, core::f64 value) override;
    [[nodiscard]] core::Expected<void> appendString(EntryId entry, std::string_view value) override;

    /// @brief Snapshot of the entry named @p name.
    [[nodiscard]] core::Expected<Entry> entry(std::string_view name) const;

    [[nodiscard]] core::usize entryCount() const;

    /// @brief Total startEntry() calls, repeated names included.
    [[nodiscard]] core::u32 totalOpens() const;

private:
    [[nodiscard]] core::Expected<Entry*> lookup(EntryId entry, EntryType expected);

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    core::u32 totalOpens_{0};
};

} // namespace rlog::datalog
