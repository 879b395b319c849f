// /////////////////////////////////////////////////////////////////////////////
/// @file MemoryDataLog.cpp
/// @brief MemoryDataLog implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/datalog/MemoryDataLog.hpp>
#include <rlog/core/Log.hpp>

#include <algorithm>

namespace rlog::datalog {

EntryId MemoryDataLog::startEntry(std::string_view name,
                                  EntryType type,
                                  std::string_view metadata)
{
    std::lock_guard lock{mutex_};
    ++totalOpens_;

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& e) { return e.name == name; });
    if (it != entries_.end())
    {
        ++it->opens;
        return static_cast<EntryId>(it - entries_.begin());
    }

    Entry entry;
    entry.name     = std::string{name};
    entry.type     = type;
    entry.metadata = std::string{metadata};
    entry.opens    = 1;
    entries_.push_back(std::move(entry));

    core::Log::debug("DataLog", std::string{"opened '"} + std::string{name} + "' (" + toString(type) + ")");
    return static_cast<EntryId>(entries_.size() - 1);
}

core::Expected<MemoryDataLog::Entry*> MemoryDataLog::lookup(EntryId entry, EntryType expected)
{
    if (entry < 0 || static_cast<core::usize>(entry) >= entries_.size())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "no entry with id " + std::to_string(entry));
    }

    Entry& e = entries_[static_cast<core::usize>(entry)];
    if (e.type != expected)
    {
        return core::makeError(core::ErrorCode::kTypeMismatch,
                               "entry '" + e.name + "' holds " + toString(e.type) +
                               ", not " + toString(expected));
    }
    return &e;
}

core::Expected<void> MemoryDataLog::appendDouble(EntryId entry, core::f64 value)
{
    std::lock_guard lock{mutex_};
    Entry* e = RLOG_TRY(lookup(entry, EntryType::kDouble));
    e->doubles.push_back(value);
    return {};
}

core::Expected<void> MemoryDataLog::appendString(EntryId entry, std::string_view value)
{
    std::lock_guard lock{mutex_};
    Entry* e = RLOG_TRY(lookup(entry, EntryType::kString));
    e->strings.emplace_back(value);
    return {};
}

core::Expected<MemoryDataLog::Entry> MemoryDataLog::entry(std::string_view name) const
{
    std::lock_guard lock{mutex_};
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& e) { return e.name == name; });
    if (it == entries_.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "no entry named '" + std::string{name} + "'");
    }
    return *it;
}

core::usize MemoryDataLog::entryCount() const
{
    std::lock_guard lock{mutex_};
    return entries_.size();
}

core::u32 MemoryDataLog::totalOpens() const
{
    std::lock_guard lock{mutex_};
    return totalOpens_;
}

} // namespace rlog::datalog
