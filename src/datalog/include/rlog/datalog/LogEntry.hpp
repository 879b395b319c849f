// /////////////////////////////////////////////////////////////////////////////
/// @file LogEntry.hpp
/// @brief Typed handles over an opened IDataLog entry.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/datalog/IDataLog.hpp>

#include <string_view>

namespace rlog::datalog {

class DoubleLogEntry
{
public:
    DoubleLogEntry(IDataLog& log, std::string_view name, std::string_view metadata)
        : log_{&log}
        , id_{log.startEntry(name, EntryType::kDouble, metadata)}
    {}

    [[nodiscard]] core::Expected<void> append(core::f64 value) { return log_->appendDouble(id_, value); }
    [[nodiscard]] EntryId id() const noexcept { return id_; }

private:
    IDataLog* log_;
    EntryId   id_;
};

class StringLogEntry
{
public:
    StringLogEntry(IDataLog& log, std::string_view name, std::string_view metadata = {})
        : log_{&log}
        , id_{log.startEntry(name, EntryType::kString, metadata)}
    {}

    [[nodiscard]] core::Expected<void> append(std::string_view value) { return log_->appendString(id_, value); }
    [[nodiscard]] EntryId id() const noexcept { return id_; }

private:
    IDataLog* log_;
    EntryId   id_;
};

} // namespace rlog::datalog
