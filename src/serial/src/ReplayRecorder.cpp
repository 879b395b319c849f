// /////////////////////////////////////////////////////////////////////////////
/// @file ReplayRecorder.cpp
/// @brief ReplayRecorder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/serial/ReplayRecorder.hpp>
#include <rlog/core/Assert.hpp>
#include <rlog/core/Log.hpp>

#include <algorithm>

namespace rlog::serial {

ReplayRecorder::ReplayRecorder() = default;
ReplayRecorder::~ReplayRecorder() = default;

core::Expected<void> ReplayRecorder::putTable(core::u64 cycle,
                                              std::string_view prefix,
                                              const log::LogTable& table)
{
    if (!frames_.empty() && cycle < frames_.back().cycle)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "cycle " + std::to_string(cycle) + " recorded after cycle "
                                   + std::to_string(frames_.back().cycle));
    }

    if (frames_.empty() || frames_.back().cycle != cycle)
    {
        ReplayFrame frame;
        frame.cycle = cycle;
        frames_.push_back(std::move(frame));
    }

    auto& tables = frames_.back().tables;
    if (tables.find(prefix) != tables.end())
    {
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               "prefix '" + std::string{prefix} + "' already recorded for cycle "
                                   + std::to_string(cycle));
    }

    tables.emplace(std::string{prefix}, table);
    return {};
}

core::usize ReplayRecorder::frameCount() const noexcept
{
    return frames_.size();
}

const ReplayFrame& ReplayRecorder::frame(core::usize index) const
{
    RLOG_ASSERT(index < frames_.size());
    return frames_[index];
}

std::span<const ReplayFrame> ReplayRecorder::frames() const noexcept
{
    return frames_;
}

const log::LogTable* ReplayRecorder::find(core::u64 cycle, std::string_view prefix) const
{
    const auto it = std::lower_bound(frames_.begin(), frames_.end(), cycle,
                                     [](const ReplayFrame& f, core::u64 c) { return f.cycle < c; });
    if (it == frames_.end() || it->cycle != cycle)
    {
        return nullptr;
    }

    const auto table = it->tables.find(prefix);
    return table == it->tables.end() ? nullptr : &table->second;
}

void ReplayRecorder::clear() noexcept
{
    frames_.clear();
}

} // namespace rlog::serial
