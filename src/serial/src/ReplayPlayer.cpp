// /////////////////////////////////////////////////////////////////////////////
/// @file ReplayPlayer.cpp
/// @brief ReplayPlayer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/serial/ReplayPlayer.hpp>
#include <rlog/core/Log.hpp>

#include <map>

namespace rlog::serial {

struct ReplayPlayer::Impl
{
    std::map<core::u64, ReplayFrame> frames;
};

ReplayPlayer::ReplayPlayer() : impl_{std::make_unique<Impl>()} {}
ReplayPlayer::~ReplayPlayer() = default;

core::Expected<void> ReplayPlayer::load(std::span<const ReplayFrame> frames)
{
    std::map<core::u64, ReplayFrame> loaded;
    for (const auto& frame : frames)
    {
        if (!loaded.empty() && frame.cycle <= loaded.rbegin()->first)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "replay frames are not in increasing cycle order");
        }
        loaded.emplace_hint(loaded.end(), frame.cycle, frame);
    }

    impl_->frames = std::move(loaded);
    core::Log::info("Replay", "loaded " + std::to_string(impl_->frames.size()) + " frames");
    return {};
}

core::Expected<void> ReplayPlayer::load(const ReplayRecorder& recorder)
{
    return load(recorder.frames());
}

log::LogTable ReplayPlayer::fetch(std::string_view prefix, core::u64 cycle) const
{
    const auto frame = impl_->frames.find(cycle);
    if (frame == impl_->frames.end())
    {
        return {};
    }

    const auto table = frame->second.tables.find(prefix);
    if (table == frame->second.tables.end())
    {
        return {};
    }
    return table->second;
}

bool ReplayPlayer::hasCycle(core::u64 cycle) const
{
    return impl_->frames.contains(cycle);
}

core::usize ReplayPlayer::totalFrames() const noexcept
{
    return impl_->frames.size();
}

core::Expected<core::u64> ReplayPlayer::lastCycle() const
{
    if (impl_->frames.empty())
    {
        return core::makeError(core::ErrorCode::kNotFound, "no replay loaded");
    }
    return impl_->frames.rbegin()->first;
}

} // namespace rlog::serial
