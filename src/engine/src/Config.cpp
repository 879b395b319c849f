// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/engine/Config.hpp>

namespace rlog::engine {

Config::Builder& Config::Builder::loopRate(core::u32 hz) noexcept
{
    loopRate_ = hz;
    return *this;
}

Config::Builder& Config::Builder::maxCycles(core::u64 n) noexcept
{
    maxCycles_ = n;
    return *this;
}

Config::Builder& Config::Builder::realTime(bool enabled) noexcept
{
    realTime_ = enabled;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg.loopRate_  = loopRate_;
    cfg.maxCycles_ = maxCycles_;
    cfg.realTime_  = realTime_;
    return cfg;
}

} // namespace rlog::engine
