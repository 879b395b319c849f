// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Control loop configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/core/Types.hpp>
#include <rlog/core/Constants.hpp>

namespace rlog::engine {

/// @brief Immutable control loop configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& loopRate(core::u32 hz) noexcept;
        Builder& maxCycles(core::u64 n) noexcept;
        Builder& realTime(bool enabled) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::u32 loopRate_{core::kLoopRate};
        core::u64 maxCycles_{0};
        bool realTime_{false};
    };

    [[nodiscard]] core::u32 loopRate()  const noexcept { return loopRate_; }
    /// @brief 0 means the loop runs until a stop is requested.
    [[nodiscard]] core::u64 maxCycles() const noexcept { return maxCycles_; }
    /// @brief Sleep to the loop period between cycles (record mode only).
    [[nodiscard]] bool      realTime()  const noexcept { return realTime_; }

    [[nodiscard]] core::f64 period() const noexcept
    {
        return 1.0 / static_cast<core::f64>(loopRate_);
    }

private:
    friend class Builder;

    core::u32 loopRate_{core::kLoopRate};
    core::u64 maxCycles_{0};
    bool      realTime_{false};
};

} // namespace rlog::engine
