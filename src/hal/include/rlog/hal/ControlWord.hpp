// /////////////////////////////////////////////////////////////////////////////
/// @file ControlWord.hpp
/// @brief Bit layout of the driver station control word.
///
/// The bit positions are part of the agreement with the driver station and
/// must not change.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/core/Types.hpp>

namespace rlog::hal {

inline constexpr core::u32 kEnabledBit       = 1u << 0;
inline constexpr core::u32 kAutonomousBit    = 1u << 1;
inline constexpr core::u32 kTestBit          = 1u << 2;
inline constexpr core::u32 kEmergencyStopBit = 1u << 3;
inline constexpr core::u32 kFmsAttachedBit   = 1u << 4;
inline constexpr core::u32 kDsAttachedBit    = 1u << 5;

/// @brief Decoded control word.
struct ControlWord
{
    bool enabled{false};
    bool autonomous{false};
    bool test{false};
    bool emergencyStop{false};
    bool fmsAttached{false};
    bool dsAttached{false};

    bool operator==(const ControlWord&) const = default;
};

[[nodiscard]] constexpr ControlWord decodeControlWord(core::u32 word) noexcept
{
    ControlWord cw;
    cw.enabled       = (word & kEnabledBit) != 0;
    cw.autonomous    = (word & kAutonomousBit) != 0;
    cw.test          = (word & kTestBit) != 0;
    cw.emergencyStop = (word & kEmergencyStopBit) != 0;
    cw.fmsAttached   = (word & kFmsAttachedBit) != 0;
    cw.dsAttached    = (word & kDsAttachedBit) != 0;
    return cw;
}

[[nodiscard]] constexpr core::u32 encodeControlWord(const ControlWord& cw) noexcept
{
    return (cw.enabled       ? kEnabledBit       : 0u)
         | (cw.autonomous    ? kAutonomousBit    : 0u)
         | (cw.test          ? kTestBit          : 0u)
         | (cw.emergencyStop ? kEmergencyStopBit : 0u)
         | (cw.fmsAttached   ? kFmsAttachedBit   : 0u)
         | (cw.dsAttached    ? kDsAttachedBit    : 0u);
}

static_assert(decodeControlWord(0b100101) ==
              ControlWord{true, false, true, false, false, true});

} // namespace rlog::hal
