// /////////////////////////////////////////////////////////////////////////////
/// @file IHardwareSource.hpp
/// @brief Read-only bridge to the live driver station and joysticks.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rlog/core/Types.hpp>

#include <string>
#include <vector>

namespace rlog::hal {

// /////////////////////////////////////////////////////////////////////////////
/// @class IHardwareSource
/// @brief Snapshot provider for one control cycle.
///
/// Every accessor is a non-blocking snapshot read and must be total: an
/// unplugged joystick reports an empty name, zero counts and empty arrays
/// instead of failing. Out-of-range ports behave like unplugged ones.
// /////////////////////////////////////////////////////////////////////////////
class IHardwareSource
{
public:
    virtual ~IHardwareSource() = default;

    // Driver station -------------------------------------------------------

    [[nodiscard]] virtual core::i32 allianceStation() const noexcept = 0;
    [[nodiscard]] virtual std::string eventName() const noexcept = 0;
    [[nodiscard]] virtual std::string gameSpecificMessage() const noexcept = 0;
    [[nodiscard]] virtual core::i32 matchNumber() const noexcept = 0;
    [[nodiscard]] virtual core::i32 replayNumber() const noexcept = 0;
    [[nodiscard]] virtual core::i32 matchType() const noexcept = 0;
    [[nodiscard]] virtual core::f64 matchTime() const noexcept = 0;

    /// @brief Packed robot-state flags, see ControlWord.hpp for bit layout.
    [[nodiscard]] virtual core::u32 controlWord() const noexcept = 0;

    // Joysticks ------------------------------------------------------------

    [[nodiscard]] virtual std::string joystickName(core::u32 port) const noexcept = 0;
    [[nodiscard]] virtual core::i32 joystickType(core::u32 port) const noexcept = 0;
    [[nodiscard]] virtual bool isXbox(core::u32 port) const noexcept = 0;
    [[nodiscard]] virtual std::vector<core::f32> axisValues(core::u32 port) const noexcept = 0;
    [[nodiscard]] virtual std::vector<core::i32> axisTypes(core::u32 port) const noexcept = 0;
    [[nodiscard]] virtual std::vector<core::i32> povValues(core::u32 port) const noexcept = 0;

    /// @brief Button states packed LSB first: bit i is button i.
    [[nodiscard]] virtual core::u32 buttonValues(core::u32 port) const noexcept = 0;
    [[nodiscard]] virtual core::u32 buttonCount(core::u32 port) const noexcept = 0;
};

} // namespace rlog::hal
