// /////////////////////////////////////////////////////////////////////////////
/// @file SimHardwareSource.hpp
/// @brief Scriptable in-process hardware source for simulation and tests.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/hal/IHardwareSource.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/Constants.hpp>
#include <rlog/core/Expected.hpp>

#include <array>
#include <string>
#include <vector>

namespace rlog::hal {

/// @brief Live state of one simulated joystick port.
struct SimJoystick
{
    bool connected{false};
    std::string name;
    core::i32 type{0};
    bool xbox{false};
    std::vector<core::f32> axisValues;
    std::vector<core::i32> axisTypes;
    std::vector<core::i32> povs;
    core::u32 buttons{0};
    core::u32 buttonCount{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class SimHardwareSource
/// @brief IHardwareSource whose values are set by the caller between cycles.
///
/// Disconnected ports read as empty, like a real driver station.
// /////////////////////////////////////////////////////////////////////////////
class SimHardwareSource final : public IHardwareSource
{
public:
    SimHardwareSource();
    ~SimHardwareSource() override;

    // Setters --------------------------------------------------------------

    void setAllianceStation(core::i32 station) noexcept;
    void setEventName(std::string name);
    void setGameSpecificMessage(std::string message);
    void setMatchInfo(core::i32 matchNumber, core::i32 replayNumber, core::i32 matchType) noexcept;
    void setMatchTime(core::f64 seconds) noexcept;
    void setControlWord(core::u32 word) noexcept;

    /// @brief Plugs @p joystick into @p port. kOutOfRange for a bad port,
    ///        kInvalidArgument if more than 32 buttons are declared.
    [[nodiscard]] core::Expected<void> connectJoystick(core::u32 port, SimJoystick joystick);

    /// @brief Unplugs the joystick at @p port (no-op if already empty).
    void disconnectJoystick(core::u32 port) noexcept;

    /// @brief Mutable access to a connected port, nullptr otherwise.
    [[nodiscard]] SimJoystick* joystick(core::u32 port) noexcept;

    // IHardwareSource ------------------------------------------------------

    [[nodiscard]] core::i32 allianceStation() const noexcept override;
    [[nodiscard]] std::string eventName() const noexcept override;
    [[nodiscard]] std::string gameSpecificMessage() const noexcept override;
    [[nodiscard]] core::i32 matchNumber() const noexcept override;
    [[nodiscard]] core::i32 replayNumber() const noexcept override;
    [[nodiscard]] core::i32 matchType() const noexcept override;
    [[nodiscard]] core::f64 matchTime() const noexcept override;
    [[nodiscard]] core::u32 controlWord() const noexcept override;

    [[nodiscard]] std::string joystickName(core::u32 port) const noexcept override;
    [[nodiscard]] core::i32 joystickType(core::u32 port) const noexcept override;
    [[nodiscard]] bool isXbox(core::u32 port) const noexcept override;
    [[nodiscard]] std::vector<core::f32> axisValues(core::u32 port) const noexcept override;
    [[nodiscard]] std::vector<core::i32> axisTypes(core::u32 port) const noexcept override;
    [[nodiscard]] std::vector<core::i32> povValues(core::u32 port) const noexcept override;
    [[nodiscard]] core::u32 buttonValues(core::u32 port) const noexcept override;
    [[nodiscard]] core::u32 buttonCount(core::u32 port) const noexcept override;

private:
    [[nodiscard]] const SimJoystick* connected(core::u32 port) const noexcept;

    core::i32 allianceStation_{0};
    std::string eventName_;
    std::string gameSpecificMessage_;
    core::i32 matchNumber_{0};
    core::i32 replayNumber_{0};
    core::i32 matchType_{0};
    core::f64 matchTime_{0.0};
    core::u32 controlWord_{0};

    std::array<SimJoystick, core::kJoystickPorts> joysticks_{};
};

} // namespace rlog::hal
