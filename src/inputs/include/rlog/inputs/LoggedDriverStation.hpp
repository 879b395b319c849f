// /////////////////////////////////////////////////////////////////////////////
/// @file LoggedDriverStation.hpp
/// @brief Driver station subsystem whose inputs are recorded and replayed.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rlog/inputs/DriverStationInputs.hpp>
#include <rlog/inputs/JoystickInputs.hpp>
#include <rlog/logger/Logger.hpp>
#include <rlog/hal/IHardwareSource.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/Constants.hpp>
#include <rlog/core/NonCopyable.hpp>

#include <array>
#include <string>
#include <string_view>

namespace rlog::inputs {

// /////////////////////////////////////////////////////////////////////////////
/// @class LoggedDriverStation
/// @brief Reads robot state and all joystick ports once per cycle.
///
/// In record mode periodic() copies the hardware snapshot into the input
/// bundles before handing them to the Logger; in replay mode the hardware is
/// never touched and the Logger restores the bundles. User code reads the
/// bundles through the accessors below and sees the same values either way.
// /////////////////////////////////////////////////////////////////////////////
class LoggedDriverStation final : public core::NonCopyable<LoggedDriverStation>
{
public:
    static constexpr std::string_view kPrefix = "DriverStation";

    /// @param logger   Dispatcher shared by every subsystem.
    /// @param hardware Live source; may be null only when replaying.
    LoggedDriverStation(logger::Logger& logger, const hal::IHardwareSource* hardware);
    ~LoggedDriverStation();

    /// @brief Update and log all driver station inputs for this cycle.
    void periodic();

    [[nodiscard]] const DriverStationInputs& inputs() const noexcept;
    [[nodiscard]] const JoystickInputs& joystick(core::u32 port) const;

    [[nodiscard]] bool isEnabled() const noexcept;
    [[nodiscard]] bool isAutonomous() const noexcept;
    [[nodiscard]] bool isTest() const noexcept;
    [[nodiscard]] bool isEStopped() const noexcept;
    [[nodiscard]] bool isFMSAttached() const noexcept;
    [[nodiscard]] bool isDSAttached() const noexcept;
    [[nodiscard]] core::f64 matchTime() const noexcept;
    [[nodiscard]] core::i64 allianceStation() const noexcept;

    /// @brief "DriverStation/Joystick<port>".
    [[nodiscard]] static std::string joystickPrefix(core::u32 port);

private:
    void readHardware() noexcept;

    logger::Logger& logger_;
    const hal::IHardwareSource* hardware_;

    DriverStationInputs dsInputs_;
    std::array<JoystickInputs, core::kJoystickPorts> joystickInputs_;
    std::array<std::string, core::kJoystickPorts> joystickPrefixes_;
};

} // namespace rlog::inputs
