// /////////////////////////////////////////////////////////////////////////////
/// @file LoggedDriverStation.cpp
/// @brief LoggedDriverStation implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/inputs/LoggedDriverStation.hpp>
#include <rlog/hal/ControlWord.hpp>
#include <rlog/core/Assert.hpp>
#include <rlog/core/Log.hpp>

#include <algorithm>

namespace rlog::inputs {

LoggedDriverStation::LoggedDriverStation(logger::Logger& logger,
                                         const hal::IHardwareSource* hardware)
    : logger_{logger}
    , hardware_{hardware}
{
    RLOG_VERIFY(hardware_ != nullptr || logger_.hasReplaySource());

    for (core::u32 port = 0; port < core::kJoystickPorts; ++port)
    {
        joystickPrefixes_[port] = joystickPrefix(port);
    }
}

LoggedDriverStation::~LoggedDriverStation() = default;

std::string LoggedDriverStation::joystickPrefix(core::u32 port)
{
    std::string prefix{kPrefix};
    prefix += "/Joystick";
    prefix += std::to_string(port);
    return prefix;
}

void LoggedDriverStation::periodic()
{
    if (!logger_.hasReplaySource())
    {
        readHardware();
    }

    logger_.processInputs(kPrefix, dsInputs_);
    for (core::u32 port = 0; port < core::kJoystickPorts; ++port)
    {
        logger_.processInputs(joystickPrefixes_[port], joystickInputs_[port]);
    }
}

void LoggedDriverStation::readHardware() noexcept
{
    const auto& hw = *hardware_;

    dsInputs_.allianceStation     = hw.allianceStation();
    dsInputs_.eventName           = hw.eventName();
    dsInputs_.gameSpecificMessage = hw.gameSpecificMessage();
    dsInputs_.matchNumber         = hw.matchNumber();
    dsInputs_.replayNumber        = hw.replayNumber();
    dsInputs_.matchType           = hw.matchType();
    dsInputs_.matchTime           = hw.matchTime();

    const auto cw = hal::decodeControlWord(hw.controlWord());
    dsInputs_.enabled       = cw.enabled;
    dsInputs_.autonomous    = cw.autonomous;
    dsInputs_.test          = cw.test;
    dsInputs_.emergencyStop = cw.emergencyStop;
    dsInputs_.fmsAttached   = cw.fmsAttached;
    dsInputs_.dsAttached    = cw.dsAttached;

    for (core::u32 port = 0; port < core::kJoystickPorts; ++port)
    {
        auto& joystick = joystickInputs_[port];
        joystick.name = hw.joystickName(port);
        joystick.type = hw.joystickType(port);
        joystick.xbox = hw.isXbox(port);

        const auto axisTypes = hw.axisTypes(port);
        joystick.axisTypes.assign(axisTypes.begin(), axisTypes.end());

        const auto povs = hw.povValues(port);
        joystick.povs.assign(povs.begin(), povs.end());

        const auto axisValues = hw.axisValues(port);
        joystick.axisValues.assign(axisValues.begin(), axisValues.end());

        const core::u32 buttons = hw.buttonValues(port);
        const core::u32 buttonCount = std::min(hw.buttonCount(port), core::kMaxJoystickButtons);
        joystick.buttons.assign(buttonCount, false);
        for (core::u32 i = 0; i < buttonCount; ++i)
        {
            joystick.buttons[i] = ((buttons >> i) & 1u) != 0;
        }
    }
}

const DriverStationInputs& LoggedDriverStation::inputs() const noexcept
{
    return dsInputs_;
}

const JoystickInputs& LoggedDriverStation::joystick(core::u32 port) const
{
    RLOG_ASSERT(port < core::kJoystickPorts);
    return joystickInputs_[port];
}

bool LoggedDriverStation::isEnabled() const noexcept     { return dsInputs_.enabled; }
bool LoggedDriverStation::isAutonomous() const noexcept  { return dsInputs_.autonomous; }
bool LoggedDriverStation::isTest() const noexcept        { return dsInputs_.test; }
bool LoggedDriverStation::isEStopped() const noexcept    { return dsInputs_.emergencyStop; }
bool LoggedDriverStation::isFMSAttached() const noexcept { return dsInputs_.fmsAttached; }
bool LoggedDriverStation::isDSAttached() const noexcept  { return dsInputs_.dsAttached; }
core::f64 LoggedDriverStation::matchTime() const noexcept { return dsInputs_.matchTime; }
core::i64 LoggedDriverStation::allianceStation() const noexcept { return dsInputs_.allianceStation; }

} // namespace rlog::inputs
