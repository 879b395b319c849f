// /////////////////////////////////////////////////////////////////////////////
/// @file SimHardwareSource.cpp
/// @brief SimHardwareSource implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/hal/SimHardwareSource.hpp>
#include <rlog/core/Log.hpp>

#include <utility>

namespace rlog::hal {

SimHardwareSource::SimHardwareSource() = default;
SimHardwareSource::~SimHardwareSource() = default;

// -------------------------------------------------------------------------- //
//  Setters                                                                   //
// -------------------------------------------------------------------------- //

void SimHardwareSource::setAllianceStation(core::i32 station) noexcept
{
    allianceStation_ = station;
}

void SimHardwareSource::setEventName(std::string name)
{
    eventName_ = std::move(name);
}

void SimHardwareSource::setGameSpecificMessage(std::string message)
{
    gameSpecificMessage_ = std::move(message);
}

void SimHardwareSource::setMatchInfo(core::i32 matchNumber,
                                     core::i32 replayNumber,
                                     core::i32 matchType) noexcept
{
    matchNumber_  = matchNumber;
    replayNumber_ = replayNumber;
    matchType_    = matchType;
}

void SimHardwareSource::setMatchTime(core::f64 seconds) noexcept
{
    matchTime_ = seconds;
}

void SimHardwareSource::setControlWord(core::u32 word) noexcept
{
    controlWord_ = word;
}

core::Expected<void> SimHardwareSource::connectJoystick(core::u32 port, SimJoystick joystick)
{
    if (port >= core::kJoystickPorts)
    {
        return core::makeError(core::ErrorCode::kOutOfRange, "joystick port out of range");
    }
    if (joystick.buttonCount > core::kMaxJoystickButtons)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "joystick declares more buttons than the mask holds");
    }

    joystick.connected = true;
    joysticks_[port] = std::move(joystick);
    core::Log::debug("SimHardware", "joystick connected");
    return {};
}

void SimHardwareSource::disconnectJoystick(core::u32 port) noexcept
{
    if (port < core::kJoystickPorts)
    {
        joysticks_[port] = SimJoystick{};
    }
}

SimJoystick* SimHardwareSource::joystick(core::u32 port) noexcept
{
    if (port >= core::kJoystickPorts || !joysticks_[port].connected)
    {
        return nullptr;
    }
    return &joysticks_[port];
}

const SimJoystick* SimHardwareSource::connected(core::u32 port) const noexcept
{
    if (port >= core::kJoystickPorts || !joysticks_[port].connected)
    {
        return nullptr;
    }
    return &joysticks_[port];
}

// -------------------------------------------------------------------------- //
//  IHardwareSource                                                           //
// -------------------------------------------------------------------------- //

core::i32 SimHardwareSource::allianceStation() const noexcept { return allianceStation_; }
std::string SimHardwareSource::eventName() const noexcept { return eventName_; }
std::string SimHardwareSource::gameSpecificMessage() const noexcept { return gameSpecificMessage_; }
core::i32 SimHardwareSource::matchNumber() const noexcept { return matchNumber_; }
core::i32 SimHardwareSource::replayNumber() const noexcept { return replayNumber_; }
core::i32 SimHardwareSource::matchType() const noexcept { return matchType_; }
core::f64 SimHardwareSource::matchTime() const noexcept { return matchTime_; }
core::u32 SimHardwareSource::controlWord() const noexcept { return controlWord_; }

std::string SimHardwareSource::joystickName(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->name : std::string{};
}

core::i32 SimHardwareSource::joystickType(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->type : 0;
}

bool SimHardwareSource::isXbox(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->xbox : false;
}

std::vector<core::f32> SimHardwareSource::axisValues(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->axisValues : std::vector<core::f32>{};
}

std::vector<core::i32> SimHardwareSource::axisTypes(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->axisTypes : std::vector<core::i32>{};
}

std::vector<core::i32> SimHardwareSource::povValues(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->povs : std::vector<core::i32>{};
}

core::u32 SimHardwareSource::buttonValues(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->buttons : 0u;
}

core::u32 SimHardwareSource::buttonCount(core::u32 port) const noexcept
{
    const auto* js = connected(port);
    return js ? js->buttonCount : 0u;
}

} // namespace rlog::hal
