// /////////////////////////////////////////////////////////////////////////////
/// @file JoystickInputs.hpp
/// @brief Everything the control program can read from one joystick port.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rlog/log/ILoggableInputs.hpp>
#include <rlog/core/Types.hpp>

#include <string>
#include <vector>

namespace rlog::inputs {

// /////////////////////////////////////////////////////////////////////////////
/// @struct JoystickInputs
/// @brief State of a single joystick port. All arrays are empty while the
///        port is unplugged, and their lengths follow the plugged device.
// /////////////////////////////////////////////////////////////////////////////
struct JoystickInputs final : public log::ILoggableInputs
{
    std::string            name;
    core::i64              type{0};
    bool                   xbox{false};
    std::vector<bool>      buttons;
    std::vector<core::f64> axisValues;
    std::vector<core::i64> axisTypes;
    std::vector<core::i64> povs;

    void toLog(log::LogTable& table) const override;
    void fromLog(const log::LogTable& table) override;
};

} // namespace rlog::inputs
