// /////////////////////////////////////////////////////////////////////////////
/// @file JoystickInputs.cpp
/// @brief JoystickInputs serialisation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/inputs/JoystickInputs.hpp>

namespace rlog::inputs {

void JoystickInputs::toLog(log::LogTable& table) const
{
    table.put("Name", name);
    table.put("Type", type);
    table.put("Xbox", xbox);
    table.put("Buttons", buttons);
    table.put("AxisValues", axisValues);
    table.put("AxisTypes", axisTypes);
    table.put("POVs", povs);
}

void JoystickInputs::fromLog(const log::LogTable& table)
{
    name       = table.getString("Name", name);
    type       = table.getInteger("Type", type);
    xbox       = table.getBoolean("Xbox", xbox);
    buttons    = table.getBooleanArray("Buttons", buttons);
    axisValues = table.getDoubleArray("AxisValues", axisValues);
    axisTypes  = table.getIntegerArray("AxisTypes", axisTypes);
    povs       = table.getIntegerArray("POVs", povs);
}

} // namespace rlog::inputs
