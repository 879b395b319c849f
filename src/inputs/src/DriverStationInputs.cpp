// /////////////////////////////////////////////////////////////////////////////
/// @file DriverStationInputs.cpp
/// @brief DriverStationInputs serialisation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/inputs/DriverStationInputs.hpp>

namespace rlog::inputs {

void DriverStationInputs::toLog(log::LogTable& table) const
{
    table.put("AllianceStation", allianceStation);
    table.put("EventName", eventName);
    table.put("GameSpecificMessage", gameSpecificMessage);
    table.put("MatchNumber", matchNumber);
    table.put("ReplayNumber", replayNumber);
    table.put("MatchType", matchType);
    table.put("MatchTime", matchTime);

    table.put("Enabled", enabled);
    table.put("Autonomous", autonomous);
    table.put("Test", test);
    table.put("EmergencyStop", emergencyStop);
    table.put("FMSAttached", fmsAttached);
    table.put("DSAttached", dsAttached);
}

void DriverStationInputs::fromLog(const log::LogTable& table)
{
    allianceStation     = table.getInteger("AllianceStation", allianceStation);
    eventName           = table.getString("EventName", eventName);
    gameSpecificMessage = table.getString("GameSpecificMessage", gameSpecificMessage);
    matchNumber         = table.getInteger("MatchNumber", matchNumber);
    replayNumber        = table.getInteger("ReplayNumber", replayNumber);
    matchType           = table.getInteger("MatchType", matchType);
    matchTime           = table.getDouble("MatchTime", matchTime);

    enabled       = table.getBoolean("Enabled", enabled);
    autonomous    = table.getBoolean("Autonomous", autonomous);
    test          = table.getBoolean("Test", test);
    emergencyStop = table.getBoolean("EmergencyStop", emergencyStop);
    fmsAttached   = table.getBoolean("FMSAttached", fmsAttached);
    dsAttached    = table.getBoolean("DSAttached", dsAttached);
}

} // namespace rlog::inputs
