// /////////////////////////////////////////////////////////////////////////////
/// @file DriverStationInputs.hpp
/// @brief Match and robot-state data reported by the driver station.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rlog/log/ILoggableInputs.hpp>
#include <rlog/core/Types.hpp>

#include <string>

namespace rlog::inputs {

// /////////////////////////////////////////////////////////////////////////////
/// @struct DriverStationInputs
/// @brief General driver station data that changes throughout a match.
// /////////////////////////////////////////////////////////////////////////////
struct DriverStationInputs final : public log::ILoggableInputs
{
    core::i64   allianceStation{0};
    std::string eventName;
    std::string gameSpecificMessage;
    core::i64   matchNumber{0};
    core::i64   replayNumber{0};
    core::i64   matchType{0};
    core::f64   matchTime{0.0};

    bool enabled{false};
    bool autonomous{false};
    bool test{false};
    bool emergencyStop{false};
    bool fmsAttached{false};
    bool dsAttached{false};

    void toLog(log::LogTable& table) const override;
    void fromLog(const log::LogTable& table) override;
};

} // namespace rlog::inputs
