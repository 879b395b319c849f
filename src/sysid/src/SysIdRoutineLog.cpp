// /////////////////////////////////////////////////////////////////////////////
/// @file SysIdRoutineLog.cpp
/// @brief SysIdRoutineLog implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/sysid/SysIdRoutineLog.hpp>
#include <rlog/core/Log.hpp>

namespace rlog::sysid {

const char* toString(SysIdRoutineLog::State state) noexcept
{
    switch (state)
    {
        case SysIdRoutineLog::State::kQuasistaticForward: return "quasistatic-forward";
        case SysIdRoutineLog::State::kQuasistaticReverse: return "quasistatic-reverse";
        case SysIdRoutineLog::State::kDynamicForward:     return "dynamic-forward";
        case SysIdRoutineLog::State::kDynamicReverse:     return "dynamic-reverse";
        case SysIdRoutineLog::State::kNone:               return "none";
    }
    return "none";
}

// ========================================================================== //
//  MotorLog                                                                  //
// ========================================================================== //

SysIdRoutineLog::MotorLog::MotorLog(SysIdRoutineLog& routine, std::string_view motorName)
    : routine_{&routine}
    , motorName_{motorName}
{}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::value(std::string_view field,
                                                             core::f64 value,
                                                             std::string_view unit)
{
    routine_->append(motorName_, field, value, unit);
    return *this;
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::voltage(core::f64 volts)
{
    return value("voltage", volts, "Volt");
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::linearPosition(core::f64 meters)
{
    return value("position", meters, "Meter");
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::angularPosition(core::f64 rotations)
{
    return value("position", rotations, "Rotation");
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::linearVelocity(core::f64 metersPerSecond)
{
    return value("velocity", metersPerSecond, "Meter per Second");
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::angularVelocity(core::f64 rotationsPerSecond)
{
    return value("velocity", rotationsPerSecond, "Rotation per Second");
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::linearAcceleration(core::f64 metersPerSecondSquared)
{
    return value("acceleration", metersPerSecondSquared, "Meter per Second per Second");
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::angularAcceleration(core::f64 rotationsPerSecondSquared)
{
    return value("acceleration", rotationsPerSecondSquared, "Rotation per Second per Second");
}

SysIdRoutineLog::MotorLog& SysIdRoutineLog::MotorLog::current(core::f64 amps)
{
    return value("current", amps, "Amp");
}

// ========================================================================== //
//  SysIdRoutineLog                                                           //
// ========================================================================== //

SysIdRoutineLog::SysIdRoutineLog(std::string_view logName, datalog::IDataLog& log)
    : logName_{logName}
    , log_{log}
{}

SysIdRoutineLog::~SysIdRoutineLog() = default;

SysIdRoutineLog::MotorLog SysIdRoutineLog::motor(std::string_view motorName)
{
    return MotorLog{*this, motorName};
}

std::string SysIdRoutineLog::entryName(std::string_view motorName, std::string_view field) const
{
    std::string name{field};
    name += '-';
    name += motorName;
    name += '-';
    name += logName_;
    return name;
}

std::string SysIdRoutineLog::stateEntryName() const
{
    return "sysid-test-state-" + logName_;
}

void SysIdRoutineLog::append(const std::string& motorName, std::string_view field,
                             core::f64 value, std::string_view unit)
{
    std::lock_guard lock{mutex_};

    auto& fields = entries_[motorName];
    auto it = fields.find(std::string{field});
    if (it == fields.end())
    {
        const std::string name = entryName(motorName, field);
        it = fields.emplace(std::string{field}, datalog::DoubleLogEntry{log_, name, unit}).first;
        core::Log::debug("SysId", "opened stream '" + name + "'");
    }

    if (auto result = it->second.append(value); !result)
    {
        core::Log::warn("SysId", result.error().message());
    }
}

void SysIdRoutineLog::recordState(State state)
{
    std::lock_guard lock{mutex_};

    if (!state_)
    {
        state_.emplace(log_, stateEntryName());
    }

    if (auto result = state_->append(toString(state)); !result)
    {
        core::Log::warn("SysId", result.error().message());
    }
}

} // namespace rlog::sysid
