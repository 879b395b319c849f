// /////////////////////////////////////////////////////////////////////////////
/// @file SysIdRoutineLog.hpp
/// @brief Named counter streams recorded during a system identification run.
///
/// Each (motor, field) pair is written to its own double stream called
/// "<field>-<motor>-<logName>", opened the first time it is used and cached
/// afterwards. The routine state goes to "sysid-test-state-<logName>".
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/datalog/IDataLog.hpp>
#include <rlog/datalog/LogEntry.hpp>
#include <rlog/core/NonCopyable.hpp>
#include <rlog/core/Types.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rlog::sysid {

class SysIdRoutineLog final : public core::NonCopyable<SysIdRoutineLog>
{
public:
    enum class State : core::u8 {
        kQuasistaticForward,
        kQuasistaticReverse,
        kDynamicForward,
        kDynamicReverse,
        kNone
    };

    /// @brief Fluent writer for the streams of one motor.
    ///
    /// Values are expected in SI base units; the helpers only fix the field
    /// name and the unit label.
    class MotorLog
    {
    public:
        MotorLog& value(std::string_view field, core::f64 value, std::string_view unit);

        MotorLog& voltage(core::f64 volts);
        MotorLog& linearPosition(core::f64 meters);
        MotorLog& angularPosition(core::f64 rotations);
        MotorLog& linearVelocity(core::f64 metersPerSecond);
        MotorLog& angularVelocity(core::f64 rotationsPerSecond);
        MotorLog& linearAcceleration(core::f64 metersPerSecondSquared);
        MotorLog& angularAcceleration(core::f64 rotationsPerSecondSquared);
        MotorLog& current(core::f64 amps);

        [[nodiscard]] const std::string& motorName() const noexcept { return motorName_; }

    private:
        friend class SysIdRoutineLog;
        MotorLog(SysIdRoutineLog& routine, std::string_view motorName);

        SysIdRoutineLog* routine_;
        std::string      motorName_;
    };

    /// @param logName Suffix shared by every stream of this routine.
    /// @param log     Destination; must outlive the routine log.
    SysIdRoutineLog(std::string_view logName, datalog::IDataLog& log);
    ~SysIdRoutineLog();

    [[nodiscard]] MotorLog motor(std::string_view motorName);

    /// @brief Append the string form of @p state to the state stream.
    void recordState(State state);

    [[nodiscard]] const std::string& logName() const noexcept { return logName_; }

    /// @brief Stream name used for @p field of @p motorName.
    [[nodiscard]] std::string entryName(std::string_view motorName, std::string_view field) const;

    /// @brief Stream name used for the routine state.
    [[nodiscard]] std::string stateEntryName() const;

private:
    void append(const std::string& motorName, std::string_view field,
                core::f64 value, std::string_view unit);

    using FieldEntries = std::unordered_map<std::string, datalog::DoubleLogEntry>;

    std::string                            logName_;
    datalog::IDataLog&                     log_;
    std::mutex                             mutex_;
    std::unordered_map<std::string, FieldEntries> entries_;
    std::optional<datalog::StringLogEntry> state_;
};

[[nodiscard]] const char* toString(SysIdRoutineLog::State state) noexcept;

} // namespace rlog::sysid
