/**
 * @file ILoggableInputs.hpp
 * @brief Capture/restore contract of a subsystem's input bundle.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_LOG_ILOGGABLE_INPUTS_HPP
    #define RLOG_LOG_ILOGGABLE_INPUTS_HPP

#include <rlog/log/LogTable.hpp>

namespace rlog::log {

/**
 * @brief Interface for input bundles that the Logger records and replays.
 *
 * Implementations list the same keys, with the same types, in both
 * directions. Key names are persisted and must never be renamed.
 */
class ILoggableInputs
{
public:
    virtual ~ILoggableInputs() = default;

    /**
     * @brief Write every field into @p table.
     * @param table Fresh table owned by the caller.
     */
    virtual void toLog(LogTable& table) const = 0;

    /**
     * @brief Restore every field from @p table.
     *
     * Each field reads with its own current value as default, so a key
     * missing from @p table leaves that field unchanged.
     *
     * @param table Table recorded by toLog() (possibly partial or empty).
     */
    virtual void fromLog(const LogTable& table) = 0;
};

} // namespace rlog::log

#endif // RLOG_LOG_ILOGGABLE_INPUTS_HPP
