/**
 * @file Constants.hpp
 * @brief Library-wide compile-time constants.
 *
 * Parameters shared between the control loop, the driver station subsystem
 * and the logger are centralised here.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_CORE_CONSTANTS_HPP
    #define RLOG_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rlog::core {

inline constexpr u32   kLoopRate              = 50;
inline constexpr f64   kLoopPeriod            = 1.0 / static_cast<f64>(kLoopRate);

inline constexpr u32   kJoystickPorts         = 6;
inline constexpr u32   kMaxJoystickButtons    = 32;

inline constexpr char  kKeySeparator          = '/';

} // namespace rlog::core

#endif // RLOG_CORE_CONSTANTS_HPP
