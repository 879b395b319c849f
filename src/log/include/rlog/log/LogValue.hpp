// /////////////////////////////////////////////////////////////////////////////
/// @file LogValue.hpp
/// @brief Tagged union of every value type a LogTable can hold.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/core/Types.hpp>

#include <string>
#include <variant>
#include <vector>

namespace rlog::log {

/// @brief Type tag of a logged value. The order matches LogValue's
///        alternatives and is part of the persisted format.
enum class LogType : core::u8
{
    kBoolean = 0,
    kInteger,
    kDouble,
    kString,
    kBooleanArray,
    kIntegerArray,
    kDoubleArray,
    kStringArray
};

/// @brief One logged value.
using LogValue = std::variant<
    bool,
    core::i64,
    core::f64,
    std::string,
    std::vector<bool>,
    std::vector<core::i64>,
    std::vector<core::f64>,
    std::vector<std::string>>;

/// @brief Maps a C++ storage type to its LogType tag.
template <typename T>
struct LogTypeTraits;

template <> struct LogTypeTraits<bool>                     { static constexpr LogType kType = LogType::kBoolean; };
template <> struct LogTypeTraits<core::i64>                { static constexpr LogType kType = LogType::kInteger; };
template <> struct LogTypeTraits<core::f64>                { static constexpr LogType kType = LogType::kDouble; };
template <> struct LogTypeTraits<std::string>              { static constexpr LogType kType = LogType::kString; };
template <> struct LogTypeTraits<std::vector<bool>>        { static constexpr LogType kType = LogType::kBooleanArray; };
template <> struct LogTypeTraits<std::vector<core::i64>>   { static constexpr LogType kType = LogType::kIntegerArray; };
template <> struct LogTypeTraits<std::vector<core::f64>>   { static constexpr LogType kType = LogType::kDoubleArray; };
template <> struct LogTypeTraits<std::vector<std::string>> { static constexpr LogType kType = LogType::kStringArray; };

/// @brief A type that can be stored in a LogTable as-is.
template <typename T>
concept LogValueType = requires { LogTypeTraits<T>::kType; };

/// @brief Type tag of the alternative currently held by @p value.
[[nodiscard]] inline LogType typeOf(const LogValue& value) noexcept
{
    return static_cast<LogType>(value.index());
}

/// @brief Stable lower-case name of a type tag ("boolean", "double[]", ...).
[[nodiscard]] const char* toString(LogType type) noexcept;

} // namespace rlog::log
