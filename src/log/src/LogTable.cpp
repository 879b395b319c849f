// /////////////////////////////////////////////////////////////////////////////
/// @file LogTable.cpp
/// @brief LogTable implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/log/LogTable.hpp>
#include <rlog/math/StateHash.hpp>
#include <rlog/core/Assert.hpp>
#include <rlog/core/Log.hpp>

#include <type_traits>

namespace rlog::log {

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void LogTable::put(std::string_view key, bool value)      { putValue(key, value); }
void LogTable::put(std::string_view key, core::i64 value) { putValue(key, value); }
void LogTable::put(std::string_view key, core::f64 value) { putValue(key, value); }

void LogTable::put(std::string_view key, std::string_view value)
{
    putValue(key, std::string{value});
}

void LogTable::put(std::string_view key, const char* value)
{
    RLOG_ASSERT(value != nullptr);
    putValue(key, std::string{value});
}

void LogTable::put(std::string_view key, const std::vector<bool>& value)
{
    putValue(key, value);
}

void LogTable::put(std::string_view key, std::span<const core::i64> value)
{
    putValue(key, std::vector<core::i64>{value.begin(), value.end()});
}

void LogTable::put(std::string_view key, std::span<const core::f64> value)
{
    putValue(key, std::vector<core::f64>{value.begin(), value.end()});
}

void LogTable::put(std::string_view key, std::span<const std::string> value)
{
    putValue(key, std::vector<std::string>{value.begin(), value.end()});
}

void LogTable::putValue(std::string_view key, LogValue value)
{
    const auto it = values_.find(key);
    if (it != values_.end())
    {
        it->second = std::move(value);
        return;
    }
    values_.emplace(std::string{key}, std::move(value));
}

bool LogTable::remove(std::string_view key)
{
    const auto it = values_.find(key);
    if (it == values_.end())
    {
        return false;
    }
    values_.erase(it);
    return true;
}

void LogTable::clear() noexcept
{
    values_.clear();
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

bool LogTable::getBoolean(std::string_view key, bool defaultValue) const
{
    return get<bool>(key, defaultValue);
}

core::i64 LogTable::getInteger(std::string_view key, core::i64 defaultValue) const
{
    return get<core::i64>(key, defaultValue);
}

core::f64 LogTable::getDouble(std::string_view key, core::f64 defaultValue) const
{
    return get<core::f64>(key, defaultValue);
}

std::string LogTable::getString(std::string_view key, std::string defaultValue) const
{
    return get<std::string>(key, std::move(defaultValue));
}

std::vector<bool> LogTable::getBooleanArray(std::string_view key,
                                            std::vector<bool> defaultValue) const
{
    return get<std::vector<bool>>(key, std::move(defaultValue));
}

std::vector<core::i64> LogTable::getIntegerArray(std::string_view key,
                                                 std::vector<core::i64> defaultValue) const
{
    return get<std::vector<core::i64>>(key, std::move(defaultValue));
}

std::vector<core::f64> LogTable::getDoubleArray(std::string_view key,
                                                std::vector<core::f64> defaultValue) const
{
    return get<std::vector<core::f64>>(key, std::move(defaultValue));
}

std::vector<std::string> LogTable::getStringArray(std::string_view key,
                                                  std::vector<std::string> defaultValue) const
{
    return get<std::vector<std::string>>(key, std::move(defaultValue));
}

const LogValue* LogTable::find(std::string_view key) const
{
    const auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

bool LogTable::contains(std::string_view key) const
{
    return values_.find(key) != values_.end();
}

core::Expected<LogType> LogTable::typeAt(std::string_view key) const
{
    const auto* value = find(key);
    if (value == nullptr)
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "no value at '" + std::string{key} + "'");
    }
    return rlog::log::typeOf(*value);
}

core::usize LogTable::size() const noexcept
{
    return values_.size();
}

bool LogTable::empty() const noexcept
{
    return values_.empty();
}

core::u64 LogTable::hash() const
{
    math::StateHash hasher;
    hasher.combine(static_cast<core::u64>(values_.size()));

    for (const auto& [key, value] : values_)
    {
        hasher.hashString(key);
        hasher.combine(static_cast<core::u8>(rlog::log::typeOf(value)));

        std::visit([&hasher](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>)
            {
                hasher.combine(static_cast<core::u8>(v ? 1 : 0));
            }
            else if constexpr (std::is_same_v<T, core::i64> || std::is_same_v<T, core::f64>)
            {
                hasher.combine(v);
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                hasher.hashString(v);
            }
            else
            {
                hasher.combine(static_cast<core::u64>(v.size()));
                for (const auto& element : v)
                {
                    if constexpr (std::is_same_v<T, std::vector<bool>>)
                        hasher.combine(static_cast<core::u8>(element ? 1 : 0));
                    else if constexpr (std::is_same_v<T, std::vector<std::string>>)
                        hasher.hashString(element);
                    else
                        hasher.combine(element);
                }
            }
        }, value);
    }

    return hasher.digest();
}

// -------------------------------------------------------------------------- //
//  Contract violations                                                       //
// -------------------------------------------------------------------------- //

std::string LogTable::mismatchMessage(std::string_view key, LogType requested, LogType stored)
{
    std::string msg{"type mismatch at '"};
    msg.append(key);
    msg.append("': requested ");
    msg.append(toString(requested));
    msg.append(", stored ");
    msg.append(toString(stored));
    return msg;
}

void LogTable::failTypeMismatch(std::string_view key, LogType requested, LogType stored)
{
    core::Log::fatal("LogTable", mismatchMessage(key, requested, stored));
    RLOG_VERIFY(requested == stored);
    RLOG_UNREACHABLE();
}

} // namespace rlog::log
