// /////////////////////////////////////////////////////////////////////////////
/// @file LogTable.hpp
/// @brief Ordered string-keyed table of typed values for one cycle.
///
/// A fresh table is created by the Logger for every processInputs() call
/// and discarded once the component has been serialised into it or restored
/// from it. Keys are relative to the component's prefix.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/log/LogValue.hpp>
#include <rlog/core/Types.hpp>
#include <rlog/core/Expected.hpp>

#include <concepts>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rlog::log {

// /////////////////////////////////////////////////////////////////////////////
/// @class LogTable
/// @brief Snapshot container mapping keys to LogValues.
///
/// Reads never fail for an absent key: get() falls back to the caller's
/// default, which is what makes partial restores safe. Reading a present key
/// with the wrong type is a programming error and is fatal.
// /////////////////////////////////////////////////////////////////////////////
class LogTable
{
public:
    using Map            = std::map<std::string, LogValue, std::less<>>;
    using const_iterator = Map::const_iterator;

    LogTable() = default;

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    void put(std::string_view key, bool value);
    void put(std::string_view key, core::i64 value);
    void put(std::string_view key, core::f64 value);
    void put(std::string_view key, std::string_view value);
    void put(std::string_view key, const char* value);
    void put(std::string_view key, const std::vector<bool>& value);
    void put(std::string_view key, std::span<const core::i64> value);
    void put(std::string_view key, std::span<const core::f64> value);
    void put(std::string_view key, std::span<const std::string> value);

    /// @brief Integer overload for any width other than int64.
    template <std::integral T>
        requires (!std::same_as<T, bool> && !std::same_as<T, core::i64>)
    void put(std::string_view key, T value)
    {
        putValue(key, static_cast<core::i64>(value));
    }

    /// @brief Stores an already-tagged value, replacing any prior one.
    void putValue(std::string_view key, LogValue value);

    /// @brief Removes @p key. Returns false if it was absent.
    bool remove(std::string_view key);

    void clear() noexcept;

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    /// @brief Returns the value at @p key, or @p defaultValue if absent.
    ///
    /// A present value of another type fails RLOG_VERIFY.
    template <LogValueType T>
    [[nodiscard]] T get(std::string_view key, T defaultValue) const
    {
        const auto it = values_.find(key);
        if (it == values_.end())
        {
            return defaultValue;
        }
        if (const T* stored = std::get_if<T>(&it->second))
        {
            return *stored;
        }
        failTypeMismatch(key, LogTypeTraits<T>::kType, rlog::log::typeOf(it->second));
    }

    /// @brief Checked read: kNotFound if absent, kTypeMismatch if the stored
    ///        type differs.
    template <LogValueType T>
    [[nodiscard]] core::Expected<T> tryGet(std::string_view key) const
    {
        const auto it = values_.find(key);
        if (it == values_.end())
        {
            return core::makeError(core::ErrorCode::kNotFound,
                                   "no value at '" + std::string{key} + "'");
        }
        if (const T* stored = std::get_if<T>(&it->second))
        {
            return *stored;
        }
        return core::makeError(core::ErrorCode::kTypeMismatch,
                               mismatchMessage(key, LogTypeTraits<T>::kType,
                                               rlog::log::typeOf(it->second)));
    }

    [[nodiscard]] bool getBoolean(std::string_view key, bool defaultValue) const;
    [[nodiscard]] core::i64 getInteger(std::string_view key, core::i64 defaultValue) const;
    [[nodiscard]] core::f64 getDouble(std::string_view key, core::f64 defaultValue) const;
    [[nodiscard]] std::string getString(std::string_view key, std::string defaultValue) const;
    [[nodiscard]] std::vector<bool> getBooleanArray(std::string_view key,
                                                    std::vector<bool> defaultValue) const;
    [[nodiscard]] std::vector<core::i64> getIntegerArray(std::string_view key,
                                                         std::vector<core::i64> defaultValue) const;
    [[nodiscard]] std::vector<core::f64> getDoubleArray(std::string_view key,
                                                        std::vector<core::f64> defaultValue) const;
    [[nodiscard]] std::vector<std::string> getStringArray(std::string_view key,
                                                          std::vector<std::string> defaultValue) const;

    /// @brief Raw access, nullptr if absent.
    [[nodiscard]] const LogValue* find(std::string_view key) const;

    [[nodiscard]] bool contains(std::string_view key) const;

    /// @brief Type of the value at @p key, kNotFound if absent.
    [[nodiscard]] core::Expected<LogType> typeAt(std::string_view key) const;

    [[nodiscard]] core::usize size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    [[nodiscard]] const_iterator begin() const noexcept { return values_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return values_.end(); }

    /// @brief FNV-1a digest over keys, type tags and values, in key order.
    [[nodiscard]] core::u64 hash() const;

    bool operator==(const LogTable&) const = default;

private:
    [[noreturn]] static void failTypeMismatch(std::string_view key,
                                              LogType requested,
                                              LogType stored);
    [[nodiscard]] static std::string mismatchMessage(std::string_view key,
                                                     LogType requested,
                                                     LogType stored);

    Map values_;
};

} // namespace rlog::log
