/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * RLOG_TRY macros for early-return propagation.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_CORE_EXPECTED_HPP
    #define RLOG_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace rlog::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace rlog::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type rlog::core::Expected<U>.
 */
#define RLOG_TRY(expr)                                                    \
    ({                                                                     \
        auto &&_rlog_result = (expr);                                      \
        if (!_rlog_result.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_rlog_result.error()));        \
        std::move(_rlog_result.value());                                   \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type rlog::core::ExpectedVoid.
 */
#define RLOG_TRY_VOID(expr)                                               \
    do {                                                                    \
        auto &&_rlog_result = (expr);                                      \
        if (!_rlog_result.has_value()) [[unlikely]]                        \
            return std::unexpected(std::move(_rlog_result.error()));        \
    } while (false)

#endif // RLOG_CORE_EXPECTED_HPP
