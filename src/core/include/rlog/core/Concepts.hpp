/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic interfaces across the library.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_CORE_CONCEPTS_HPP
    #define RLOG_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <type_traits>

namespace rlog::core {

/**
 * @brief A type that is trivially copyable and standard-layout, making it
 *        safe to hash as raw bytes.
 */
template <typename T>
concept Blittable = std::is_trivially_copyable_v<T> && std::is_standard_layout_v<T>;

/**
 * @brief A type that exposes a deterministic hash via a `hash()` member.
 */
template <typename T>
concept Hashable = requires(const T &val) {
    { val.hash() } -> std::convertible_to<u64>;
};

} // namespace rlog::core

#endif // RLOG_CORE_CONCEPTS_HPP
