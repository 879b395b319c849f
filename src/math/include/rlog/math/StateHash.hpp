/**
 * @file StateHash.hpp
 * @brief FNV-1a incremental hash for replay determinism checks.
 *
 * Every logged table can be reduced to an 8-byte digest. Comparing the
 * digests of a recorded cycle and of its replay is the cheapest way to prove
 * that the control program observed identical inputs.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef RLOG_MATH_STATE_HASH_HPP
    #define RLOG_MATH_STATE_HASH_HPP

    #include <rlog/core/Types.hpp>
    #include <rlog/core/Concepts.hpp>

    #include <span>
    #include <string_view>

namespace rlog::math {

/**
 * @brief Incremental FNV-1a hasher.
 */
class StateHash final {
public:
    static constexpr core::u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr core::u64 kPrime       = 1099511628211ULL;

    constexpr StateHash() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    StateHash &hashBytes(std::span<const core::byte> data);

    /**
     * @brief Feed a string's length and characters into the hash.
     *
     * The length prefix keeps ("ab","c") and ("a","bc") apart.
     */
    StateHash &hashString(std::string_view str);

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Blittable type.
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <core::Blittable T>
    StateHash &combine(const T &value)
    {
        const auto *ptr = reinterpret_cast<const core::byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    /**
     * @brief Feed another object's digest into the hash.
     */
    template <core::Hashable T>
    StateHash &combineHash(const T &value)
    {
        return combine(static_cast<core::u64>(value.hash()));
    }

    /**
     * @brief Finalise and return the current digest.
     * @return 64-bit FNV-1a hash.
     */
    [[nodiscard]] constexpr core::u64 digest() const { return _hash; }

    /**
     * @brief Reset the hasher to its initial state.
     */
    constexpr void reset() { _hash = kOffsetBasis; }

    /**
     * @brief Compare two digests for equality.
     */
    [[nodiscard]] static constexpr bool match(core::u64 a, core::u64 b) { return a == b; }

private:
    core::u64 _hash = kOffsetBasis;
};

} // namespace rlog::math

#endif // RLOG_MATH_STATE_HASH_HPP
