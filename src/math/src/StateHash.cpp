// /////////////////////////////////////////////////////////////////////////////
/// @file StateHash.cpp
/// @brief StateHash implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/math/StateHash.hpp>

namespace rlog::math {

StateHash &StateHash::hashBytes(std::span<const core::byte> data)
{
    for (const auto b : data)
    {
        _hash ^= static_cast<core::u8>(b);
        _hash *= kPrime;
    }
    return *this;
}

StateHash &StateHash::hashString(std::string_view str)
{
    combine(static_cast<core::u64>(str.size()));
    return hashBytes({reinterpret_cast<const core::byte *>(str.data()), str.size()});
}

} // namespace rlog::math
