// /////////////////////////////////////////////////////////////////////////////
/// @file LogValue.cpp
/// @brief LogType names.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/log/LogValue.hpp>

namespace rlog::log {

static_assert(std::variant_size_v<LogValue> == 8);
static_assert(std::is_same_v<std::variant_alternative_t<
    static_cast<core::usize>(LogType::kStringArray), LogValue>, std::vector<std::string>>);

const char* toString(LogType type) noexcept
{
    switch (type)
    {
        case LogType::kBoolean:      return "boolean";
        case LogType::kInteger:      return "int64";
        case LogType::kDouble:       return "double";
        case LogType::kString:       return "string";
        case LogType::kBooleanArray: return "boolean[]";
        case LogType::kIntegerArray: return "int64[]";
        case LogType::kDoubleArray:  return "double[]";
        case LogType::kStringArray:  return "string[]";
    }
    return "unknown";
}

} // namespace rlog::log
