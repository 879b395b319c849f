// /////////////////////////////////////////////////////////////////////////////
/// @file KeyTypeRegistry.cpp
/// @brief KeyTypeRegistry implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/logger/KeyTypeRegistry.hpp>
#include <rlog/core/Constants.hpp>

#include <utility>
#include <vector>

namespace rlog::logger {

std::string KeyTypeRegistry::fullKey(std::string_view prefix, std::string_view key)
{
    if (prefix.empty())
    {
        return std::string{key};
    }

    std::string full;
    full.reserve(prefix.size() + 1 + key.size());
    full.append(prefix);
    full.push_back(core::kKeySeparator);
    full.append(key);
    return full;
}

core::Expected<void> KeyTypeRegistry::check(std::string_view prefix, const log::LogTable& table)
{
    std::vector<std::pair<std::string, log::LogType>> fresh;

    for (const auto& [key, value] : table)
    {
        auto full = fullKey(prefix, key);
        const auto type = log::typeOf(value);

        const auto it = types_.find(full);
        if (it == types_.end())
        {
            fresh.emplace_back(std::move(full), type);
            continue;
        }
        if (it->second != type)
        {
            return core::makeError(core::ErrorCode::kTypeMismatch,
                                   "'" + full + "' logged as " + log::toString(type)
                                       + " after " + log::toString(it->second));
        }
    }

    for (auto& [full, type] : fresh)
    {
        types_.emplace(std::move(full), type);
    }
    return {};
}

core::Expected<log::LogType> KeyTypeRegistry::typeOf(std::string_view fullKey) const
{
    const auto it = types_.find(std::string{fullKey});
    if (it == types_.end())
    {
        return core::makeError(core::ErrorCode::kNotFound,
                               "no type registered for '" + std::string{fullKey} + "'");
    }
    return it->second;
}

core::usize KeyTypeRegistry::size() const noexcept
{
    return types_.size();
}

void KeyTypeRegistry::clear() noexcept
{
    types_.clear();
}

} // namespace rlog::logger
