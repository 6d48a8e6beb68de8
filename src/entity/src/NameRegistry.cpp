// /////////////////////////////////////////////////////////////////////////////
/// @file NameRegistry.cpp
/// @brief NameRegistry implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/entity/NameRegistry.hpp>

namespace rein::entity {

core::Expected<void> NameRegistry::claim(std::string_view name)
{
    if (!names_.emplace(name).second)
    {
        return core::makeError(core::ErrorCode::AlreadyExists, "Name already taken.");
    }
    return {};
}

void NameRegistry::release(std::string_view name)
{
    if (auto it = names_.find(name); it != names_.end())
    {
        names_.erase(it);
    }
}

bool NameRegistry::contains(std::string_view name) const
{
    return names_.contains(name);
}

} // namespace rein::entity
