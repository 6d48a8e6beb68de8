// /////////////////////////////////////////////////////////////////////////////
/// @file NameRegistry.hpp
/// @brief Set of character names in use within one world.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/core/Expected.hpp>
#include <rein/core/NonCopyable.hpp>
#include <rein/core/Types.hpp>

#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace rein::entity {

/// @brief Keeps character names unique so labels identify one entity.
///
/// Owned by whoever owns the characters (the Server); characters hold a
/// non-owning pointer and release their name on rename or destruction.
class NameRegistry final : public core::NonCopyable<NameRegistry>
{
public:
    /// @brief Reserves @p name.
    /// @return AlreadyExists ("Name already taken.") if it is in use.
    [[nodiscard]] core::Expected<void> claim(std::string_view name);

    /// @brief Frees @p name. No-op if it is not reserved.
    void release(std::string_view name);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] core::usize size() const noexcept { return names_.size(); }

private:
    std::set<std::string, std::less<>> names_;
};

} // namespace rein::entity
