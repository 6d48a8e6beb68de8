// /////////////////////////////////////////////////////////////////////////////
/// @file CommandTable.hpp
/// @brief Name -> handler mapping for text commands of an entity.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/core/Expected.hpp>

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rein::entity {

// /////////////////////////////////////////////////////////////////////////////
/// @class CommandTable
/// @brief Immutable command registry of one entity kind.
///
/// Built once from an explicit entry list, usually as a function-local
/// static of the owning class. A derived kind extends its base table; the
/// names it introduces are its "unique" commands and get their own section
/// of the help menu, after the sections of its bases.
///
/// @tparam Owner Class whose member functions handle the commands.
// /////////////////////////////////////////////////////////////////////////////
template <typename Owner>
class CommandTable final
{
public:
    using Handler = core::Expected<void> (Owner::*)(std::string_view args);

    struct Entry
    {
        std::string_view name;
        Handler          handler;
        std::string_view usage;
    };

    /// @brief Root table.
    /// @param kind    Display name of the entity kind, e.g. "Character".
    /// @param entries Commands of this kind.
    CommandTable(std::string_view kind, std::initializer_list<Entry> entries)
        : kind_{kind}
    {
        build(entries);
    }

    /// @brief Table extending @p base. Entries may override base commands.
    CommandTable(const CommandTable& base, std::string_view kind, std::initializer_list<Entry> entries)
        : kind_{kind}
        , entries_{base.entries_}
        , helpMenu_{base.helpMenu_}
    {
        build(entries);
    }

    /// @brief Returns the entry for @p name, or nullptr.
    [[nodiscard]] const Entry* find(std::string_view name) const noexcept
    {
        auto it = entries_.find(name);
        return it != entries_.end() ? &it->second : nullptr;
    }

    /// @brief Display name of the kind that built this table.
    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }

    /// @brief Commands introduced by this kind, sorted by name.
    [[nodiscard]] std::span<const std::string> unique() const noexcept { return unique_; }

    /// @brief Number of commands, inherited ones included.
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// @brief Preformatted help menu, base sections first.
    [[nodiscard]] const std::string& helpMenu() const noexcept { return helpMenu_; }

private:
    void build(std::initializer_list<Entry> entries)
    {
        for (const Entry& entry : entries)
        {
            const bool inherited = entries_.contains(entry.name);
            entries_.insert_or_assign(std::string{entry.name}, entry);
            if (!inherited)
            {
                unique_.emplace_back(entry.name);
            }
        }
        std::ranges::sort(unique_);

        helpMenu_ += "[" + kind_ + " Commands]\n";
        for (std::size_t i = 0; i < unique_.size(); ++i)
        {
            if (i != 0)
                helpMenu_ += '\t';
            helpMenu_ += unique_[i];
        }
        helpMenu_ += '\n';
    }

    std::string                               kind_;
    std::map<std::string, Entry, std::less<>> entries_;
    std::vector<std::string>                  unique_;
    std::string                               helpMenu_;
};

} // namespace rein::entity
