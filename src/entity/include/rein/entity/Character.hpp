// /////////////////////////////////////////////////////////////////////////////
/// @file Character.hpp
/// @brief Reference playable entity driven through text commands.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/control/Monoreceiver.hpp>
#include <rein/entity/CommandTable.hpp>
#include <rein/entity/NameRegistry.hpp>
#include <rein/core/Expected.hpp>
#include <rein/core/Types.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace rein::entity {

// /////////////////////////////////////////////////////////////////////////////
/// @class Character
/// @brief Monoreceiver that parses each queued line as "<command> <args>".
///
/// Unknown commands and failing handlers are reported back to the
/// controller as a single message; the remaining queued lines are still
/// processed. Subclasses add commands by overriding commandTable() with a
/// table that extends commands().
///
/// A character built with a NameRegistry keeps its name unique there: the
/// name must already be claimed, renames claim the new name first, and the
/// destructor releases it. The registry must outlive the character.
// /////////////////////////////////////////////////////////////////////////////
class Character : public control::Monoreceiver
{
public:
    using Table = CommandTable<Character>;

    /// @param name  Display name, already claimed in @p names if given.
    /// @param names Registry the name is released to, or nullptr.
    explicit Character(std::string name, NameRegistry* names = nullptr);
    ~Character() override;

    /// @brief Claims @p name in @p names and builds a character owning it.
    /// @return AlreadyExists if the name is taken.
    [[nodiscard]] static core::Expected<std::unique_ptr<Character>>
        create(std::string name, NameRegistry& names);

    /// @brief Drains and executes every queued command in FIFO order.
    void update() override;

    /// @brief "<name> the <kind>".
    [[nodiscard]] std::string label() const override;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Sends @p msg to the controller. Dropped when detached.
    void message(core::Message msg);

    /// @brief Command table shared by every plain Character.
    [[nodiscard]] static const Table& commands();

protected:
    /// @brief Table used to dispatch commands for the dynamic kind.
    [[nodiscard]] virtual const Table& commandTable() const;

    /// @brief Executes one non-blank line.
    [[nodiscard]] core::Expected<void> parseCommand(std::string_view line);

    core::Expected<void> cmdHelp(std::string_view args);
    core::Expected<void> cmdSay(std::string_view args);
    core::Expected<void> cmdName(std::string_view args);

private:
    std::string   name_;
    NameRegistry* names_;
};

} // namespace rein::entity
