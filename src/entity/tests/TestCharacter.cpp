/**
 * @file TestCharacter.cpp
 * @brief Unit tests for entity::Character and entity::CommandTable.
 */

#include <catch2/catch.hpp>

#include "rein/entity/Character.hpp"
#include "rein/entity/NameRegistry.hpp"
#include "rein/session/Player.hpp"

#include <string>
#include <string_view>
#include <vector>

using namespace rein;
using namespace rein::entity;

namespace {

using Messages = std::vector<core::Message>;

/// Character kind with one extra command.
class Wizard final : public Character
{
public:
    using Character::Character;

    static const Table& wizardCommands()
    {
        static const Table table{Character::commands(), "Wizard", {
            {"cast", static_cast<Table::Handler>(&Wizard::cmdCast),
             "Cast a spell.\n"
             "usage: cast [spell]"},
        }};
        return table;
    }

protected:
    const Table& commandTable() const override { return wizardCommands(); }

private:
    core::Expected<void> cmdCast(std::string_view args)
    {
        if (args.empty())
            return core::makeError(core::ErrorCode::InvalidArgument, "usage: cast [spell]");
        message(label() + " casts " + std::string{args} + ".");
        return {};
    }
};

Messages run(session::Player& player, std::initializer_list<const char*> lines)
{
    for (const char* line : lines)
        player.enqueue(line);
    player.poke();

    Messages out;
    for (core::Message msg; player.takeMessage(msg);)
        out.push_back(msg);
    return out;
}

} // namespace

TEST_CASE("Character label names its kind", "[entity][character]")
{
    Character ann{"Ann"};
    REQUIRE(ann.label() == "Ann the Character");
    REQUIRE(ann.name() == "Ann");
}

TEST_CASE("Character help lists the command menu", "[entity][character]")
{
    session::Player player{1};
    Character ann{"Ann"};
    player.assumeControl(ann);

    REQUIRE(run(player, {"help"}) == Messages{"[Character Commands]\nhelp\tname\tsay\n"});
}

TEST_CASE("Character help shows the usage of one command", "[entity][character]")
{
    session::Player player{1};
    Character ann{"Ann"};
    player.assumeControl(ann);

    REQUIRE(run(player, {"help say"}) == Messages{"Say a message aloud.\nusage: say [msg]"});
    REQUIRE(run(player, {"help fly"}) == Messages{"Command 'fly' not recognized."});
}

TEST_CASE("Character say broadcasts through its controller", "[entity][character]")
{
    session::Player player{1};
    Character ann{"Ann"};
    player.assumeControl(ann);

    REQUIRE(run(player, {"say hello world"}) == Messages{"Ann the Character : hello world"});
}

TEST_CASE("Character name renames the character", "[entity][character]")
{
    session::Player player{1};
    Character ann{"Ann"};
    player.assumeControl(ann);

    REQUIRE(run(player, {"name Bea"}) == Messages{"You are now known as Bea the Character."});
    REQUIRE(ann.name() == "Bea");

    REQUIRE(run(player, {"name"}) == Messages{"usage: name [new name]"});
    REQUIRE(ann.name() == "Bea");
}

TEST_CASE("Character reports each failing line and keeps going", "[entity][character]")
{
    session::Player player{1};
    Character ann{"Ann"};
    player.assumeControl(ann);

    const Messages out = run(player, {"say one", "jump", "", "   ", "say two", "fly away"});

    REQUIRE(out == Messages{
        "Ann the Character : one",
        "Command 'jump' not recognized.",
        "Ann the Character : two",
        "Command 'fly' not recognized.",
    });
    REQUIRE(player.pendingCommands() == 0);
}

TEST_CASE("Character without a controller ignores updates and messages", "[entity][character]")
{
    Character ann{"Ann"};
    ann.update();
    ann.message("nobody hears this");
    REQUIRE(ann.controller() == nullptr);
}

TEST_CASE("CommandTable extension adds a section for the derived kind", "[entity][commandtable]")
{
    const Character::Table& table = Wizard::wizardCommands();

    REQUIRE(table.kind() == "Wizard");
    REQUIRE(table.size() == 4);
    REQUIRE(table.unique().size() == 1);
    REQUIRE(table.unique().front() == "cast");
    REQUIRE(table.find("say") != nullptr);
    REQUIRE(table.find("dance") == nullptr);
    REQUIRE(table.helpMenu() == "[Character Commands]\nhelp\tname\tsay\n[Wizard Commands]\ncast\n");

    REQUIRE(Character::commands().size() == 3);
    REQUIRE(Character::commands().find("cast") == nullptr);
}

TEST_CASE("Derived character dispatches both its own and inherited commands", "[entity][character]")
{
    session::Player player{1};
    Wizard merlin{"Merlin"};
    player.assumeControl(merlin);

    REQUIRE(merlin.label() == "Merlin the Wizard");
    REQUIRE(run(player, {"cast fireball", "say hi", "cast"}) == Messages{
        "Merlin the Wizard casts fireball.",
        "Merlin the Wizard : hi",
        "usage: cast [spell]",
    });
    REQUIRE(run(player, {"help cast"}) == Messages{"Cast a spell.\nusage: cast [spell]"});
}

TEST_CASE("NameRegistry rejects a name already in use", "[entity][names]")
{
    NameRegistry names;

    REQUIRE(names.claim("Ann").has_value());
    REQUIRE(names.contains("Ann"));

    auto again = names.claim("Ann");
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyExists);
    REQUIRE(again.error().message() == "Name already taken.");

    names.release("Ann");
    names.release("Ann");
    REQUIRE(names.size() == 0);
    REQUIRE(names.claim("Ann").has_value());
}

TEST_CASE("Character create claims its name until destruction", "[entity][names]")
{
    NameRegistry names;
    {
        auto ann = Character::create("Ann", names);
        REQUIRE(ann.has_value());
        REQUIRE(names.contains("Ann"));

        auto twin = Character::create("Ann", names);
        REQUIRE_FALSE(twin.has_value());
        REQUIRE(twin.error().code() == core::ErrorCode::kAlreadyExists);
    }
    REQUIRE_FALSE(names.contains("Ann"));
}

TEST_CASE("Character name refuses a name held by another character", "[entity][names]")
{
    NameRegistry names;
    session::Player player{1};
    auto ann = Character::create("Ann", names);
    auto bob = Character::create("Bob", names);
    REQUIRE(ann.has_value());
    REQUIRE(bob.has_value());
    player.assumeControl(**ann);

    REQUIRE(run(player, {"name Bob"}) == Messages{"Name already taken."});
    REQUIRE((*ann)->name() == "Ann");

    REQUIRE(run(player, {"name Ann"}) == Messages{"Name already taken."});

    REQUIRE(run(player, {"name Cid"}) == Messages{"You are now known as Cid the Character."});
    REQUIRE(names.contains("Cid"));
    REQUIRE_FALSE(names.contains("Ann"));
    REQUIRE(names.size() == 2);
}
