// /////////////////////////////////////////////////////////////////////////////
/// @file Character.cpp
/// @brief Character implementation and its command table.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/entity/Character.hpp>
#include <rein/control/Controller.hpp>
#include <rein/core/Log.hpp>

namespace rein::entity {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n";

std::string_view trim(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

// Splits "<word> <rest>" on the first space.
std::pair<std::string_view, std::string_view> splitWord(std::string_view text) noexcept
{
    const auto space = text.find(' ');
    if (space == std::string_view::npos)
        return {text, {}};
    return {text.substr(0, space), trim(text.substr(space + 1))};
}

core::Unexpected notRecognized(std::string_view command)
{
    return core::makeError(core::ErrorCode::NotFound,
                           "Command '" + std::string{command} + "' not recognized.");
}

} // namespace

Character::Character(std::string name, NameRegistry* names)
    : name_{std::move(name)}
    , names_{names}
{}

Character::~Character()
{
    if (names_ != nullptr)
    {
        names_->release(name_);
    }
}

core::Expected<std::unique_ptr<Character>> Character::create(std::string name, NameRegistry& names)
{
    REIN_TRY_VOID(names.claim(name));
    return std::make_unique<Character>(std::move(name), &names);
}

const Character::Table& Character::commands()
{
    static const Table table{"Character", {
        {"help", &Character::cmdHelp,
         "Show relevant help information for a particular command.\n"
         "usage: help [command]\n"
         "If no command is supplied, a list of all commands is shown."},
        {"say",  &Character::cmdSay,
         "Say a message aloud.\n"
         "usage: say [msg]"},
        {"name", &Character::cmdName,
         "Change the name you are known by.\n"
         "usage: name [new name]"},
    }};
    return table;
}

const Character::Table& Character::commandTable() const
{
    return commands();
}

void Character::update()
{
    for (control::Controller* ctrl = controller();
         ctrl != nullptr && ctrl->hasCmd();
         ctrl = controller())
    {
        const core::Command line = ctrl->readCmd();
        if (trim(line).empty())
        {
            continue;
        }

        if (auto result = parseCommand(line); !result)
        {
            message(result.error().message());
        }
    }
}

std::string Character::label() const
{
    return name_ + " the " + commandTable().kind();
}

void Character::message(core::Message msg)
{
    if (control::Controller* ctrl = controller(); ctrl != nullptr)
    {
        ctrl->writeMsg(std::move(msg));
    }
}

core::Expected<void> Character::parseCommand(std::string_view line)
{
    const auto [command, args] = splitWord(trim(line));
    const Table::Entry* entry = commandTable().find(command);
    if (entry == nullptr)
    {
        core::Log::debug("ENTITY", "Character: unknown command from " + name_);
        return notRecognized(command);
    }
    return (this->*(entry->handler))(args);
}

core::Expected<void> Character::cmdHelp(std::string_view args)
{
    if (args.empty())
    {
        message(commandTable().helpMenu());
        return {};
    }

    const auto command = splitWord(args).first;
    const Table::Entry* entry = commandTable().find(command);
    if (entry == nullptr)
    {
        return notRecognized(command);
    }
    message(std::string{entry->usage});
    return {};
}

core::Expected<void> Character::cmdSay(std::string_view args)
{
    message(label() + " : " + std::string{args});
    return {};
}

core::Expected<void> Character::cmdName(std::string_view args)
{
    if (args.empty())
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "usage: name [new name]");
    }
    if (names_ != nullptr)
    {
        REIN_TRY_VOID(names_->claim(args));
        names_->release(name_);
    }
    name_ = std::string{args};
    message("You are now known as " + label() + ".");
    return {};
}

} // namespace rein::entity
