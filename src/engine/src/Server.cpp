// /////////////////////////////////////////////////////////////////////////////
/// @file Server.cpp
/// @brief Server façade implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/engine/Server.hpp>
#include <rein/control/Multireceiver.hpp>
#include <rein/entity/Character.hpp>
#include <rein/entity/NameRegistry.hpp>
#include <rein/core/Log.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace rein::engine {

namespace {

struct Link
{
    std::unique_ptr<control::Multireceiver> group;
    std::vector<core::SessionId>            followers;
};

core::Unexpected unknownSession(core::SessionId id)
{
    return core::makeError(core::ErrorCode::NotFound, "No player with ID: " + std::to_string(id));
}

} // namespace

struct Server::Impl
{
    // Declaration order is teardown order in reverse: groups release their
    // members before characters die, characters detach before players go
    // and release their names while the name registry is still alive.
    Config                                                                config;
    session::PlayerRegistry                                               registry;
    entity::NameRegistry                                                  names;
    std::unordered_map<core::SessionId, std::unique_ptr<entity::Character>> characters;
    std::unordered_map<core::SessionId, Link>                             links;

    explicit Impl(Config cfg)
        : config{cfg}
        , registry{config.maxSessions()}
    {
    }

    entity::Character* character(core::SessionId id)
    {
        auto it = characters.find(id);
        return it != characters.end() ? it->second.get() : nullptr;
    }

    // Gives a character back to its own player when both are free.
    void restoreControl(core::SessionId id)
    {
        session::Player* player = registry.find(id);
        entity::Character* own = character(id);
        if (player == nullptr || own == nullptr)
            return;
        if (player->receiver() == nullptr && own->controller() == nullptr)
        {
            player->assumeControl(*own);
        }
    }
};

Server::Server(Config config)
    : impl_{std::make_unique<Impl>(config)}
{
    core::Log::setMinLevel(impl_->config.logLevel());
}

Server::~Server() = default;

core::Expected<void> Server::connect(core::SessionId id, std::string name)
{
    if (name.empty())
    {
        name = "Wanderer" + std::to_string(id);
    }

    auto character = entity::Character::create(std::move(name), impl_->names);
    if (!character)
    {
        return std::unexpected(std::move(character.error()));
    }

    // On failure the character is dropped here and its name released.
    auto player = impl_->registry.connect(id);
    if (!player)
    {
        return std::unexpected(std::move(player.error()));
    }

    (*player)->assumeControl(**character);
    (*character)->message("Welcome, " + (*character)->label() + ".");
    impl_->characters.insert_or_assign(id, std::move(*character));
    return {};
}

core::Expected<void> Server::command(core::SessionId id, core::Command text)
{
    return impl_->registry.sendCommand(id, std::move(text));
}

core::Expected<void> Server::link(core::SessionId leader, std::span<const core::SessionId> followers)
{
    session::Player* player = impl_->registry.find(leader);
    if (player == nullptr)
    {
        return unknownSession(leader);
    }
    if (followers.empty())
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "usage: link <id> [<id> ...]");
    }
    if (impl_->links.contains(leader))
    {
        return core::makeError(core::ErrorCode::AlreadyExists, "Already leading a group; unlink first.");
    }

    std::vector<control::Receiver*> members;
    members.reserve(followers.size());
    for (core::SessionId id : followers)
    {
        if (id == leader)
        {
            return core::makeError(core::ErrorCode::InvalidArgument, "Cannot link to yourself.");
        }
        entity::Character* follower = impl_->character(id);
        if (follower == nullptr)
        {
            return unknownSession(id);
        }
        members.push_back(follower);
    }

    auto group = control::Multireceiver::create(members, impl_->config.dedupWindowFactor());
    if (!group)
    {
        return std::unexpected(std::move(group.error()));
    }

    player->assumeControl(**group);
    player->writeMsg("You now lead: " + (*group)->label() + ".");
    core::Log::info("SERVER", "Server: player " + std::to_string(leader) + " leads "
                              + std::to_string(members.size()) + " characters");

    impl_->links.emplace(leader, Link{std::move(*group), {followers.begin(), followers.end()}});
    return {};
}

core::Expected<void> Server::unlink(core::SessionId leader)
{
    auto it = impl_->links.find(leader);
    if (it == impl_->links.end())
    {
        return core::makeError(core::ErrorCode::NotFound, "Not leading a group.");
    }

    Link dissolved = std::move(it->second);
    impl_->links.erase(it);
    dissolved.group.reset();

    impl_->restoreControl(leader);
    for (core::SessionId id : dissolved.followers)
    {
        impl_->restoreControl(id);
    }

    core::Log::info("SERVER", "Server: group of player " + std::to_string(leader) + " dissolved");
    return {};
}

core::Expected<void> Server::reclaim(core::SessionId id)
{
    session::Player* player = impl_->registry.find(id);
    entity::Character* own = impl_->character(id);
    if (player == nullptr || own == nullptr)
    {
        return unknownSession(id);
    }
    if (impl_->links.contains(id))
    {
        return unlink(id);
    }

    player->assumeControl(*own);
    own->message("You take back control of " + own->label() + ".");
    return {};
}

core::Expected<void> Server::disconnect(core::SessionId id)
{
    if (impl_->registry.find(id) == nullptr)
    {
        return unknownSession(id);
    }

    std::vector<core::SessionId> leaders;
    for (const auto& [leader, link] : impl_->links)
    {
        const entity::Character* own = impl_->character(id);
        if (leader == id || (own != nullptr && link.group->contains(*own)))
        {
            leaders.push_back(leader);
        }
    }
    for (core::SessionId leader : leaders)
    {
        REIN_TRY_VOID(unlink(leader));
    }

    REIN_TRY_VOID(impl_->registry.disconnect(id));
    impl_->characters.erase(id);
    return {};
}

core::usize Server::drain(const MessageSink& sink)
{
    core::usize delivered = 0;
    for (const auto& [id, message] : impl_->registry.receiveMessages())
    {
        sink(id, message);
        ++delivered;
    }
    return delivered;
}

const Config& Server::config() const noexcept
{
    return impl_->config;
}

session::PlayerRegistry& Server::registry() noexcept
{
    return impl_->registry;
}

} // namespace rein::engine
