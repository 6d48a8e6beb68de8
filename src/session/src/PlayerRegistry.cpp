// /////////////////////////////////////////////////////////////////////////////
/// @file PlayerRegistry.cpp
/// @brief PlayerRegistry and MessageStream implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/session/PlayerRegistry.hpp>
#include <rein/control/Receiver.hpp>
#include <rein/core/Log.hpp>

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace rein::session {

struct PlayerRegistry::Impl
{
    core::u32                                         maxSessions;
    std::vector<std::unique_ptr<Player>>              ordered;
    std::unordered_map<core::SessionId, Player*>      byId;
};

PlayerRegistry::PlayerRegistry(core::u32 maxSessions)
    : impl_{std::make_unique<Impl>()}
{
    impl_->maxSessions = maxSessions;
}

PlayerRegistry::~PlayerRegistry() = default;

core::Expected<Player*> PlayerRegistry::connect(core::SessionId id)
{
    if (impl_->byId.contains(id))
    {
        return core::makeError(core::ErrorCode::AlreadyExists,
                               "ID already taken: " + std::to_string(id));
    }
    if (impl_->ordered.size() >= impl_->maxSessions)
    {
        return core::makeError(core::ErrorCode::OutOfRange,
                               "Session limit reached: " + std::to_string(impl_->maxSessions));
    }

    auto player = std::make_unique<Player>(id);
    auto* ptr = player.get();
    impl_->ordered.push_back(std::move(player));
    impl_->byId.emplace(id, ptr);

    core::Log::info("SESSION", "PlayerRegistry: player " + std::to_string(id) + " connected");
    return ptr;
}

core::Expected<void> PlayerRegistry::sendCommand(core::SessionId id, core::Command command)
{
    Player* player = find(id);
    if (player == nullptr)
    {
        core::Log::warn("SESSION", "PlayerRegistry: command for unknown player " + std::to_string(id));
        return core::makeError(core::ErrorCode::NotFound,
                               "No player with ID: " + std::to_string(id));
    }

    player->enqueue(std::move(command));
    player->poke();
    return {};
}

MessageStream PlayerRegistry::receiveMessages() noexcept
{
    return MessageStream{*this};
}

core::Expected<void> PlayerRegistry::disconnect(core::SessionId id)
{
    auto it = impl_->byId.find(id);
    if (it == impl_->byId.end())
    {
        return core::makeError(core::ErrorCode::NotFound,
                               "No player with ID: " + std::to_string(id));
    }

    Player* player = it->second;
    if (control::Receiver* target = player->receiver(); target != nullptr)
    {
        target->detach();
    }

    impl_->byId.erase(it);
    std::erase_if(impl_->ordered, [player](const std::unique_ptr<Player>& p) { return p.get() == player; });

    core::Log::info("SESSION", "PlayerRegistry: player " + std::to_string(id) + " disconnected");
    return {};
}

Player* PlayerRegistry::find(core::SessionId id) noexcept
{
    auto it = impl_->byId.find(id);
    return (it != impl_->byId.end()) ? it->second : nullptr;
}

const Player* PlayerRegistry::find(core::SessionId id) const noexcept
{
    auto it = impl_->byId.find(id);
    return (it != impl_->byId.end()) ? it->second : nullptr;
}

void PlayerRegistry::forEach(const std::function<void(Player&)>& callback)
{
    for (auto& player : impl_->ordered)
    {
        callback(*player);
    }
}

core::u32 PlayerRegistry::activeCount() const noexcept
{
    return static_cast<core::u32>(impl_->ordered.size());
}

Player* PlayerRegistry::playerAt(core::usize index) const noexcept
{
    return index < impl_->ordered.size() ? impl_->ordered[index].get() : nullptr;
}

// ---- MessageStream -----------------------------------------------------------

bool MessageStream::pull(PlayerRegistry& registry, core::usize& index, value_type& out)
{
    for (Player* player = registry.playerAt(index); player != nullptr; player = registry.playerAt(++index))
    {
        if (player->takeMessage(out.second))
        {
            out.first = player->id();
            return true;
        }
    }
    return false;
}

MessageStream::Iterator MessageStream::begin() const
{
    return Iterator{registry_};
}

MessageStream::Iterator::Iterator(PlayerRegistry* registry)
    : registry_{registry}
{
    if (registry_ != nullptr && !MessageStream::pull(*registry_, index_, current_))
    {
        registry_ = nullptr;
    }
}

MessageStream::Iterator& MessageStream::Iterator::operator++()
{
    if (registry_ != nullptr && !MessageStream::pull(*registry_, index_, current_))
    {
        registry_ = nullptr;
    }
    return *this;
}

} // namespace rein::session
