// /////////////////////////////////////////////////////////////////////////////
/// @file Server.hpp
/// @brief Top-level server façade (Façade pattern).
///
/// Wires the player registry, one Character per session, and the
/// Multireceiver groups created by linking sessions together.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rein/engine/Config.hpp>
#include <rein/session/PlayerRegistry.hpp>
#include <rein/core/Expected.hpp>
#include <rein/core/Types.hpp>

#include <functional>
#include <memory>
#include <span>
#include <string>

namespace rein::engine {

/// @brief Top-level server façade.
///
/// Owns the registry, the characters, and the groups. The transport calls
/// connect / command / disconnect with session ids and drains replies with
/// drain(); it never touches controllers or receivers directly.
class Server
{
public:
    using MessageSink = std::function<void(core::SessionId, const core::Message&)>;

    /// @param config Immutable server configuration.
    explicit Server(Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Registers session @p id and gives it a new Character.
    ///
    /// An empty @p name defaults to "Wanderer<id>". Names are unique among
    /// connected sessions and freed on disconnect.
    /// @return AlreadyExists if @p id or @p name is taken, OutOfRange if
    ///         the registry is full. Nothing changes on error.
    [[nodiscard]] core::Expected<void> connect(core::SessionId id, std::string name);

    /// @brief Forwards one line of input to session @p id.
    /// @return NotFound if @p id is not connected.
    [[nodiscard]] core::Expected<void> command(core::SessionId id, core::Command text);

    /// @brief Makes session @p leader drive the characters of @p followers
    ///        as a single group.
    ///
    /// The leader's own character and the followers' players lose control
    /// until unlink() or reclaim().
    /// @return NotFound for an unknown session, InvalidArgument if the
    ///         leader lists itself, no followers, or a session twice, or
    ///         AlreadyExists if the leader already leads a group.
    [[nodiscard]] core::Expected<void> link(core::SessionId leader,
                                            std::span<const core::SessionId> followers);

    /// @brief Dissolves the group led by @p leader and hands every character
    ///        back to its own player.
    /// @return NotFound if @p leader leads no group.
    [[nodiscard]] core::Expected<void> unlink(core::SessionId leader);

    /// @brief Puts session @p id back in control of its own character.
    ///
    /// A character taken back this way is evicted from its group on the
    /// group's next update.
    /// @return NotFound if @p id is not connected.
    [[nodiscard]] core::Expected<void> reclaim(core::SessionId id);

    /// @brief Dissolves any group involving session @p id, then removes it.
    /// @return NotFound if @p id is not connected.
    [[nodiscard]] core::Expected<void> disconnect(core::SessionId id);

    /// @brief Drains every pending message, in session connection order.
    /// @return Number of messages delivered to @p sink.
    core::usize drain(const MessageSink& sink);

    /// @brief Access the active configuration.
    [[nodiscard]] const Config& config() const noexcept;

    /// @brief Access the player registry.
    [[nodiscard]] session::PlayerRegistry& registry() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rein::engine
