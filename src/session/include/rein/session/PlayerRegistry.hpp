// /////////////////////////////////////////////////////////////////////////////
/// @file PlayerRegistry.hpp
/// @brief Registry of connected players keyed by session id.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/session/Player.hpp>
#include <rein/core/Constants.hpp>
#include <rein/core/Expected.hpp>
#include <rein/core/NonCopyable.hpp>
#include <rein/core/Types.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <utility>

namespace rein::session {

class PlayerRegistry;

// /////////////////////////////////////////////////////////////////////////////
/// @class MessageStream
/// @brief Lazy single-pass sequence of (session id, message) pairs.
///
/// Each step pops one message from the registry's players, visiting them in
/// connection order and moving on once a player's queue is empty. A stream
/// ends after one sweep; call PlayerRegistry::receiveMessages() again to
/// start a new one. The registry must not gain or lose players while a
/// stream is being consumed.
// /////////////////////////////////////////////////////////////////////////////
class MessageStream
{
public:
    using value_type = std::pair<core::SessionId, core::Message>;

    class Iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type   = std::ptrdiff_t;
        using value_type        = MessageStream::value_type;
        using reference         = const value_type&;
        using pointer           = const value_type*;

        Iterator() = default;

        [[nodiscard]] reference operator*() const noexcept { return current_; }
        [[nodiscard]] pointer operator->() const noexcept { return &current_; }

        Iterator& operator++();
        void operator++(int) { ++*this; }

        [[nodiscard]] friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept
        {
            return it.registry_ == nullptr;
        }

    private:
        friend class MessageStream;

        explicit Iterator(PlayerRegistry* registry);

        PlayerRegistry* registry_{nullptr};
        core::usize     index_{0};
        value_type      current_{};
    };

    [[nodiscard]] Iterator begin() const;
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

private:
    friend class PlayerRegistry;

    explicit MessageStream(PlayerRegistry& registry) noexcept : registry_{&registry} {}

    /// Pops the next message at or after player @p index.
    static bool pull(PlayerRegistry& registry, core::usize& index, value_type& out);

    PlayerRegistry* registry_;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PlayerRegistry
/// @brief Owns every connected Player and maps session ids to them.
///
/// Create-on-connect, remove-on-disconnect. Iteration follows connection
/// order. No internal locking: callers serialize access.
// /////////////////////////////////////////////////////////////////////////////
class PlayerRegistry final : public core::NonCopyable<PlayerRegistry>
{
public:
    /// @param maxSessions Upper bound on simultaneously connected players.
    explicit PlayerRegistry(core::u32 maxSessions = core::kMaxSessions);
    ~PlayerRegistry();

    /// @brief Creates and registers a player for a connecting client.
    /// @return The new player, AlreadyExists if @p id is taken, or
    ///         OutOfRange if the registry is full. The registry is left
    ///         unchanged on error.
    [[nodiscard]] core::Expected<Player*> connect(core::SessionId id);

    /// @brief Queues @p command for player @p id and runs one update pass
    ///        of its receiver before returning.
    /// @return NotFound if @p id is not registered (nothing is queued).
    [[nodiscard]] core::Expected<void> sendCommand(core::SessionId id, core::Command command);

    /// @brief Starts a sweep draining every player's outbound queue once.
    [[nodiscard]] MessageStream receiveMessages() noexcept;

    /// @brief Detaches the player's receiver, then removes the player.
    /// @return NotFound if @p id is not registered.
    [[nodiscard]] core::Expected<void> disconnect(core::SessionId id);

    /// @brief Finds a player by session id.
    /// @return Pointer to the player or nullptr.
    [[nodiscard]] Player* find(core::SessionId id) noexcept;

    /// @brief Finds a player by session id (const).
    [[nodiscard]] const Player* find(core::SessionId id) const noexcept;

    /// @brief Iterates all players in connection order.
    void forEach(const std::function<void(Player&)>& callback);

    /// @brief Returns the number of connected players.
    [[nodiscard]] core::u32 activeCount() const noexcept;

private:
    friend class MessageStream;

    [[nodiscard]] Player* playerAt(core::usize index) const noexcept;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rein::session
