// /////////////////////////////////////////////////////////////////////////////
/// @file Player.hpp
/// @brief Controller bound to one connected client session.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/control/Controller.hpp>
#include <rein/container/Channel.hpp>
#include <rein/core/Types.hpp>

#include <vector>

namespace rein::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class Player
/// @brief Concrete Controller over two independent FIFO channels.
///
/// Players are created and destroyed by PlayerRegistry. The transport side
/// feeds enqueue() and drains takeMessage(); the driven receiver reads
/// commands and writes messages through the Controller interface.
// /////////////////////////////////////////////////////////////////////////////
class Player final : public control::Controller
{
public:
    /// @brief Constructs a player for the given session.
    /// @param id Session identifier.
    explicit Player(core::SessionId id);
    ~Player() override;

    /// @brief Returns the session identifier.
    [[nodiscard]] core::SessionId id() const noexcept;

    [[nodiscard]] core::Command readCmd() override;
    void writeMsg(core::Message msg) override;
    [[nodiscard]] bool hasCmd() const override;
    [[nodiscard]] bool hasMsg() const override;

    /// @brief Queues a command from the transport.
    ///
    /// While an update pass is running the command is held back and handed
    /// to the receiver on the next trigger, ahead of newer commands.
    void enqueue(core::Command command);

    /// @brief Runs one update pass of the attached receiver, if any.
    ///
    /// Re-entrant calls made from inside the pass are ignored.
    void poke();

    /// @brief Pops the oldest outbound message.
    /// @param[out] out Filled with the message if available.
    /// @return @c true if a message was dequeued.
    bool takeMessage(core::Message& out);

    /// @brief Returns the number of commands not yet read by the receiver.
    [[nodiscard]] core::usize pendingCommands() const;

    /// @brief Returns the number of messages not yet drained.
    [[nodiscard]] core::usize pendingMessages() const;

private:
    void flushDeferred();

    core::SessionId                   id_;
    container::Channel<core::Command> commands_;
    container::Channel<core::Message> messages_;
    std::vector<core::Command>        deferred_;
    bool                              updating_{false};
};

} // namespace rein::session
