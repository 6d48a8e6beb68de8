// /////////////////////////////////////////////////////////////////////////////
/// @file Controller.hpp
/// @brief Two-queue endpoint between an actor and the entity it drives.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/core/NonCopyable.hpp>
#include <rein/core/Types.hpp>

namespace rein::control {

class Receiver;
class MultiController;

// /////////////////////////////////////////////////////////////////////////////
/// @class Controller
/// @brief Strategy interface for anything that issues commands and consumes
///        feedback: a connected player, an AI, a scripted feed.
///
/// A Controller acts as two streams: an inbound stream of commands read by
/// the driven Receiver, and an outbound stream of messages written by it.
/// How commands are produced and messages consumed is left to the
/// implementation.
///
/// The receiver back-reference is non-owning and only changes through
/// Receiver::attach() / Receiver::detach().
// /////////////////////////////////////////////////////////////////////////////
class Controller : public core::NonMovable<Controller>
{
public:
    virtual ~Controller();

    /// @brief Removes and returns the oldest queued command.
    ///
    /// Suspends the caller while the queue is empty. Callers on the update
    /// thread gate this behind hasCmd().
    [[nodiscard]] virtual core::Command readCmd() = 0;

    /// @brief Appends a message to the outbound queue. Never blocks.
    virtual void writeMsg(core::Message msg) = 0;

    /// @brief Returns @c true if at least one command is queued.
    [[nodiscard]] virtual bool hasCmd() const = 0;

    /// @brief Returns @c true if at least one message is waiting to be read.
    [[nodiscard]] virtual bool hasMsg() const = 0;

    /// @brief Returns the receiver currently driven (may be null).
    [[nodiscard]] Receiver* receiver() const noexcept { return receiver_; }

    /// @brief Detaches @p receiver from whatever drives it, then attaches it
    ///        to this controller.
    void assumeControl(Receiver& receiver);

protected:
    Controller() = default;

    /// @brief Hook invoked after the receiver back-reference changed.
    virtual void onReceiverChanged(Receiver* previous, Receiver* current);

private:
    friend class Receiver;
    friend class MultiController;

    void setReceiver(Receiver* receiver);

    Receiver* receiver_{nullptr};
};

} // namespace rein::control
