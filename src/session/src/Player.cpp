// /////////////////////////////////////////////////////////////////////////////
/// @file Player.cpp
/// @brief Player implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/session/Player.hpp>
#include <rein/control/Receiver.hpp>

namespace rein::session {

namespace {

// Clears the pass flag on every exit path of Player::poke.
class PassGuard
{
public:
    explicit PassGuard(bool& flag) noexcept : flag_{flag} { flag_ = true; }
    ~PassGuard() { flag_ = false; }

    PassGuard(const PassGuard&) = delete;
    PassGuard& operator=(const PassGuard&) = delete;

private:
    bool& flag_;
};

} // namespace

Player::Player(core::SessionId id)
    : id_{id}
{}

Player::~Player() = default;

core::SessionId Player::id() const noexcept { return id_; }

core::Command Player::readCmd()            { return commands_.pop(); }
void          Player::writeMsg(core::Message msg) { messages_.push(std::move(msg)); }
bool          Player::hasCmd() const       { return !commands_.empty(); }
bool          Player::hasMsg() const       { return !messages_.empty(); }

void Player::enqueue(core::Command command)
{
    if (updating_)
    {
        deferred_.push_back(std::move(command));
        return;
    }
    flushDeferred();
    commands_.push(std::move(command));
}

void Player::poke()
{
    control::Receiver* target = receiver();
    if (target == nullptr || updating_)
    {
        return;
    }

    PassGuard guard{updating_};
    target->update();
}

bool Player::takeMessage(core::Message& out)
{
    return messages_.tryPop(out);
}

core::usize Player::pendingCommands() const { return commands_.size() + deferred_.size(); }
core::usize Player::pendingMessages() const { return messages_.size(); }

void Player::flushDeferred()
{
    for (auto& command : deferred_)
    {
        commands_.push(std::move(command));
    }
    deferred_.clear();
}

} // namespace rein::session
