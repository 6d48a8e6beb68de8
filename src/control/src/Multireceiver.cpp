// /////////////////////////////////////////////////////////////////////////////
/// @file Multireceiver.cpp
/// @brief Multireceiver and its per-member adapter.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/control/Multireceiver.hpp>
#include <rein/control/Controller.hpp>
#include <rein/container/Channel.hpp>
#include <rein/core/Assert.hpp>
#include <rein/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace rein::control {

// /////////////////////////////////////////////////////////////////////////////
/// @class Multireceiver::MemberAdapter
/// @brief Private controller standing between the group and one member.
///
/// Holds the member's copy of the fanned-out commands. Messages the member
/// writes are handed to the owning group for routing.
// /////////////////////////////////////////////////////////////////////////////
class Multireceiver::MemberAdapter final : public Controller
{
public:
    MemberAdapter(Multireceiver& owner, const Receiver& member)
        : owner_{owner}
        , member_{member}
    {}

    [[nodiscard]] core::Command readCmd() override { return commands_.pop(); }

    void writeMsg(core::Message msg) override { owner_.route(member_, std::move(msg)); }

    [[nodiscard]] bool hasCmd() const override { return !commands_.empty(); }

    /// Diagnostic only: whether the group's external controller has unread
    /// messages.
    [[nodiscard]] bool hasMsg() const override
    {
        const Controller* external = owner_.controller();
        return external != nullptr && external->hasMsg();
    }

    void enqueue(core::Command command) { commands_.push(std::move(command)); }

    core::usize discardPending() { return commands_.clear(); }

    [[nodiscard]] core::usize pending() const { return commands_.size(); }

private:
    Multireceiver&                    owner_;
    const Receiver&                   member_;
    container::Channel<core::Command> commands_;
};

core::Expected<std::unique_ptr<Multireceiver>>
Multireceiver::create(std::span<Receiver* const> members, core::f64 windowFactor)
{
    if (!std::isfinite(windowFactor) || windowFactor < 0.0)
    {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               "Multireceiver window factor must be finite and non-negative");
    }

    for (auto it = members.begin(); it != members.end(); ++it)
    {
        if (*it == nullptr)
        {
            return core::makeError(core::ErrorCode::InvalidArgument,
                                   "Multireceiver cannot hold a null receiver");
        }
        if (std::find(members.begin(), it, *it) != it)
        {
            return core::makeError(core::ErrorCode::InvalidArgument,
                                   "Multireceiver member listed twice: " + (*it)->label());
        }
    }

    return std::unique_ptr<Multireceiver>(new Multireceiver(members, windowFactor));
}

core::Expected<std::unique_ptr<Multireceiver>>
Multireceiver::create(std::initializer_list<Receiver*> members, core::f64 windowFactor)
{
    return create(std::span<Receiver* const>{members.begin(), members.size()}, windowFactor);
}

Multireceiver::Multireceiver(std::span<Receiver* const> members, core::f64 windowFactor)
    : windowFactor_{windowFactor}
{
    members_.reserve(members.size());
    for (Receiver* member : members)
    {
        members_.push_back(Member{member, std::make_unique<MemberAdapter>(*this, *member)});
    }
    recomputeCapacity();
}

Multireceiver::~Multireceiver()
{
    Multireceiver::detach();
}

void Multireceiver::attach(Controller& controller)
{
    if (this->controller() == &controller)
    {
        return;
    }

    Monoreceiver::attach(controller);
    for (auto& member : members_)
    {
        member.adapter->assumeControl(*member.receiver);
    }
}

void Multireceiver::detach()
{
    Monoreceiver::detach();
    for (auto& member : members_)
    {
        member.adapter->discardPending();
        if (member.receiver->controller() == member.adapter.get())
        {
            member.receiver->detach();
        }
    }
}

void Multireceiver::update()
{
    evictTakenOverMembers();
    fanOutCommands();

    // Index loop: a member update may route messages back into this group.
    for (core::usize i = 0; i < members_.size(); ++i)
    {
        members_[i].receiver->update();
    }
}

std::string Multireceiver::label() const
{
    std::string out;
    for (const auto& member : members_)
    {
        if (!out.empty())
            out += ", ";
        out += member.receiver->label();
    }
    return out;
}

core::usize Multireceiver::pendingCommands(const Receiver& member) const
{
    for (const auto& m : members_)
    {
        if (m.receiver == &member)
        {
            return m.adapter->pending();
        }
    }
    return 0;
}

bool Multireceiver::isDriven(const Member& member) noexcept
{
    return member.receiver->controller() == member.adapter.get();
}

bool Multireceiver::contains(const Receiver& member) const noexcept
{
    return std::ranges::any_of(members_, [&member](const Member& m) { return m.receiver == &member; });
}

void Multireceiver::evictTakenOverMembers()
{
    for (auto it = members_.begin(); it != members_.end(); )
    {
        const Controller* current = it->receiver->controller();
        if (current == nullptr || current == it->adapter.get())
        {
            ++it;
            continue;
        }

        const std::string name = it->receiver->label();
        if (Controller* external = controller(); external != nullptr)
        {
            external->writeMsg(core::kLostConnectionPrefix + name);
        }
        core::Log::warn("CTRL", "Multireceiver: member taken over, evicting " + name);

        it = members_.erase(it);
        recomputeCapacity();
    }
}

void Multireceiver::fanOutCommands()
{
    Controller* external = controller();
    if (external == nullptr)
    {
        return;
    }

    // A member whose controller was cleared never reads its adapter again.
    for (auto& member : members_)
    {
        if (!isDriven(member))
        {
            member.adapter->discardPending();
        }
    }

    while (external->hasCmd())
    {
        const core::Command command = external->readCmd();
        for (auto& member : members_)
        {
            if (isDriven(member))
            {
                member.adapter->enqueue(command);
            }
        }
    }
}

void Multireceiver::route(const Receiver& member, core::Message message)
{
    REIN_ASSERT(contains(member));
    trimWindow();

    for (const auto& [source, seen] : window_)
    {
        if (source != &member && seen == message)
        {
            core::Log::debug("CTRL", "Multireceiver: suppressed duplicate from " + member.label());
            return;
        }
    }

    Controller* external = controller();
    if (external == nullptr)
    {
        return;
    }

    if (window_.empty() || window_.back().first != &member)
    {
        external->writeMsg("[" + member.label() + "]");
    }
    external->writeMsg(message);
    window_.emplace_back(&member, std::move(message));
    trimWindow();
}

void Multireceiver::recomputeCapacity()
{
    constexpr auto kMaxCapacity = static_cast<core::f64>(std::numeric_limits<core::usize>::max());

    const core::f64 raw = std::floor(windowFactor_ * static_cast<core::f64>(members_.size()));
    capacity_ = raw >= kMaxCapacity ? std::numeric_limits<core::usize>::max()
                                    : static_cast<core::usize>(raw);
    trimWindow();
}

void Multireceiver::trimWindow()
{
    while (window_.size() > capacity_)
    {
        window_.pop_front();
    }
}

} // namespace rein::control
