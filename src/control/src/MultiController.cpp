// /////////////////////////////////////////////////////////////////////////////
/// @file MultiController.cpp
/// @brief MultiController implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/control/MultiController.hpp>
#include <rein/control/Receiver.hpp>
#include <rein/core/Assert.hpp>
#include <rein/core/Log.hpp>

#include <algorithm>

namespace rein::control {

core::Expected<std::unique_ptr<MultiController>>
MultiController::create(std::span<Controller* const> controllers)
{
    if (controllers.empty())
    {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               "MultiController needs at least one controller");
    }

    std::vector<Controller*> flattened;
    flattened.reserve(controllers.size());

    for (Controller* ctrl : controllers)
    {
        if (ctrl == nullptr)
        {
            return core::makeError(core::ErrorCode::InvalidArgument,
                                   "MultiController cannot hold a null controller");
        }

        if (auto* nested = dynamic_cast<MultiController*>(ctrl))
        {
            flattened.insert(flattened.end(), nested->members_.begin(), nested->members_.end());
        }
        else
        {
            flattened.push_back(ctrl);
        }
    }

    core::Log::debug("CTRL", "MultiController: created with "
                             + std::to_string(flattened.size()) + " members");
    return std::unique_ptr<MultiController>(new MultiController(std::move(flattened)));
}

core::Expected<std::unique_ptr<MultiController>>
MultiController::create(std::initializer_list<Controller*> controllers)
{
    return create(std::span<Controller* const>{controllers.begin(), controllers.size()});
}

MultiController::MultiController(std::vector<Controller*> members)
    : members_{std::move(members)}
{
    REIN_ASSERT(!members_.empty());
}

MultiController::~MultiController()
{
    // Detach here while onReceiverChanged still dispatches to this class.
    if (Receiver* current = receiver(); current != nullptr && current->controller() == this)
    {
        current->detach();
    }
}

core::Command MultiController::readCmd()
{
    for (Controller* member : members_)
    {
        if (member->hasCmd())
        {
            return member->readCmd();
        }
    }
    return members_.front()->readCmd();
}

void MultiController::writeMsg(core::Message msg)
{
    for (Controller* member : members_)
    {
        member->writeMsg(msg);
    }
}

bool MultiController::hasCmd() const
{
    return std::ranges::any_of(members_, [](const Controller* c) { return c->hasCmd(); });
}

bool MultiController::hasMsg() const
{
    return std::ranges::any_of(members_, [](const Controller* c) { return c->hasMsg(); });
}

std::span<Controller* const> MultiController::members() const noexcept
{
    return members_;
}

void MultiController::onReceiverChanged(Receiver* previous, Receiver* current)
{
    for (Controller* member : members_)
    {
        if (current == nullptr)
        {
            if (member->receiver() == previous)
            {
                member->setReceiver(nullptr);
            }
            continue;
        }

        Receiver* owned = member->receiver();
        if (owned != nullptr && owned != current && owned->controller() == member)
        {
            owned->detach();
        }
        member->setReceiver(current);
    }
}

} // namespace rein::control
