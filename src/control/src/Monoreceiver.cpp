// /////////////////////////////////////////////////////////////////////////////
/// @file Monoreceiver.cpp
/// @brief Monoreceiver implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/control/Monoreceiver.hpp>
#include <rein/control/Controller.hpp>

namespace rein::control {

Monoreceiver::~Monoreceiver()
{
    Monoreceiver::detach();
}

void Monoreceiver::attach(Controller& controller)
{
    if (this->controller() == &controller)
    {
        return;
    }

    detach();

    Receiver* previous = controller.receiver();
    if (previous != nullptr && previous != this && previous->controller() == &controller)
    {
        previous->detach();
    }

    setController(&controller);
    bindReceiver(controller, this);
}

void Monoreceiver::detach()
{
    if (Controller* current = controller(); current != nullptr)
    {
        if (current->receiver() == this)
        {
            bindReceiver(*current, nullptr);
        }
    }
    setController(nullptr);
}

} // namespace rein::control
