// /////////////////////////////////////////////////////////////////////////////
/// @file Controller.cpp
/// @brief Controller and Receiver base implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/control/Controller.hpp>
#include <rein/control/Receiver.hpp>

namespace rein::control {

Controller::~Controller()
{
    if (receiver_ != nullptr && receiver_->controller() == this)
    {
        receiver_->detach();
    }
}

void Controller::assumeControl(Receiver& receiver)
{
    receiver.detach();
    receiver.attach(*this);
}

void Controller::onReceiverChanged(Receiver* /*previous*/, Receiver* /*current*/)
{
}

void Controller::setReceiver(Receiver* receiver)
{
    Receiver* previous = receiver_;
    receiver_ = receiver;
    if (previous != receiver)
    {
        onReceiverChanged(previous, receiver);
    }
}

void Receiver::bindReceiver(Controller& controller, Receiver* receiver)
{
    controller.setReceiver(receiver);
}

} // namespace rein::control
