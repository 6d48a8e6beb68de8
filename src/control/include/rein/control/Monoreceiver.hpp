// /////////////////////////////////////////////////////////////////////////////
/// @file Monoreceiver.hpp
/// @brief Receiver controlled by exactly one Controller at a time.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/control/Receiver.hpp>

namespace rein::control {

// /////////////////////////////////////////////////////////////////////////////
/// @class Monoreceiver
/// @brief Single-owner attach/detach protocol with symmetric back-references.
///
/// After attach(c): controller() == &c and c.receiver() == this.
/// After detach(): both are null. update() stays with the concrete entity.
// /////////////////////////////////////////////////////////////////////////////
class Monoreceiver : public Receiver
{
public:
    ~Monoreceiver() override;

    /// @brief Attaches to @p controller.
    ///
    /// No-op if @p controller already drives this receiver, which also ends
    /// the attach / assumeControl recursion. Otherwise the current controller
    /// is released first, and so is any receiver @p controller was driving.
    void attach(Controller& controller) override;

    void detach() override;

protected:
    Monoreceiver() = default;
};

} // namespace rein::control
