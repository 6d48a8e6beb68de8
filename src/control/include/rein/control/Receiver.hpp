// /////////////////////////////////////////////////////////////////////////////
/// @file Receiver.hpp
/// @brief Attachable, updatable entity driven by a Controller.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/core/NonCopyable.hpp>
#include <rein/core/Types.hpp>

#include <string>

namespace rein::control {

class Controller;

// /////////////////////////////////////////////////////////////////////////////
/// @class Receiver
/// @brief Interface of everything a Controller can drive.
///
/// update() is the per-tick hook: it pulls commands from controller() and
/// pushes messages back to it.
// /////////////////////////////////////////////////////////////////////////////
class Receiver : public core::NonMovable<Receiver>
{
public:
    virtual ~Receiver() = default;

    /// @brief Places this receiver under @p controller.
    virtual void attach(Controller& controller) = 0;

    /// @brief Releases the current controller. No-op when detached.
    virtual void detach() = 0;

    /// @brief Processes pending commands once.
    virtual void update() = 0;

    /// @brief Human-readable name used in routed message headers.
    [[nodiscard]] virtual std::string label() const = 0;

    /// @brief Returns the controller currently driving this receiver.
    [[nodiscard]] Controller* controller() const noexcept { return controller_; }

protected:
    Receiver() = default;

    void setController(Controller* controller) noexcept { controller_ = controller; }

    /// @brief Updates the back-reference held by @p controller.
    static void bindReceiver(Controller& controller, Receiver* receiver);

private:
    Controller* controller_{nullptr};
};

} // namespace rein::control
