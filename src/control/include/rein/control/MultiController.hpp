// /////////////////////////////////////////////////////////////////////////////
/// @file MultiController.hpp
/// @brief Composite Controller fanning several controllers into one.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/control/Controller.hpp>
#include <rein/core/Expected.hpp>

#include <initializer_list>
#include <memory>
#include <span>
#include <vector>

namespace rein::control {

// /////////////////////////////////////////////////////////////////////////////
/// @class MultiController
/// @brief Several actors jointly driving one receiver.
///
/// Commands are read from the first constituent that has one, in
/// registration order; messages are broadcast to every constituent.
/// Nested MultiControllers are flattened at construction, so nesting never
/// changes the effective order.
///
/// Constituents are not owned and must outlive the composite. Their queues
/// are only touched through their own Controller operations.
// /////////////////////////////////////////////////////////////////////////////
class MultiController final : public Controller
{
public:
    /// @brief Builds a composite over @p controllers.
    /// @return The composite, or InvalidArgument for an empty list or a null
    ///         constituent.
    [[nodiscard]] static core::Expected<std::unique_ptr<MultiController>>
        create(std::span<Controller* const> controllers);

    [[nodiscard]] static core::Expected<std::unique_ptr<MultiController>>
        create(std::initializer_list<Controller*> controllers);

    ~MultiController() override;

    /// @brief Reads from the first constituent with a queued command.
    ///
    /// With no ready constituent this blocks on the first one; gate the call
    /// behind hasCmd().
    [[nodiscard]] core::Command readCmd() override;

    /// @brief Broadcasts @p msg to every constituent.
    void writeMsg(core::Message msg) override;

    [[nodiscard]] bool hasCmd() const override;
    [[nodiscard]] bool hasMsg() const override;

    /// @brief Flattened constituents in registration order.
    [[nodiscard]] std::span<Controller* const> members() const noexcept;

private:
    explicit MultiController(std::vector<Controller*> members);

    void onReceiverChanged(Receiver* previous, Receiver* current) override;

    std::vector<Controller*> members_;
};

} // namespace rein::control
