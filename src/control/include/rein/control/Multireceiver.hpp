// /////////////////////////////////////////////////////////////////////////////
/// @file Multireceiver.hpp
/// @brief Group of receivers driven together by one external controller.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rein/control/Monoreceiver.hpp>
#include <rein/core/Constants.hpp>
#include <rein/core/Expected.hpp>
#include <rein/core/Types.hpp>

#include <deque>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace rein::control {

// /////////////////////////////////////////////////////////////////////////////
/// @class Multireceiver
/// @brief Aggregates N member receivers behind a single attachment.
///
/// Each member is driven by a private MemberAdapter rather than by the
/// external controller. Every tick the group:
///   1. evicts members whose controller is neither null nor their adapter,
///      reporting "Lost connection with <member>";
///   2. copies each external command, in order, to every member its
///      adapter still drives; a member whose controller was cleared gets
///      nothing and its pending copies are dropped;
///   3. updates the members in order.
///
/// Messages written by members are routed back to the external controller.
/// A speaker change emits a "[<member>]" header, and a message identical to
/// one recently forwarded for a different member is suppressed. The dedup
/// window holds at most floor(windowFactor * activeCount()) entries.
///
/// Members are not owned and must outlive the group.
// /////////////////////////////////////////////////////////////////////////////
class Multireceiver final : public Monoreceiver
{
public:
    /// @brief Builds a group over @p members.
    /// @param members      Receivers to aggregate, in update order.
    /// @param windowFactor Dedup window size per active member.
    /// @return The group, or InvalidArgument for a null or repeated member
    ///         or a negative or non-finite factor.
    [[nodiscard]] static core::Expected<std::unique_ptr<Multireceiver>>
        create(std::span<Receiver* const> members,
               core::f64 windowFactor = core::kDedupWindowFactor);

    [[nodiscard]] static core::Expected<std::unique_ptr<Multireceiver>>
        create(std::initializer_list<Receiver*> members,
               core::f64 windowFactor = core::kDedupWindowFactor);

    ~Multireceiver() override;

    /// @brief Stores @p controller and hands every member to its adapter.
    ///        Re-attaching the current controller is a no-op.
    void attach(Controller& controller) override;

    /// @brief Clears the external controller and releases every member still
    ///        held by its adapter. Pending member commands are dropped.
    void detach() override;

    /// @brief Runs one tick: eviction, command fan-out, member updates.
    void update() override;

    [[nodiscard]] std::string label() const override;

    /// @brief Maximum number of entries kept in the dedup window.
    [[nodiscard]] core::usize capacity() const noexcept { return capacity_; }

    /// @brief Number of members still driven by the group.
    [[nodiscard]] core::usize activeCount() const noexcept { return members_.size(); }

    /// @brief Current number of entries in the dedup window.
    [[nodiscard]] core::usize windowSize() const noexcept { return window_.size(); }

    /// @brief Commands waiting in @p member's adapter, 0 for a non-member.
    [[nodiscard]] core::usize pendingCommands(const Receiver& member) const;

    /// @brief Returns @c true if @p member is still an active member.
    [[nodiscard]] bool contains(const Receiver& member) const noexcept;

private:
    class MemberAdapter;

    struct Member
    {
        Receiver*                      receiver;
        std::unique_ptr<MemberAdapter> adapter;
    };

    Multireceiver(std::span<Receiver* const> members, core::f64 windowFactor);

    [[nodiscard]] static bool isDriven(const Member& member) noexcept;

    void evictTakenOverMembers();
    void fanOutCommands();
    void route(const Receiver& member, core::Message message);
    void recomputeCapacity();
    void trimWindow();

    std::vector<Member>                                   members_;
    std::deque<std::pair<const Receiver*, core::Message>> window_;
    core::f64                                             windowFactor_;
    core::usize                                           capacity_{0};
};

} // namespace rein::control
