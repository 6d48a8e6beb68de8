/**
 * @file TestMultireceiver.cpp
 * @brief Unit tests for control::Multireceiver fan-out, routing and eviction.
 */

#include <catch2/catch.hpp>

#include "rein/control/Multireceiver.hpp"
#include "rein/core/Log.hpp"
#include "TestDoubles.hpp"

#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace rein::control;
using namespace rein::control::test;
using Messages = std::vector<rein::core::Message>;
using Commands = std::vector<rein::core::Command>;

namespace {

std::unique_ptr<Multireceiver> makeGroup(std::initializer_list<Receiver*> members,
                                         rein::core::f64 factor = rein::core::kDedupWindowFactor)
{
    auto group = Multireceiver::create(members, factor);
    REQUIRE(group.has_value());
    return std::move(*group);
}

struct CapturingLogger final : rein::core::ILogger
{
    struct Entry
    {
        rein::core::LogLevel level;
        std::string          tag;
        std::string          message;
    };

    void write(rein::core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

// Installs a logger for the lifetime of the guard.
struct ScopedLogger
{
    explicit ScopedLogger(rein::core::ILogger& logger) { rein::core::Log::setLogger(&logger); }
    ~ScopedLogger() { rein::core::Log::setLogger(nullptr); }
};

} // namespace

TEST_CASE("Multireceiver window capacity follows the active member count", "[control][multireceiver]")
{
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    RecordingReceiver c{"C"};
    RecordingReceiver d{"D"};

    REQUIRE(makeGroup({&a})->capacity() == 1);
    REQUIRE(makeGroup({&a, &b})->capacity() == 3);
    REQUIRE(makeGroup({&a, &b, &c})->capacity() == 4);
    REQUIRE(makeGroup({&a, &b, &c, &d})->capacity() == 6);
    REQUIRE(makeGroup({&a, &b, &c}, 2.0)->capacity() == 6);
}

TEST_CASE("Multireceiver create rejects invalid member lists", "[control][multireceiver]")
{
    RecordingReceiver a{"A"};

    auto withNull = Multireceiver::create({&a, nullptr});
    REQUIRE_FALSE(withNull.has_value());
    REQUIRE(withNull.error().code() == rein::core::ErrorCode::kInvalidArgument);

    auto twice = Multireceiver::create({&a, &a});
    REQUIRE_FALSE(twice.has_value());
    REQUIRE(twice.error().code() == rein::core::ErrorCode::kInvalidArgument);

    auto negative = Multireceiver::create({&a}, -1.0);
    REQUIRE_FALSE(negative.has_value());
    REQUIRE(negative.error().code() == rein::core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Multireceiver create rejects a non-finite window factor", "[control][multireceiver]")
{
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};

    auto infinite = Multireceiver::create({&a, &b}, std::numeric_limits<rein::core::f64>::infinity());
    REQUIRE_FALSE(infinite.has_value());
    REQUIRE(infinite.error().code() == rein::core::ErrorCode::kInvalidArgument);

    auto nan = Multireceiver::create({&a, &b}, std::numeric_limits<rein::core::f64>::quiet_NaN());
    REQUIRE_FALSE(nan.has_value());
    REQUIRE(nan.error().code() == rein::core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Multireceiver clamps the capacity of a huge window factor", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    auto group = makeGroup({&a, &b}, 1e300);
    group->attach(ext);

    REQUIRE(group->capacity() == std::numeric_limits<rein::core::usize>::max());

    a.emit("Hi");
    b.emit("Hi");
    REQUIRE(ext.messages == Messages{"[A]", "Hi"});
}

TEST_CASE("Multireceiver label joins member labels", "[control][multireceiver]")
{
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    RecordingReceiver c{"C"};

    REQUIRE(makeGroup({&a, &b, &c})->label() == "A, B, C");
}

TEST_CASE("Multireceiver attach hands members to private adapters", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    auto group = makeGroup({&a, &b});

    REQUIRE(a.controller() == nullptr);

    group->attach(ext);

    REQUIRE(group->controller() == &ext);
    REQUIRE(ext.receiver() == group.get());
    REQUIRE(a.controller() != nullptr);
    REQUIRE(a.controller() != &ext);
    REQUIRE(b.controller() != nullptr);
    REQUIRE(b.controller() != a.controller());

    SECTION("re-attaching the same controller changes nothing")
    {
        Controller* adapterA = a.controller();
        group->attach(ext);
        REQUIRE(a.controller() == adapterA);
        REQUIRE(ext.receiver() == group.get());
    }

    SECTION("detach releases the external controller and the members")
    {
        group->detach();
        REQUIRE(group->controller() == nullptr);
        REQUIRE(ext.receiver() == nullptr);
        REQUIRE(a.controller() == nullptr);
        REQUIRE(b.controller() == nullptr);
    }
}

TEST_CASE("Multireceiver copies every command to every member in order", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    RecordingReceiver c{"C"};
    auto group = makeGroup({&a, &b, &c});
    group->attach(ext);

    ext.push("look");
    ext.push("wave");
    group->update();

    const Commands expected{"look", "wave"};
    REQUIRE(a.seen == expected);
    REQUIRE(b.seen == expected);
    REQUIRE(c.seen == expected);
    REQUIRE(ext.commands.empty());
}

TEST_CASE("Multireceiver suppresses a message already forwarded for another member", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    RecordingReceiver c{"C"};
    auto group = makeGroup({&a, &b, &c});
    group->attach(ext);

    a.emit("Hi");
    b.emit("Hi");
    c.emit("Hi");

    REQUIRE(ext.messages == Messages{"[A]", "Hi"});
}

TEST_CASE("Multireceiver echoes of a shared command are reported once", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A", true};
    RecordingReceiver b{"B", true};
    auto group = makeGroup({&a, &b});
    group->attach(ext);

    ext.push("Hi");
    group->update();

    REQUIRE(ext.messages == Messages{"[A]", "Hi"});
}

TEST_CASE("Multireceiver emits a header only when the speaker changes", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    auto group = makeGroup({&a, &b});
    group->attach(ext);

    a.emit("Hi");
    a.emit("There");
    b.emit("Yo");
    a.emit("Back");

    REQUIRE(ext.messages == Messages{"[A]", "Hi", "There", "[B]", "Yo", "[A]", "Back"});
}

TEST_CASE("Multireceiver never suppresses a member repeating itself", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    auto group = makeGroup({&a, &b});
    group->attach(ext);

    a.emit("Hi");
    a.emit("Hi");

    REQUIRE(ext.messages == Messages{"[A]", "Hi", "Hi"});
}

TEST_CASE("Multireceiver forgets messages that left the dedup window", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    auto group = makeGroup({&a, &b});
    group->attach(ext);
    REQUIRE(group->capacity() == 3);

    for (const char* msg : {"m1", "m2", "m3", "m4", "m5"})
        a.emit(msg);
    REQUIRE(group->windowSize() == 3);

    ext.messages.clear();
    b.emit("m1");
    REQUIRE(ext.messages == Messages{"[B]", "m1"});

    ext.messages.clear();
    b.emit("m5");
    REQUIRE(ext.messages.empty());
    REQUIRE(group->windowSize() == 3);
}

TEST_CASE("Multireceiver evicts a member taken over by another controller", "[control][multireceiver]")
{
    CapturingLogger logger;
    ScopedLogger    installed{logger};

    QueueController ext;
    QueueController other;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    RecordingReceiver c{"C"};
    auto group = makeGroup({&a, &b, &c});
    group->attach(ext);

    for (const char* msg : {"m1", "m2", "m3", "m4", "m5", "m6"})
        a.emit(msg);
    REQUIRE(group->capacity() == 4);
    REQUIRE(group->windowSize() == 4);
    ext.messages.clear();

    other.assumeControl(c);
    ext.push("look");
    group->update();

    REQUIRE(ext.messages == Messages{"Lost connection with C"});
    REQUIRE(group->activeCount() == 2);
    REQUIRE_FALSE(group->contains(c));
    REQUIRE(group->capacity() == 3);
    REQUIRE(group->windowSize() == 3);
    REQUIRE(c.controller() == &other);
    REQUIRE(c.seen.empty());
    REQUIRE(a.seen == Commands{"look"});
    REQUIRE(group->label() == "A, B");

    REQUIRE(logger.entries.size() == 1);
    REQUIRE(logger.entries.front().level == rein::core::LogLevel::kWarn);
    REQUIRE(logger.entries.front().tag == "CTRL");

    SECTION("detaching the group leaves the evicted member alone")
    {
        group->detach();
        REQUIRE(c.controller() == &other);
        REQUIRE(other.receiver() == &c);
        REQUIRE(a.controller() == nullptr);
    }
}

TEST_CASE("Multireceiver keeps a member whose controller was merely cleared", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    RecordingReceiver b{"B"};
    auto group = makeGroup({&a, &b});
    group->attach(ext);

    b.detach();
    for (int i = 0; i < 3; ++i)
    {
        ext.push("cmd");
        group->update();
    }

    REQUIRE(group->activeCount() == 2);
    REQUIRE(group->contains(b));
    REQUIRE(ext.messages.empty());
    REQUIRE(a.seen == Commands{"cmd", "cmd", "cmd"});
    REQUIRE(b.seen.empty());
    REQUIRE(group->pendingCommands(a) == 0);
    REQUIRE(group->pendingCommands(b) == 0);

    RecordingReceiver stranger{"S"};
    REQUIRE(group->pendingCommands(stranger) == 0);
}

TEST_CASE("Multireceiver adapter hasMsg mirrors the external controller", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A"};
    auto group = makeGroup({&a});
    group->attach(ext);

    REQUIRE_FALSE(a.controller()->hasMsg());
    a.emit("Hi");
    REQUIRE(a.controller()->hasMsg());
}

TEST_CASE("Multireceiver groups nest", "[control][multireceiver]")
{
    QueueController ext;
    RecordingReceiver a{"A", true};
    RecordingReceiver b{"B", true};
    RecordingReceiver c{"C", true};
    auto inner = makeGroup({&a, &b});
    auto outer = makeGroup({inner.get(), &c});
    outer->attach(ext);

    ext.push("Hi");
    outer->update();

    REQUIRE(a.seen == Commands{"Hi"});
    REQUIRE(c.seen == Commands{"Hi"});
    REQUIRE(ext.messages == Messages{"[A, B]", "[A]", "Hi"});
}
