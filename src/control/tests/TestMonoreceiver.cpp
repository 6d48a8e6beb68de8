/**
 * @file TestMonoreceiver.cpp
 * @brief Unit tests for rein::control::Monoreceiver attach/detach protocol.
 */

#include <catch2/catch.hpp>

#include "TestDoubles.hpp"

#include <memory>

using namespace rein::control;
using namespace rein::control::test;

TEST_CASE("Monoreceiver attach sets both back-references", "[control][monoreceiver]")
{
    QueueController ctrl;
    RecordingReceiver rec{"A"};

    rec.attach(ctrl);

    REQUIRE(rec.controller() == &ctrl);
    REQUIRE(ctrl.receiver() == &rec);
}

TEST_CASE("Monoreceiver detach clears both back-references", "[control][monoreceiver]")
{
    QueueController ctrl;
    RecordingReceiver rec{"A"};
    rec.attach(ctrl);

    rec.detach();

    REQUIRE(rec.controller() == nullptr);
    REQUIRE(ctrl.receiver() == nullptr);

    rec.detach();
    REQUIRE(rec.controller() == nullptr);
    REQUIRE(ctrl.receiver() == nullptr);
}

TEST_CASE("Monoreceiver re-attaching the same controller is a no-op", "[control][monoreceiver]")
{
    QueueController ctrl;
    RecordingReceiver rec{"A"};
    rec.attach(ctrl);
    ctrl.push("look");

    rec.attach(ctrl);

    REQUIRE(rec.controller() == &ctrl);
    REQUIRE(ctrl.receiver() == &rec);
    REQUIRE(ctrl.commands.size() == 1);
}

TEST_CASE("Monoreceiver attaching elsewhere releases the previous controller", "[control][monoreceiver]")
{
    QueueController first;
    QueueController second;
    RecordingReceiver rec{"A"};
    rec.attach(first);

    rec.attach(second);

    REQUIRE(first.receiver() == nullptr);
    REQUIRE(second.receiver() == &rec);
    REQUIRE(rec.controller() == &second);
}

TEST_CASE("Controller assumeControl moves a receiver between controllers", "[control][monoreceiver]")
{
    QueueController first;
    QueueController second;
    RecordingReceiver rec{"A"};
    first.assumeControl(rec);

    second.assumeControl(rec);

    REQUIRE(first.receiver() == nullptr);
    REQUIRE(second.receiver() == &rec);
    REQUIRE(rec.controller() == &second);
}

TEST_CASE("Monoreceiver attach releases the receiver the controller was driving", "[control][monoreceiver]")
{
    QueueController ctrl;
    RecordingReceiver first{"A"};
    RecordingReceiver second{"B"};
    first.attach(ctrl);

    second.attach(ctrl);

    REQUIRE(first.controller() == nullptr);
    REQUIRE(second.controller() == &ctrl);
    REQUIRE(ctrl.receiver() == &second);
}

TEST_CASE("Destroying either side leaves no dangling back-reference", "[control][monoreceiver]")
{
    SECTION("controller destroyed first")
    {
        RecordingReceiver rec{"A"};
        {
            QueueController ctrl;
            rec.attach(ctrl);
        }
        REQUIRE(rec.controller() == nullptr);
    }

    SECTION("receiver destroyed first")
    {
        QueueController ctrl;
        {
            RecordingReceiver rec{"A"};
            rec.attach(ctrl);
        }
        REQUIRE(ctrl.receiver() == nullptr);
    }
}
