#include <catch2/catch_test_macros.hpp>
#include <pulse/core/event_dispatcher.hpp>
#include <string>
#include <vector>

using namespace pulse::core;

// Test event types
struct TestEvent {
    int value = 0;
};

struct AnotherEvent {
    std::string message;
};

TEST_CASE("EventDispatcher subscription and dispatch", "[core][events]") {
    EventDispatcher dispatcher;

    SECTION("Subscribe and receive event") {
        int received_value = 0;
        auto conn = dispatcher.subscribe<TestEvent>([&](const TestEvent& e) {
            received_value = e.value;
        });

        dispatcher.dispatch(TestEvent{42});
        REQUIRE(received_value == 42);
    }

    SECTION("Handlers run in subscription order") {
        std::vector<int> order;
        auto conn1 = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { order.push_back(1); });
        auto conn2 = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { order.push_back(2); });

        dispatcher.dispatch(TestEvent{});
        REQUIRE(order == std::vector<int>{1, 2});
    }

    SECTION("Different event types are isolated") {
        int test_count = 0;
        int another_count = 0;

        auto conn1 = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { test_count++; });
        auto conn2 = dispatcher.subscribe<AnotherEvent>([&](const AnotherEvent&) { another_count++; });

        dispatcher.dispatch(TestEvent{});
        REQUIRE(test_count == 1);
        REQUIRE(another_count == 0);

        dispatcher.dispatch(AnotherEvent{"hi"});
        REQUIRE(test_count == 1);
        REQUIRE(another_count == 1);
    }

    SECTION("Dispatch without subscribers is a no-op") {
        dispatcher.dispatch(TestEvent{7});
        REQUIRE(dispatcher.handler_count<TestEvent>() == 0);
    }
}

TEST_CASE("ScopedConnection lifetime", "[core][events]") {
    EventDispatcher dispatcher;
    int received_count = 0;

    SECTION("Disconnects on destruction") {
        {
            auto conn = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { received_count++; });
            dispatcher.dispatch(TestEvent{});
        }
        dispatcher.dispatch(TestEvent{});
        REQUIRE(received_count == 1);
        REQUIRE(dispatcher.handler_count<TestEvent>() == 0);
    }

    SECTION("Move keeps the subscription") {
        ScopedConnection kept;
        {
            auto conn = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { received_count++; });
            kept = std::move(conn);
            REQUIRE_FALSE(conn.connected());
        }
        dispatcher.dispatch(TestEvent{});
        REQUIRE(received_count == 1);
        REQUIRE(kept.connected());
    }

    SECTION("Manual disconnect") {
        auto conn = dispatcher.subscribe<TestEvent>([&](const TestEvent&) { received_count++; });
        conn.disconnect();
        dispatcher.dispatch(TestEvent{});
        REQUIRE(received_count == 0);
        REQUIRE_FALSE(conn.connected());
    }
}
