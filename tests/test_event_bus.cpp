// =============================================================================
// Unit tests for EventBus (src/event_bus.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "event_bus.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace scry;

// ---------------------------------------------------------------------------
// Basic subscribe + publish
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscribeAndPublish) {
    EventBus bus;
    int received_count = 0;
    std::string received_id;

    auto sub = bus.subscribe<SessionStateEvent>(
        [&](const SessionStateEvent& e) {
            received_count++;
            received_id = e.device_id;
        });

    SessionStateEvent ev;
    ev.device_id = "R5CT123ABCD";
    ev.state = 4;
    bus.publish(ev);

    EXPECT_EQ(received_count, 1);
    EXPECT_EQ(received_id, "R5CT123ABCD");
}

// ---------------------------------------------------------------------------
// Multiple subscribers for the same event
// ---------------------------------------------------------------------------
TEST(EventBusTest, MultipleSubscribers) {
    EventBus bus;
    int count_a = 0;
    int count_b = 0;

    auto sub_a = bus.subscribe<InputOutcomeEvent>(
        [&](const InputOutcomeEvent&) { count_a++; });
    auto sub_b = bus.subscribe<InputOutcomeEvent>(
        [&](const InputOutcomeEvent&) { count_b++; });

    bus.publish(InputOutcomeEvent{});

    EXPECT_EQ(count_a, 1);
    EXPECT_EQ(count_b, 1);
}

// ---------------------------------------------------------------------------
// Unsubscribe via RAII handle destruction
// ---------------------------------------------------------------------------
TEST(EventBusTest, UnsubscribeOnHandleDestruction) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.subscribe<TransferFinishedEvent>(
            [&](const TransferFinishedEvent&) { count++; });
        bus.publish(TransferFinishedEvent{});
        EXPECT_EQ(count, 1);
    }

    bus.publish(TransferFinishedEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// Explicit reset() unsubscribes once
// ---------------------------------------------------------------------------
TEST(EventBusTest, ResetUnsubscribes) {
    EventBus bus;
    int count = 0;

    auto sub = bus.subscribe<TransferFinishedEvent>(
        [&](const TransferFinishedEvent&) { count++; });
    sub.reset();
    sub.reset();

    bus.publish(TransferFinishedEvent{});
    EXPECT_EQ(count, 0);
}

// ---------------------------------------------------------------------------
// Different event types are independent
// ---------------------------------------------------------------------------
TEST(EventBusTest, EventTypeIsolation) {
    EventBus bus;
    int state_count = 0;
    int discovered_count = 0;

    auto sub1 = bus.subscribe<SessionStateEvent>(
        [&](const SessionStateEvent&) { state_count++; });
    auto sub2 = bus.subscribe<DevicesDiscoveredEvent>(
        [&](const DevicesDiscoveredEvent&) { discovered_count++; });

    bus.publish(SessionStateEvent{});

    EXPECT_EQ(state_count, 1);
    EXPECT_EQ(discovered_count, 0);
}

// ---------------------------------------------------------------------------
// Handler exception does not crash bus or prevent other handlers
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandlerExceptionIsCaught) {
    EventBus bus;
    int good_count = 0;

    auto sub1 = bus.subscribe<SessionStateEvent>(
        [](const SessionStateEvent&) { throw std::runtime_error("boom"); });
    auto sub2 = bus.subscribe<SessionStateEvent>(
        [&](const SessionStateEvent&) { good_count++; });

    EXPECT_NO_THROW(bus.publish(SessionStateEvent{}));
    EXPECT_EQ(good_count, 1);
}

// ---------------------------------------------------------------------------
// A handler may subscribe while being called
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscribeFromHandler) {
    EventBus bus;
    int inner_count = 0;
    SubscriptionHandle inner;

    auto outer = bus.subscribe<SessionStateEvent>(
        [&](const SessionStateEvent&) {
            if (inner_count == 0) {
                inner = bus.subscribe<InputOutcomeEvent>(
                    [&](const InputOutcomeEvent&) { inner_count++; });
            }
        });

    bus.publish(SessionStateEvent{});
    bus.publish(InputOutcomeEvent{});
    EXPECT_EQ(inner_count, 1);
}

// ---------------------------------------------------------------------------
// Move semantics for SubscriptionHandle
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandleMoveSemantic) {
    EventBus bus;
    int count = 0;

    SubscriptionHandle outer;
    {
        auto inner = bus.subscribe<SessionStateEvent>(
            [&](const SessionStateEvent&) { count++; });
        outer = std::move(inner);
    }

    bus.publish(SessionStateEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// Concurrent publishers
// ---------------------------------------------------------------------------
TEST(EventBusTest, ConcurrentPublish) {
    EventBus bus;
    std::atomic<int> count{0};
    auto sub = bus.subscribe<InputOutcomeEvent>(
        [&](const InputOutcomeEvent&) { count++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&bus]() {
            for (int i = 0; i < 250; i++) bus.publish(InputOutcomeEvent{});
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(count.load(), 1000);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
