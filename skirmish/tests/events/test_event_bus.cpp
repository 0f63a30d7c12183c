// tests/events/test_event_bus.cpp
#include "events/event_bus.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

// Test for EventBus::publish()
TEST(EventBusTest, DeliversToSubscribersInOrder) {
    EventBus bus;
    std::vector<int> order;
    bus.subscribe<HealedEvent>([&order](HealedEvent&) { order.push_back(1); });
    bus.subscribe<HealedEvent>([&order](HealedEvent&) { order.push_back(2); });
    bus.subscribe<DamageAppliedEvent>([&order](DamageAppliedEvent&) { order.push_back(99); });

    HealedEvent event;
    bus.publish(event);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(bus.subscriberCount<HealedEvent>(), 2u);
    EXPECT_EQ(bus.subscriberCount(), 3u);
}

// Test for EventBus::publish() with a mutating handler
TEST(EventBusTest, HandlersCanMutateTheEvent) {
    EventBus bus;
    bus.subscribe<CardEffectCheckEvent>([](CardEffectCheckEvent& event) {
        event.vetoed = true;
        event.vetoed_by = "shield";
    });
    CardEffectCheckEvent check;
    bus.publish(check);
    EXPECT_TRUE(check.vetoed);
    EXPECT_EQ(check.vetoed_by, "shield");
}

// Test for EventBus::unsubscribe()
TEST(EventBusTest, UnsubscribeIsIdempotent) {
    EventBus bus;
    int calls = 0;
    SubscriptionId id = bus.subscribe<HealedEvent>([&calls](HealedEvent&) { ++calls; });
    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(12345));

    HealedEvent event;
    bus.publish(event);
    EXPECT_EQ(calls, 0);
}

// Test for EventBus::unsubscribe() during dispatch
TEST(EventBusTest, UnsubscribedDuringDispatchIsNotCalled) {
    EventBus bus;
    int late_calls = 0;
    SubscriptionId late = 0;
    bus.subscribe<HealedEvent>([&bus, &late](HealedEvent&) { bus.unsubscribe(late); });
    late = bus.subscribe<HealedEvent>([&late_calls](HealedEvent&) { ++late_calls; });

    HealedEvent event;
    bus.publish(event);
    EXPECT_EQ(late_calls, 0);
}

// Test for the event depth limit
TEST(EventBusTest, RunawayRecursionThrows) {
    EventBus bus(8);
    int calls = 0;
    bus.subscribe<HealedEvent>([&bus, &calls](HealedEvent& event) {
        ++calls;
        bus.publish(event);
    });

    HealedEvent event;
    EXPECT_THROW(bus.publish(event), EventRecursionError);
    EXPECT_EQ(calls, 8);
    EXPECT_EQ(bus.depth(), 0);
}

// Test for nested publishing below the depth limit
TEST(EventBusTest, BoundedNestingIsAllowed) {
    EventBus bus(4);
    int remaining = 3;
    bus.subscribe<HealedEvent>([&bus, &remaining](HealedEvent& event) {
        if (remaining-- > 0) {
            bus.publish(event);
        }
    });
    HealedEvent event;
    EXPECT_NO_THROW(bus.publish(event));
    EXPECT_EQ(bus.maxDepth(), 4);
}

// Test for EventBus construction and subscribe() errors
TEST(EventBusTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(EventBus{0}, std::invalid_argument);
    EventBus bus;
    EXPECT_THROW(bus.subscribe<HealedEvent>(nullptr), std::invalid_argument);
}
