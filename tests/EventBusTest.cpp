#include "core/EventBus.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace modelfetch::core {

struct TestEvent {
    std::string name;
    int value{0};
};

TEST(EventBusTest, DeliversToSubscribersInOrder) {
    EventBus<TestEvent> bus;
    std::vector<std::string> seen;

    bus.subscribe([&seen](const TestEvent& event) { seen.push_back("a:" + event.name); });
    bus.subscribe([&seen](const TestEvent& event) { seen.push_back("b:" + event.name); });

    bus.emit({"start", 1});

    EXPECT_EQ(seen, (std::vector<std::string>{"a:start", "b:start"}));
    EXPECT_EQ(bus.getSubscriberCount(), 2u);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus<TestEvent> bus;
    int calls = 0;

    auto subscription = bus.subscribe([&calls](const TestEvent&) { ++calls; });
    bus.emit({"one", 1});
    bus.unsubscribe(subscription);
    bus.emit({"two", 2});

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(subscription->isActive());
    EXPECT_EQ(bus.getSubscriberCount(), 0u);

    bus.unsubscribe(nullptr);
}

TEST(EventBusTest, ThrowingSubscriberDoesNotStopOthers) {
    EventBus<TestEvent> bus;
    int delivered = 0;

    bus.subscribe([](const TestEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe([&delivered](const TestEvent& event) { delivered += event.value; });

    EXPECT_NO_THROW(bus.emit({"x", 5}));
    EXPECT_EQ(delivered, 5);
}

TEST(EventBusTest, SubscriberMayCallBackIntoBus) {
    EventBus<TestEvent> bus;
    SubscriptionPtr self;
    int calls = 0;

    self = bus.subscribe([&](const TestEvent&) {
        ++calls;
        bus.unsubscribe(self);
    });

    bus.emit({"first", 0});
    bus.emit({"second", 0});

    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, ClearCancelsEverySubscription) {
    EventBus<TestEvent> bus;
    auto first = bus.subscribe([](const TestEvent&) {});
    auto second = bus.subscribe([](const TestEvent&) {});

    bus.clear();

    EXPECT_FALSE(first->isActive());
    EXPECT_FALSE(second->isActive());
    EXPECT_EQ(bus.getSubscriberCount(), 0u);
}

} // namespace modelfetch::core
