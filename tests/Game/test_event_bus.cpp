#include <JumpDash/Game/Events.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace JumpDash::Game;

TEST(EventBus, DeliversOnlyToMatchingEvent) {
    EventBus bus;
    int jumped = 0;
    int landed = 0;
    bus.Subscribe(GameEvent::Jumped, [&]() { ++jumped; });
    bus.Subscribe(GameEvent::Landed, [&]() { ++landed; });

    bus.Publish(GameEvent::Jumped);
    bus.Publish(GameEvent::Jumped);

    EXPECT_EQ(jumped, 2);
    EXPECT_EQ(landed, 0);
}

TEST(EventBus, HandlersRunInSubscriptionOrder) {
    EventBus bus;
    std::string order;
    bus.Subscribe(GameEvent::Collision, [&]() { order += "a"; });
    bus.Subscribe(GameEvent::Collision, [&]() { order += "b"; });
    bus.Subscribe(GameEvent::Collision, [&]() { order += "c"; });

    bus.Publish(GameEvent::Collision);

    EXPECT_EQ(order, "abc");
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;
    int count = 0;
    auto id = bus.Subscribe(GameEvent::LevelUp, [&]() { ++count; });
    EXPECT_EQ(bus.SubscriberCount(GameEvent::LevelUp), 1u);

    EXPECT_TRUE(bus.Unsubscribe(id));
    EXPECT_FALSE(bus.Unsubscribe(id));
    bus.Publish(GameEvent::LevelUp);

    EXPECT_EQ(count, 0);
    EXPECT_EQ(bus.SubscriberCount(GameEvent::LevelUp), 0u);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;
    int count = 0;
    EventBus::SubscriptionId id = 0;
    id = bus.Subscribe(GameEvent::Landed, [&]() {
        ++count;
        bus.Unsubscribe(id);
    });

    bus.Publish(GameEvent::Landed);
    bus.Publish(GameEvent::Landed);

    EXPECT_EQ(count, 1);
}

TEST(EventBus, PublishWithoutSubscribersIsHarmless) {
    EventBus bus;
    bus.Publish(GameEvent::Collision);
    EXPECT_EQ(bus.SubscriberCount(GameEvent::Collision), 0u);
}

TEST(GameEventName, NamesEveryEvent) {
    EXPECT_STREQ(GameEventName(GameEvent::Jumped), "jumped");
    EXPECT_STREQ(GameEventName(GameEvent::Landed), "landed");
    EXPECT_STREQ(GameEventName(GameEvent::Collision), "collision");
    EXPECT_STREQ(GameEventName(GameEvent::LevelUp), "levelUp");
}
