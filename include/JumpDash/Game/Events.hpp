#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace JumpDash::Game {

// Cues published by the simulation. None carries a payload.
enum class GameEvent : uint8_t {
    Jumped,
    Landed,
    Collision,
    LevelUp
};

const char* GameEventName(GameEvent event);

/**
 * Synchronous observer registry.
 *
 * Handlers run in subscription order on the publishing thread. A handler may
 * subscribe or unsubscribe; changes take effect from the next Publish.
 */
class EventBus {
public:
    using Handler = std::function<void()>;
    using SubscriptionId = uint32_t;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId Subscribe(GameEvent event, Handler handler);

    // Returns false if the id is unknown
    bool Unsubscribe(SubscriptionId id);

    void Publish(GameEvent event) const;

    size_t SubscriberCount(GameEvent event) const;

private:
    struct Subscription {
        SubscriptionId id;
        GameEvent event;
        Handler handler;
    };

    std::vector<Subscription> m_subscriptions;
    SubscriptionId m_nextId = 1;
};

} // namespace JumpDash::Game
