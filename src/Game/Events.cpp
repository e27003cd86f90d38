#include <JumpDash/Game/Events.hpp>
#include <algorithm>
#include <utility>

namespace JumpDash::Game {

const char* GameEventName(GameEvent event) {
    switch (event) {
        case GameEvent::Jumped:    return "jumped";
        case GameEvent::Landed:    return "landed";
        case GameEvent::Collision: return "collision";
        case GameEvent::LevelUp:   return "levelUp";
    }
    return "unknown";
}

EventBus::SubscriptionId EventBus::Subscribe(GameEvent event, Handler handler) {
    SubscriptionId id = m_nextId++;
    m_subscriptions.push_back(Subscription{id, event, std::move(handler)});
    return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
    auto it = std::find_if(m_subscriptions.begin(), m_subscriptions.end(),
        [id](const Subscription& sub) { return sub.id == id; });
    if (it == m_subscriptions.end()) {
        return false;
    }
    m_subscriptions.erase(it);
    return true;
}

void EventBus::Publish(GameEvent event) const {
    // Snapshot so handlers can change subscriptions while we iterate
    std::vector<Handler> handlers;
    for (const auto& sub : m_subscriptions) {
        if (sub.event == event && sub.handler) {
            handlers.push_back(sub.handler);
        }
    }
    for (const auto& handler : handlers) {
        handler();
    }
}

size_t EventBus::SubscriberCount(GameEvent event) const {
    return static_cast<size_t>(std::count_if(m_subscriptions.begin(), m_subscriptions.end(),
        [event](const Subscription& sub) { return sub.event == event; }));
}

} // namespace JumpDash::Game
