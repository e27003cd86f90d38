#include "CueListener.hpp"
#include <JumpDash/Core/Logger.hpp>

namespace JumpDash::Frontend {

using Game::GameEvent;

CueListener::CueListener(Game::GameSession& session)
    : m_session(session) {
    for (GameEvent event : {GameEvent::Jumped, GameEvent::Landed,
                            GameEvent::Collision, GameEvent::LevelUp}) {
        m_subscriptions.push_back(
            m_session.Events().Subscribe(event, [this, event]() { OnEvent(event); }));
    }
}

CueListener::~CueListener() {
    for (auto id : m_subscriptions) {
        m_session.Events().Unsubscribe(id);
    }
}

void CueListener::OnEvent(GameEvent event) {
    ++m_cueCount;
    JUMPDASH_LOG_DEBUG_F("Cue: %s", Game::GameEventName(event));

    switch (event) {
        case GameEvent::Jumped:
            PlaySound("jump");
            break;
        case GameEvent::Landed:
            PlaySound("land");
            Vibrate(LANDING_PULSE_MS);
            break;
        case GameEvent::Collision:
            PlaySound("collision");
            Vibrate(GAME_OVER_PULSE_MS);
            break;
        case GameEvent::LevelUp:
            PlaySound("level_up");
            break;
    }
}

void CueListener::PlaySound(const char* name) {
    if (!m_session.GetSettings().audioEnabled) {
        return;
    }
    JUMPDASH_LOG_DEBUG_F("Audio cue '%s'", name);
}

void CueListener::Vibrate(int milliseconds) {
    if (!m_session.GetSettings().hapticsEnabled) {
        return;
    }
    JUMPDASH_LOG_DEBUG_F("Haptic pulse %d ms", milliseconds);
}

} // namespace JumpDash::Frontend
