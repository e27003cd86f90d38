#pragma once

#include <JumpDash/Game/GameSession.hpp>
#include <vector>

namespace JumpDash::Frontend {

// Turns simulation events into audio and haptic cues. There is no audio or
// rumble backend; cues are logged so their timing can be checked.
class CueListener {
public:
    static constexpr int LANDING_PULSE_MS = 50;
    static constexpr int GAME_OVER_PULSE_MS = 100;

    explicit CueListener(Game::GameSession& session);
    ~CueListener();

    CueListener(const CueListener&) = delete;
    CueListener& operator=(const CueListener&) = delete;

    int GetCueCount() const { return m_cueCount; }

private:
    void OnEvent(Game::GameEvent event);
    void PlaySound(const char* name);
    void Vibrate(int milliseconds);

    Game::GameSession& m_session;
    std::vector<Game::EventBus::SubscriptionId> m_subscriptions;
    int m_cueCount = 0;
};

} // namespace JumpDash::Frontend
