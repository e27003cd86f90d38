#pragma once

#include "Character.hpp"
#include "Events.hpp"
#include "GameConfig.hpp"
#include "Leaderboard.hpp"
#include "ObstacleManager.hpp"
#include "ParticleSystem.hpp"
#include "PlayfieldLayout.hpp"
#include "Progression.hpp"
#include "RandomSource.hpp"
#include "SaveStore.hpp"
#include "TimeSource.hpp"
#include <cstdint>

namespace JumpDash::Game {

enum class GameState : uint8_t {
    Home,
    Running,
    Paused,
    GameOver
};

const char* GameStateName(GameState state);

struct Settings {
    bool audioEnabled = true;
    bool hapticsEnabled = true;
};

/**
 * One run of the game: state machine, per-frame step and scoring.
 *
 * Home -> Running -> {Paused <-> Running, GameOver}; Restart() re-enters
 * Running from any state. Ticks do nothing outside Running.
 *
 * The clock, random source and score store are borrowed and must outlive
 * the session. A null score store disables persistence.
 */
class GameSession {
public:
    GameSession(const GameConfig& config, TimeSource& clock, RandomSource& random,
                ScoreStore* scores = nullptr);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    // Inputs; each is ignored outside the state it applies to
    void Start();
    void Jump();
    void Pause();
    void Resume();
    void TogglePause();
    void Restart();

    // Advance by the time elapsed on the clock since the previous tick.
    // Returns false when nothing ran.
    bool Tick();

    // Advance by an explicit delta in seconds, clamped to the frame limit
    void Step(float deltaTime);

    // Write scores out; call before exit
    void Shutdown();

    void SetAudioEnabled(bool enabled) { m_settings.audioEnabled = enabled; }
    void SetHapticsEnabled(bool enabled) { m_settings.hapticsEnabled = enabled; }
    const Settings& GetSettings() const { return m_settings; }

    GameState GetState() const { return m_state; }
    double GetScore() const { return m_score; }
    int GetDisplayScore() const { return static_cast<int>(m_score); }
    int GetHighScore() const { return m_highScore; }
    int GetLevel() const { return m_level; }
    float GetObstacleSpeed() const { return m_obstacleSpeed; }
    float GetSpawnInterval() const { return m_spawnIntervalMs; }
    const Leaderboard& GetLeaderboard() const { return m_leaderboard; }

    const PlayfieldLayout& GetLayout() const { return m_layout; }
    const Character& GetCharacter() const { return m_character; }
    const ObstacleManager& GetObstacles() const { return m_obstacles; }
    const ParticleSystem& GetParticles() const { return m_particles; }
    EventBus& Events() { return m_events; }

    // Test access to the obstacle stream
    ObstacleManager& MutableObstacles() { return m_obstacles; }

private:
    // First overlapping obstacle ends the scan
    bool CheckCollision() const;

    void SetState(GameState state);
    void EnterGameOver();
    void ResetRun();
    void Persist();
    void FlushScores();

    GameConfig m_config;
    TimeSource& m_clock;
    ScoreStore* m_scores;

    EventBus m_events;
    PlayfieldLayout m_layout;
    Progression m_progression;
    Character m_character;
    ObstacleManager m_obstacles;
    ParticleSystem m_particles;
    Leaderboard m_leaderboard;
    Settings m_settings;

    GameState m_state;
    double m_score;
    int m_highScore;
    int m_level;
    float m_obstacleSpeed;
    float m_spawnIntervalMs;
    double m_lastFrameTime;
    bool m_recordFlushed;   // New high score already on disk this run
};

} // namespace JumpDash::Game
