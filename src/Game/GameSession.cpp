#include <JumpDash/Game/GameSession.hpp>
#include <JumpDash/Core/Logger.hpp>
#include <algorithm>
#include <string>

namespace JumpDash::Game {

const char* GameStateName(GameState state) {
    switch (state) {
        case GameState::Home:     return "Home";
        case GameState::Running:  return "Running";
        case GameState::Paused:   return "Paused";
        case GameState::GameOver: return "GameOver";
    }
    return "Unknown";
}

GameSession::GameSession(const GameConfig& config, TimeSource& clock, RandomSource& random,
                         ScoreStore* scores)
    : m_config(config)
    , m_clock(clock)
    , m_scores(scores)
    , m_layout(m_config)
    , m_progression(m_config)
    , m_character(m_config, m_layout, &m_events)
    , m_obstacles(m_config, m_layout, random)
    , m_particles(random)
    , m_leaderboard(m_config.leaderboardSize)
    , m_state(GameState::Home)
    , m_score(0.0)
    , m_highScore(0)
    , m_level(1)
    , m_obstacleSpeed(m_config.initialObstacleSpeed)
    , m_spawnIntervalMs(m_config.initialSpawnIntervalMs)
    , m_lastFrameTime(0.0)
    , m_recordFlushed(false) {
    m_settings.audioEnabled = m_config.audioEnabled;
    m_settings.hapticsEnabled = m_config.hapticsEnabled;

    m_character.SetLandingCallback([this](float x, float y) {
        m_particles.SpawnBurst(x, y);
    });

    if (m_scores) {
        m_highScore = m_scores->LoadHighScore();
        m_leaderboard.Assign(m_scores->LoadLeaderboard(m_leaderboard.Capacity()));
    }

    JUMPDASH_LOG_INFO_F("Session ready: high score %d, %zu leaderboard entries",
                        m_highScore, m_leaderboard.Entries().size());
}

void GameSession::Start() {
    if (m_state != GameState::Home) {
        return;
    }
    ResetRun();
    m_lastFrameTime = m_clock.Now();
    SetState(GameState::Running);
}

void GameSession::Jump() {
    if (m_state != GameState::Running) {
        return;
    }
    m_character.Jump();
}

void GameSession::Pause() {
    if (m_state != GameState::Running) {
        return;
    }
    SetState(GameState::Paused);
    Persist();
}

void GameSession::Resume() {
    if (m_state != GameState::Paused) {
        return;
    }
    // Paused wall-clock time must not reach the next step
    m_lastFrameTime = m_clock.Now();
    SetState(GameState::Running);
}

void GameSession::TogglePause() {
    if (m_state == GameState::Running) {
        Pause();
    } else if (m_state == GameState::Paused) {
        Resume();
    }
}

void GameSession::Restart() {
    ResetRun();
    m_lastFrameTime = m_clock.Now();
    SetState(GameState::Running);
}

bool GameSession::Tick() {
    if (m_state != GameState::Running) {
        return false;
    }

    double now = m_clock.Now();
    float deltaTime = static_cast<float>(now - m_lastFrameTime);
    m_lastFrameTime = now;

    Step(deltaTime);
    return true;
}

void GameSession::Step(float deltaTime) {
    if (m_state != GameState::Running) {
        return;
    }

    // Cap dt to avoid a huge step after a stall
    deltaTime = std::clamp(deltaTime, 0.0f, m_config.maxFrameDeltaSeconds);

    m_character.Update();
    m_obstacles.Update(deltaTime);

    if (CheckCollision()) {
        m_events.Publish(GameEvent::Collision);
        EnterGameOver();
        return;
    }

    double previousScore = m_score;
    m_score = m_progression.AccrueScore(m_score, deltaTime);

    int displayScore = GetDisplayScore();
    if (displayScore > m_highScore) {
        m_highScore = displayScore;
        if (m_scores) {
            m_scores->SaveHighScore(m_highScore);
            // Write the record once as soon as it is set, so a crash mid-run
            // keeps it; later gains wait for the next pause or game over
            if (!m_recordFlushed) {
                m_recordFlushed = true;
                FlushScores();
            }
        }
    }

    m_spawnIntervalMs = m_progression.SpawnIntervalFor(m_score);
    m_obstacles.SetSpawnInterval(m_spawnIntervalMs);

    int crossed = m_progression.LevelThresholdsCrossed(previousScore, m_score);
    for (int i = 0; i < crossed; ++i) {
        ++m_level;
        m_obstacleSpeed += m_progression.GetSpeedIncrement();
        m_obstacles.SetSpeed(m_obstacleSpeed);
        JUMPDASH_LOG_INFO_F("Level %d reached, obstacle speed %.1f", m_level, m_obstacleSpeed);
        m_events.Publish(GameEvent::LevelUp);
    }

    m_particles.Update(deltaTime);
}

void GameSession::Shutdown() {
    Persist();
}

bool GameSession::CheckCollision() const {
    AABB characterBox = m_character.GetBoundingBox();
    for (ObstacleId id : m_obstacles.GetActive()) {
        AABB obstacleBox = m_layout.ObstacleBounds(m_obstacles.Get(id).position);
        if (Physics::CheckCollision(characterBox, obstacleBox)) {
            JUMPDASH_LOG_DEBUG_F("Collision with obstacle %u", id);
            return true;
        }
    }
    return false;
}

void GameSession::SetState(GameState state) {
    if (state == m_state) {
        return;
    }
    JUMPDASH_LOG_INFO_F("State %s -> %s", GameStateName(m_state), GameStateName(state));
    m_state = state;
}

void GameSession::EnterGameOver() {
    SetState(GameState::GameOver);
    m_leaderboard.Insert(GetDisplayScore());
    JUMPDASH_LOG_INFO_F("Game over: score %d, level %d", GetDisplayScore(), m_level);
    Persist();
}

void GameSession::ResetRun() {
    m_score = 0.0;
    m_level = 1;
    m_obstacleSpeed = m_progression.GetInitialSpeed();
    m_spawnIntervalMs = m_progression.GetInitialSpawnInterval();

    m_obstacles.Reset();
    m_obstacles.SetSpeed(m_obstacleSpeed);
    m_obstacles.SetSpawnInterval(m_spawnIntervalMs);
    m_particles.Reset();
    m_character.Reset();
    m_recordFlushed = false;
}

void GameSession::Persist() {
    if (!m_scores) {
        return;
    }

    m_scores->SaveHighScore(m_highScore);
    m_scores->SaveLeaderboard(m_leaderboard.Entries());
    FlushScores();
}

void GameSession::FlushScores() {
    auto result = m_scores->Flush();
    if (result.isFailure()) {
        JUMPDASH_LOG_WARNING_F("Could not save scores: %s",
                               std::string(getErrorMessage(result.error())).c_str());
    }
}

} // namespace JumpDash::Game
