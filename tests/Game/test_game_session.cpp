#include <JumpDash/Game/GameSession.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace JumpDash;
using namespace JumpDash::Game;
using namespace JumpDash::Testing;

class GameSessionTest : public ::testing::Test {
protected:
    GameSessionTest()
        : GameSessionTest(quietConfig()) {
    }

    explicit GameSessionTest(const GameConfig& cfg)
        : config(cfg)
        , random({0.5f})
        , scores(backing)
        , session(config, clock, random, &scores) {
        session.Events().Subscribe(GameEvent::Collision, [this]() { ++collisions; });
        session.Events().Subscribe(GameEvent::LevelUp, [this]() { ++levelUps; });
    }

    // Step until game over, with a safety cap; returns the number of steps
    int stepUntilGameOver(float dt = 0.1f, int maxSteps = 200) {
        int steps = 0;
        while (session.GetState() == GameState::Running && steps < maxSteps) {
            session.Step(dt);
            ++steps;
        }
        return steps;
    }

    GameConfig config;
    ManualTimeSource clock;
    ScriptedRandom random;
    MemoryKeyValueStore backing;
    ScoreStore scores;
    GameSession session;

    int collisions = 0;
    int levelUps = 0;
};

// ============================================================================
// State Machine
// ============================================================================

TEST_F(GameSessionTest, StartsAtHomeAndIgnoresTicks) {
    EXPECT_EQ(session.GetState(), GameState::Home);

    clock.Advance(1.0);
    EXPECT_FALSE(session.Tick());
    session.Step(0.1f);

    EXPECT_DOUBLE_EQ(session.GetScore(), 0.0);
    EXPECT_EQ(session.GetLevel(), 1);
}

TEST_F(GameSessionTest, InputsOnlyApplyInTheirState) {
    session.Jump();
    EXPECT_FALSE(session.GetCharacter().IsJumping());

    session.Pause();
    EXPECT_EQ(session.GetState(), GameState::Home);
    session.Resume();
    EXPECT_EQ(session.GetState(), GameState::Home);

    session.Start();
    EXPECT_EQ(session.GetState(), GameState::Running);

    session.Resume();
    EXPECT_EQ(session.GetState(), GameState::Running);

    session.Jump();
    EXPECT_TRUE(session.GetCharacter().IsJumping());
}

TEST_F(GameSessionTest, TickUsesClockDelta) {
    session.Start();

    clock.Advance(0.05);
    EXPECT_TRUE(session.Tick());
    EXPECT_NEAR(session.GetScore(), 0.5, 1e-4);

    clock.Advance(0.05);
    session.Tick();
    EXPECT_NEAR(session.GetScore(), 1.0, 1e-4);
}

TEST_F(GameSessionTest, LongStallIsClampedToOneFrameLimit) {
    session.Start();

    clock.Advance(5.0);
    session.Tick();

    EXPECT_NEAR(session.GetScore(), config.maxFrameDeltaSeconds * config.scoreRate, 1e-4);
}

TEST_F(GameSessionTest, PauseFreezesAndResumeReanchors) {
    session.Start();
    clock.Advance(0.05);
    session.Tick();

    session.Pause();
    EXPECT_EQ(session.GetState(), GameState::Paused);

    clock.Advance(30.0);
    EXPECT_FALSE(session.Tick());
    EXPECT_NEAR(session.GetScore(), 0.5, 1e-4);

    session.Resume();
    EXPECT_EQ(session.GetState(), GameState::Running);

    // Only the time since resume counts
    clock.Advance(0.05);
    session.Tick();
    EXPECT_NEAR(session.GetScore(), 1.0, 1e-4);
}

TEST_F(GameSessionTest, TogglePauseFlipsRunningAndPaused) {
    session.TogglePause();
    EXPECT_EQ(session.GetState(), GameState::Home);

    session.Start();
    session.TogglePause();
    EXPECT_EQ(session.GetState(), GameState::Paused);
    session.TogglePause();
    EXPECT_EQ(session.GetState(), GameState::Running);
}

TEST_F(GameSessionTest, PauseFlushesScores) {
    session.Start();
    session.Step(0.1f);
    session.Step(0.1f);

    session.Pause();

    EXPECT_EQ(backing.Get(ScoreStore::HIGH_SCORE_KEY).value_or(""), "2");
    EXPECT_EQ(backing.Get(ScoreStore::LEADERBOARD_KEY).value_or(""), "[]");
}

// ============================================================================
// Collision and Game Over
// ============================================================================

TEST_F(GameSessionTest, CollisionEndsRunExactlyOnce) {
    session.Start();
    ASSERT_TRUE(session.MutableObstacles().SpawnObstacle());

    int steps = stepUntilGameOver();

    ASSERT_EQ(session.GetState(), GameState::GameOver);
    EXPECT_LT(steps, 40);
    EXPECT_EQ(collisions, 1);

    // Frozen afterwards
    double finalScore = session.GetScore();
    session.Step(0.1f);
    clock.Advance(1.0);
    EXPECT_FALSE(session.Tick());
    EXPECT_DOUBLE_EQ(session.GetScore(), finalScore);
    EXPECT_EQ(collisions, 1);
}

TEST_F(GameSessionTest, GameOverRecordsAndPersistsScore) {
    session.Start();
    ASSERT_TRUE(session.MutableObstacles().SpawnObstacle());
    stepUntilGameOver();
    ASSERT_EQ(session.GetState(), GameState::GameOver);

    int finalScore = session.GetDisplayScore();
    EXPECT_GT(finalScore, 0);
    EXPECT_EQ(session.GetLeaderboard().Entries(), (std::vector<int>{finalScore}));
    EXPECT_EQ(session.GetHighScore(), finalScore);

    EXPECT_EQ(scores.LoadHighScore(), finalScore);
    EXPECT_EQ(scores.LoadLeaderboard(5), (std::vector<int>{finalScore}));
}

TEST_F(GameSessionTest, JumpClearsObstacle) {
    session.Start();
    ASSERT_TRUE(session.MutableObstacles().SpawnObstacle());

    // Jump when the obstacle is a few frames from the character
    const float dt = 1.0f / 60.0f;
    bool jumped = false;
    for (int i = 0; i < 300 && session.GetState() == GameState::Running; ++i) {
        const auto& obstacles = session.GetObstacles();
        if (!jumped && obstacles.ActiveCount() == 1) {
            float position = obstacles.Get(obstacles.GetActive().front()).position;
            if (position < config.characterX + config.characterWidth + 60.0f) {
                session.Jump();
                jumped = true;
            }
        }
        session.Step(dt);
    }

    EXPECT_TRUE(jumped);
    EXPECT_EQ(session.GetState(), GameState::Running);
    EXPECT_EQ(collisions, 0);
    EXPECT_EQ(session.GetObstacles().ActiveCount(), 0u);
}

// ============================================================================
// Restart
// ============================================================================

TEST_F(GameSessionTest, RestartMidRunResetsEverything) {
    session.Start();
    session.MutableObstacles().SpawnObstacle();
    session.Jump();
    for (int i = 0; i < 5; ++i) {
        session.Step(0.1f);
    }
    ASSERT_GT(session.GetScore(), 0.0);

    clock.Set(100.0);
    session.Restart();

    EXPECT_EQ(session.GetState(), GameState::Running);
    EXPECT_DOUBLE_EQ(session.GetScore(), 0.0);
    EXPECT_EQ(session.GetLevel(), 1);
    EXPECT_FLOAT_EQ(session.GetObstacleSpeed(), config.initialObstacleSpeed);
    EXPECT_FLOAT_EQ(session.GetSpawnInterval(), config.initialSpawnIntervalMs);
    EXPECT_EQ(session.GetObstacles().ActiveCount(), 0u);
    EXPECT_EQ(session.GetObstacles().PooledCount(), 0u);
    EXPECT_EQ(session.GetParticles().ActiveCount(), 0u);

    const auto& character = session.GetCharacter();
    EXPECT_FLOAT_EQ(character.GetY(), config.groundLevel);
    EXPECT_FLOAT_EQ(character.GetVelocityY(), 0.0f);
    EXPECT_FALSE(character.IsJumping());

    // Time baseline moved to the restart instant
    clock.Advance(0.05);
    session.Tick();
    EXPECT_NEAR(session.GetScore(), 0.5, 1e-4);
}

TEST_F(GameSessionTest, RestartFromGameOverSkipsHome) {
    session.Start();
    session.MutableObstacles().SpawnObstacle();
    stepUntilGameOver();
    ASSERT_EQ(session.GetState(), GameState::GameOver);

    session.Start();
    EXPECT_EQ(session.GetState(), GameState::GameOver);

    session.Restart();
    EXPECT_EQ(session.GetState(), GameState::Running);
    EXPECT_DOUBLE_EQ(session.GetScore(), 0.0);
}

// ============================================================================
// Scoring and Difficulty
// ============================================================================

class FastScoringSessionTest : public GameSessionTest {
protected:
    static GameConfig fastConfig() {
        GameConfig cfg = quietConfig();
        cfg.scoreRate = 10000.0f;
        return cfg;
    }

    FastScoringSessionTest() : GameSessionTest(fastConfig()) {}
};

TEST_F(FastScoringSessionTest, LevelUpAtEachThousand) {
    session.Start();

    session.Step(0.1f);
    EXPECT_EQ(session.GetDisplayScore(), 1000);
    EXPECT_EQ(session.GetLevel(), 2);
    EXPECT_FLOAT_EQ(session.GetObstacleSpeed(), 6.0f);
    EXPECT_FLOAT_EQ(session.GetObstacles().GetSpeed(), 6.0f);
    EXPECT_EQ(levelUps, 1);

    session.Step(0.1f);
    EXPECT_EQ(session.GetLevel(), 3);
    EXPECT_FLOAT_EQ(session.GetObstacleSpeed(), 7.0f);
    EXPECT_EQ(levelUps, 2);
}

TEST_F(FastScoringSessionTest, SpawnIntervalFollowsScore) {
    session.Start();

    session.Step(0.1f);
    session.Step(0.1f);
    EXPECT_FLOAT_EQ(session.GetSpawnInterval(), 1600.0f);
    EXPECT_FLOAT_EQ(session.GetObstacles().GetSpawnInterval(), 1600.0f);

    for (int i = 0; i < 4; ++i) {
        session.Step(0.1f);
    }
    EXPECT_FLOAT_EQ(session.GetSpawnInterval(), 800.0f);
}

TEST_F(FastScoringSessionTest, HighScoreTracksRun) {
    session.Start();
    session.Step(0.05f);

    EXPECT_EQ(session.GetHighScore(), session.GetDisplayScore());
    EXPECT_EQ(backing.Get(ScoreStore::HIGH_SCORE_KEY).value_or(""),
              std::to_string(session.GetDisplayScore()));
}

class SkippingSessionTest : public GameSessionTest {
protected:
    static GameConfig skippingConfig() {
        GameConfig cfg = quietConfig();
        cfg.scoreRate = 25000.0f;
        return cfg;
    }

    SkippingSessionTest() : GameSessionTest(skippingConfig()) {}
};

TEST_F(SkippingSessionTest, StepOverSeveralThresholdsCountsEach) {
    session.Start();
    session.Step(0.1f);

    EXPECT_EQ(session.GetDisplayScore(), 2500);
    EXPECT_EQ(session.GetLevel(), 3);
    EXPECT_FLOAT_EQ(session.GetObstacleSpeed(), 7.0f);
    EXPECT_EQ(levelUps, 2);
}

// ============================================================================
// Persistence, Effects and Settings
// ============================================================================

TEST(GameSessionPersistence, RestoresSavedScores) {
    MemoryKeyValueStore backing;
    ScoreStore scores(backing);
    scores.SaveHighScore(350);
    scores.SaveLeaderboard({350, 120, 80});

    GameConfig config = quietConfig();
    ManualTimeSource clock;
    ScriptedRandom random;
    GameSession session(config, clock, random, &scores);

    EXPECT_EQ(session.GetHighScore(), 350);
    EXPECT_EQ(session.GetLeaderboard().Entries(), (std::vector<int>{350, 120, 80}));
}

namespace {

// Remembers the stored high score each time the session asks for a flush
class FlushRecordingStore : public MemoryKeyValueStore {
public:
    VoidResult Flush() override {
        flushedHighScores.push_back(Get(ScoreStore::HIGH_SCORE_KEY).value_or(""));
        return {};
    }

    std::vector<std::string> flushedHighScores;
};

} // namespace

TEST(GameSessionPersistence, NewRecordIsFlushedOnceWhenSet) {
    FlushRecordingStore backing;
    ScoreStore scores(backing);
    scores.SaveHighScore(5);

    GameConfig config = quietConfig();
    ManualTimeSource clock;
    ScriptedRandom random({0.5f});
    GameSession session(config, clock, random, &scores);

    session.Start();
    for (int i = 0; i < 5; ++i) {
        session.Step(0.1f);
    }
    EXPECT_TRUE(backing.flushedHighScores.empty());

    // Score 6 beats the stored 5
    session.Step(0.1f);
    ASSERT_EQ(backing.flushedHighScores.size(), 1u);
    EXPECT_EQ(backing.flushedHighScores[0], "6");

    session.Step(0.1f);
    session.Step(0.1f);
    EXPECT_EQ(backing.flushedHighScores.size(), 1u);
    EXPECT_EQ(backing.Get(ScoreStore::HIGH_SCORE_KEY).value_or(""), "8");

    session.Pause();
    ASSERT_EQ(backing.flushedHighScores.size(), 2u);
    EXPECT_EQ(backing.flushedHighScores[1], "8");
}

TEST(GameSessionPersistence, RunsWithoutStore) {
    GameConfig config = quietConfig();
    ManualTimeSource clock;
    ScriptedRandom random;
    GameSession session(config, clock, random);

    session.Start();
    session.Step(0.1f);
    session.Pause();
    session.Shutdown();

    EXPECT_EQ(session.GetState(), GameState::Paused);
    EXPECT_EQ(session.GetHighScore(), 1);
}

TEST_F(GameSessionTest, LandingSpawnsDust) {
    session.Start();
    session.Jump();

    const float dt = 1.0f / 60.0f;
    for (int i = 0; i < 100 && session.GetCharacter().IsJumping(); ++i) {
        session.Step(dt);
    }

    ASSERT_FALSE(session.GetCharacter().IsJumping());
    EXPECT_EQ(session.GetParticles().ActiveCount(),
              static_cast<size_t>(ParticleSystem::BURST_COUNT));
}

TEST_F(GameSessionTest, SettingsStartFromConfigAndToggle) {
    EXPECT_TRUE(session.GetSettings().audioEnabled);
    EXPECT_TRUE(session.GetSettings().hapticsEnabled);

    session.SetAudioEnabled(false);
    session.SetHapticsEnabled(false);

    EXPECT_FALSE(session.GetSettings().audioEnabled);
    EXPECT_FALSE(session.GetSettings().hapticsEnabled);
}

TEST_F(GameSessionTest, JumpIsPublished) {
    int jumps = 0;
    session.Events().Subscribe(GameEvent::Jumped, [&]() { ++jumps; });

    session.Start();
    session.Jump();

    EXPECT_EQ(jumps, 1);
}

TEST(GameStateName, NamesEveryState) {
    EXPECT_STREQ(GameStateName(GameState::Home), "Home");
    EXPECT_STREQ(GameStateName(GameState::Running), "Running");
    EXPECT_STREQ(GameStateName(GameState::Paused), "Paused");
    EXPECT_STREQ(GameStateName(GameState::GameOver), "GameOver");
}
