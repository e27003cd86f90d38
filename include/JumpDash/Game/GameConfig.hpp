#pragma once

#include <JumpDash/Core/Config.hpp>
#include <JumpDash/Core/ErrorCodes.hpp>
#include <cstddef>
#include <string>

namespace JumpDash::Game {

/**
 * Every tunable of the simulation, the layout and the front end.
 *
 * Defaults reproduce the reference tuning; a config file only needs the
 * keys it changes. Times are milliseconds unless the name says otherwise.
 */
struct GameConfig {
    // Upper limits; the arena and leaderboard are allocated up front
    static constexpr size_t MAX_OBSTACLES_LIMIT = 1024;
    static constexpr size_t LEADERBOARD_SIZE_LIMIT = 100;
    static constexpr int COYOTE_FRAMES_LIMIT = 600;
    static constexpr float PLAYFIELD_SIZE_LIMIT = 8192.0f;

    // Character
    float groundLevel = 10.0f;
    float jumpPower = 12.0f;
    float gravity = -0.6f;
    int coyoteFrames = 6;

    // Obstacle stream
    float initialObstacleSpeed = 5.0f;
    float levelSpeedIncrement = 1.0f;
    float initialSpawnIntervalMs = 2000.0f;
    float minSpawnIntervalMs = 800.0f;
    float spawnIntervalScoreDivisor = 5.0f;
    float spawnJitterMs = 500.0f;
    float minSpawnGapMs = 1500.0f;
    float fpsScale = 60.0f;
    float despawnX = -30.0f;
    size_t maxObstacles = 32;

    // Scoring
    float scoreRate = 10.0f;
    float levelScoreStep = 1000.0f;
    size_t leaderboardSize = 5;
    float maxFrameDeltaSeconds = 0.1f;

    // Layout (pixels)
    float playfieldWidth = 800.0f;
    float playfieldHeight = 300.0f;
    float characterX = 50.0f;
    float characterWidth = 40.0f;
    float characterHeight = 40.0f;
    float obstacleWidth = 30.0f;
    float obstacleHeight = 40.0f;

    // Initial settings
    bool audioEnabled = true;
    bool hapticsEnabled = true;

    // Persistence
    std::string savePath = "jumpdash_save.json";
    std::string saveKey = "jumpdash-local-save-v1";

    // Logging
    std::string logLevel = "info";
    std::string logFile;

    // Range checks; ConfigInvalid on the first bad value
    VoidResult Validate() const;

    // Overlay the keys present in a parsed config on the defaults
    static Result<GameConfig> FromConfigMap(const Config::ConfigMap& map);

    // Load and validate a config file
    static Result<GameConfig> LoadFromFile(const std::string& path);
};

} // namespace JumpDash::Game
