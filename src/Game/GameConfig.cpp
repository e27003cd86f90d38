#include <JumpDash/Game/GameConfig.hpp>
#include <JumpDash/Core/Logger.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <string_view>

namespace JumpDash::Game {

namespace {

constexpr std::array<std::string_view, 31> KNOWN_KEYS = {
    "ground_level", "jump_power", "gravity", "coyote_frames",
    "initial_obstacle_speed", "level_speed_increment",
    "initial_spawn_interval_ms", "min_spawn_interval_ms",
    "spawn_interval_score_divisor", "spawn_jitter_ms", "min_spawn_gap_ms",
    "score_rate", "level_score_step", "fps_scale", "despawn_x",
    "max_obstacles", "max_frame_delta", "leaderboard_size",
    "playfield_width", "playfield_height",
    "character_x", "character_width", "character_height",
    "obstacle_width", "obstacle_height",
    "audio", "haptics", "save_path", "save_key", "log_level", "log_file"
};

VoidResult ReadFloat(const Config::ConfigMap& map, const char* key, float& field) {
    auto value = Config::getNumber(map, key, field);
    if (value.isFailure()) {
        JUMPDASH_LOG_WARNING_F("Config key '%s' is not a number", key);
        return value.error();
    }
    double number = value.value();
    if (!std::isfinite(number) || std::fabs(number) > std::numeric_limits<float>::max()) {
        JUMPDASH_LOG_WARNING_F("Config key '%s' is out of range", key);
        return ErrorCode::ConfigInvalid;
    }
    field = static_cast<float>(number);
    return {};
}

// Whole number in [lo, hi], checked before any narrowing cast
Result<double> ReadWhole(const Config::ConfigMap& map, const char* key, double current,
                         double lo, double hi) {
    auto value = Config::getNumber(map, key, current);
    if (value.isFailure() || std::floor(value.value()) != value.value()
        || value.value() < lo || value.value() > hi) {
        JUMPDASH_LOG_WARNING_F("Config key '%s' must be a whole number in [%.0f, %.0f]",
                               key, lo, hi);
        return ErrorCode::ConfigInvalid;
    }
    return value.value();
}

VoidResult ReadCount(const Config::ConfigMap& map, const char* key, size_t& field, size_t limit) {
    auto value = ReadWhole(map, key, static_cast<double>(field), 0.0, static_cast<double>(limit));
    if (value.isFailure()) {
        return value.error();
    }
    field = static_cast<size_t>(value.value());
    return {};
}

VoidResult ReadInt(const Config::ConfigMap& map, const char* key, int& field, int limit) {
    auto value = ReadWhole(map, key, field, 0.0, limit);
    if (value.isFailure()) {
        return value.error();
    }
    field = static_cast<int>(value.value());
    return {};
}

VoidResult ReadBool(const Config::ConfigMap& map, const char* key, bool& field) {
    auto value = Config::getBool(map, key, field);
    if (value.isFailure()) {
        JUMPDASH_LOG_WARNING_F("Config key '%s' must be true or false", key);
        return value.error();
    }
    field = value.value();
    return {};
}

VoidResult Reject(const char* what) {
    JUMPDASH_LOG_WARNING_F("Invalid configuration: %s", what);
    return ErrorCode::ConfigInvalid;
}

} // namespace

VoidResult GameConfig::Validate() const {
    if (jumpPower <= 0.0f) return Reject("jump_power must be positive");
    if (gravity >= 0.0f) return Reject("gravity must be negative");
    if (coyoteFrames < 0 || coyoteFrames > COYOTE_FRAMES_LIMIT) return Reject("coyote_frames out of range");
    if (initialObstacleSpeed <= 0.0f) return Reject("initial_obstacle_speed must be positive");
    if (levelSpeedIncrement < 0.0f) return Reject("level_speed_increment must not be negative");
    if (minSpawnIntervalMs <= 0.0f) return Reject("min_spawn_interval_ms must be positive");
    if (initialSpawnIntervalMs < minSpawnIntervalMs) {
        return Reject("initial_spawn_interval_ms must not be below min_spawn_interval_ms");
    }
    if (spawnIntervalScoreDivisor <= 0.0f) return Reject("spawn_interval_score_divisor must be positive");
    if (spawnJitterMs < 0.0f) return Reject("spawn_jitter_ms must not be negative");
    if (minSpawnGapMs < 0.0f) return Reject("min_spawn_gap_ms must not be negative");
    if (fpsScale <= 0.0f) return Reject("fps_scale must be positive");
    if (maxObstacles == 0 || maxObstacles > MAX_OBSTACLES_LIMIT) return Reject("max_obstacles out of range");
    if (scoreRate < 0.0f) return Reject("score_rate must not be negative");
    if (levelScoreStep <= 0.0f) return Reject("level_score_step must be positive");
    if (leaderboardSize == 0 || leaderboardSize > LEADERBOARD_SIZE_LIMIT) {
        return Reject("leaderboard_size out of range");
    }
    if (maxFrameDeltaSeconds <= 0.0f) return Reject("max_frame_delta must be positive");
    if (playfieldWidth <= 0.0f || playfieldHeight <= 0.0f
        || playfieldWidth > PLAYFIELD_SIZE_LIMIT || playfieldHeight > PLAYFIELD_SIZE_LIMIT) {
        return Reject("playfield size out of range");
    }
    if (characterWidth <= 0.0f || characterHeight <= 0.0f) return Reject("character must have a positive size");
    if (obstacleWidth <= 0.0f || obstacleHeight <= 0.0f) return Reject("obstacles must have a positive size");
    if (groundLevel < 0.0f || groundLevel + characterHeight > playfieldHeight) {
        return Reject("ground_level must leave room for the character");
    }
    if (despawnX > 0.0f) return Reject("despawn_x must be at or left of the playfield edge");
    if (savePath.empty()) return Reject("save_path must not be empty");
    if (saveKey.empty()) return Reject("save_key must not be empty");

    Core::LogLevel level;
    if (!Core::ParseLogLevel(logLevel, level)) return Reject("unknown log_level");

    return {};
}

Result<GameConfig> GameConfig::FromConfigMap(const Config::ConfigMap& map) {
    GameConfig config;

    for (const auto& entry : map) {
        if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), entry.first) == KNOWN_KEYS.end()) {
            JUMPDASH_LOG_DEBUG_F("Ignoring unknown config key '%s'", entry.first.c_str());
        }
    }

    JUMPDASH_TRY(ReadFloat(map, "ground_level", config.groundLevel));
    JUMPDASH_TRY(ReadFloat(map, "jump_power", config.jumpPower));
    JUMPDASH_TRY(ReadFloat(map, "gravity", config.gravity));
    JUMPDASH_TRY(ReadInt(map, "coyote_frames", config.coyoteFrames, COYOTE_FRAMES_LIMIT));

    JUMPDASH_TRY(ReadFloat(map, "initial_obstacle_speed", config.initialObstacleSpeed));
    JUMPDASH_TRY(ReadFloat(map, "level_speed_increment", config.levelSpeedIncrement));
    JUMPDASH_TRY(ReadFloat(map, "initial_spawn_interval_ms", config.initialSpawnIntervalMs));
    JUMPDASH_TRY(ReadFloat(map, "min_spawn_interval_ms", config.minSpawnIntervalMs));
    JUMPDASH_TRY(ReadFloat(map, "spawn_interval_score_divisor", config.spawnIntervalScoreDivisor));
    JUMPDASH_TRY(ReadFloat(map, "spawn_jitter_ms", config.spawnJitterMs));
    JUMPDASH_TRY(ReadFloat(map, "min_spawn_gap_ms", config.minSpawnGapMs));
    JUMPDASH_TRY(ReadFloat(map, "fps_scale", config.fpsScale));
    JUMPDASH_TRY(ReadFloat(map, "despawn_x", config.despawnX));
    JUMPDASH_TRY(ReadCount(map, "max_obstacles", config.maxObstacles, MAX_OBSTACLES_LIMIT));

    JUMPDASH_TRY(ReadFloat(map, "score_rate", config.scoreRate));
    JUMPDASH_TRY(ReadFloat(map, "level_score_step", config.levelScoreStep));
    JUMPDASH_TRY(ReadCount(map, "leaderboard_size", config.leaderboardSize, LEADERBOARD_SIZE_LIMIT));
    JUMPDASH_TRY(ReadFloat(map, "max_frame_delta", config.maxFrameDeltaSeconds));

    JUMPDASH_TRY(ReadFloat(map, "playfield_width", config.playfieldWidth));
    JUMPDASH_TRY(ReadFloat(map, "playfield_height", config.playfieldHeight));
    JUMPDASH_TRY(ReadFloat(map, "character_x", config.characterX));
    JUMPDASH_TRY(ReadFloat(map, "character_width", config.characterWidth));
    JUMPDASH_TRY(ReadFloat(map, "character_height", config.characterHeight));
    JUMPDASH_TRY(ReadFloat(map, "obstacle_width", config.obstacleWidth));
    JUMPDASH_TRY(ReadFloat(map, "obstacle_height", config.obstacleHeight));

    JUMPDASH_TRY(ReadBool(map, "audio", config.audioEnabled));
    JUMPDASH_TRY(ReadBool(map, "haptics", config.hapticsEnabled));

    config.savePath = Config::getString(map, "save_path", config.savePath);
    config.saveKey = Config::getString(map, "save_key", config.saveKey);
    config.logLevel = Config::getString(map, "log_level", config.logLevel);
    config.logFile = Config::getString(map, "log_file", config.logFile);

    JUMPDASH_TRY(config.Validate());
    return config;
}

Result<GameConfig> GameConfig::LoadFromFile(const std::string& path) {
    Config::ConfigLoader loader;
    auto map = loader.load(path);
    if (map.isFailure()) {
        JUMPDASH_LOG_WARNING_F("Cannot load config %s: %s", path.c_str(),
                               std::string(getErrorMessage(map.error())).c_str());
        return map.error();
    }
    return FromConfigMap(map.value());
}

} // namespace JumpDash::Game
