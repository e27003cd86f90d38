#include <JumpDash/Game/Progression.hpp>
#include <algorithm>
#include <cmath>

namespace JumpDash::Game {

Progression::Progression(const GameConfig& config)
    : m_scoreRate(config.scoreRate)
    , m_initialSpawnIntervalMs(config.initialSpawnIntervalMs)
    , m_minSpawnIntervalMs(config.minSpawnIntervalMs)
    , m_scoreDivisor(config.spawnIntervalScoreDivisor)
    , m_levelStep(config.levelScoreStep)
    , m_initialSpeed(config.initialObstacleSpeed)
    , m_speedIncrement(config.levelSpeedIncrement) {
}

double Progression::AccrueScore(double score, float deltaTime) const {
    if (deltaTime <= 0.0f) {
        return score;
    }
    return score + static_cast<double>(deltaTime) * m_scoreRate;
}

float Progression::SpawnIntervalFor(double score) const {
    double interval = m_initialSpawnIntervalMs - score / m_scoreDivisor;
    return static_cast<float>(std::max<double>(m_minSpawnIntervalMs, interval));
}

int Progression::LevelThresholdsCrossed(double previousScore, double newScore) const {
    if (newScore <= previousScore) {
        return 0;
    }
    // Whole points, so 999.9 -> 1000.0 counts and 1000.2 -> 1000.8 does not
    double before = std::floor(std::floor(previousScore) / m_levelStep);
    double after = std::floor(std::floor(newScore) / m_levelStep);
    return static_cast<int>(after - before);
}

} // namespace JumpDash::Game
