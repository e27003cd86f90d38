#pragma once

#include "GameConfig.hpp"

namespace JumpDash::Game {

// Score accrual and difficulty ramp. Stateless; the session owns the values.
class Progression {
public:
    explicit Progression(const GameConfig& config);

    double AccrueScore(double score, float deltaTime) const;

    // max(minimum, initial - score / divisor), in milliseconds
    float SpawnIntervalFor(double score) const;

    // Level boundaries crossed going from previousScore to newScore,
    // compared on whole points
    int LevelThresholdsCrossed(double previousScore, double newScore) const;

    float GetInitialSpeed() const { return m_initialSpeed; }
    float GetSpeedIncrement() const { return m_speedIncrement; }
    float GetInitialSpawnInterval() const { return m_initialSpawnIntervalMs; }

private:
    float m_scoreRate;
    float m_initialSpawnIntervalMs;
    float m_minSpawnIntervalMs;
    float m_scoreDivisor;
    float m_levelStep;
    float m_initialSpeed;
    float m_speedIncrement;
};

} // namespace JumpDash::Game
