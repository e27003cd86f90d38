// tests/TestHarness.hpp
#pragma once

#include <JumpDash/Core/Types.hpp>
#include <JumpDash/Game/GameConfig.hpp>
#include <JumpDash/Game/RandomSource.hpp>
#include <JumpDash/Game/TimeSource.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace JumpDash::Testing {

// ============================================================================
// Deterministic Sources
// ============================================================================

/**
 * Clock that only moves when told to
 */
class ManualTimeSource : public Game::TimeSource {
public:
    explicit ManualTimeSource(double start = 0.0) : m_now(start) {}

    double Now() const override { return m_now; }

    void Advance(double seconds) { m_now += seconds; }
    void Set(double seconds) { m_now = seconds; }

private:
    double m_now;
};

/**
 * Replays a fixed list of unit draws, then repeats the last one.
 * An empty script always yields the fallback.
 */
class ScriptedRandom : public Game::RandomSource {
public:
    explicit ScriptedRandom(std::vector<float> draws = {}, float fallback = 0.5f);

    float NextUnit() override;

    size_t DrawCount() const { return m_drawCount; }

private:
    std::vector<float> m_draws;
    float m_fallback;
    size_t m_next = 0;
    size_t m_drawCount = 0;
};

// ============================================================================
// Configuration Helpers
// ============================================================================

/**
 * Default tuning with obstacle spawning pushed far out of reach, so a run
 * only meets the obstacles a test places itself
 */
Game::GameConfig quietConfig();

// ============================================================================
// Test Fixtures
// ============================================================================

/**
 * Fixture owning a fresh temporary directory per test
 */
class TempDirFixture : public ::testing::Test {
protected:
    void SetUp() override;
    void TearDown() override;

    std::filesystem::path path(const std::string& name) const { return m_dir / name; }

    // Write text to a file inside the temp directory and return its path
    std::string writeFile(const std::string& name, const std::string& content) const;

    // Whole file as text; empty if unreadable
    std::string readFile(const std::string& name) const;

    std::filesystem::path m_dir;
};

// ============================================================================
// Assertion Helpers
// ============================================================================

#define ASSERT_RESULT_OK(result) \
    ASSERT_TRUE((result).isSuccess()) \
        << "Operation failed: " << ::JumpDash::getErrorMessage((result).error())

} // namespace JumpDash::Testing
