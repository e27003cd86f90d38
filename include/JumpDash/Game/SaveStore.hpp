#pragma once

#include <JumpDash/Core/ErrorCodes.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace JumpDash::Game {

// String key-value persistence
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> Get(const std::string& key) const = 0;
    virtual void Set(const std::string& key, std::string value) = 0;

    // Make pending writes durable
    virtual VoidResult Flush() = 0;
};

class MemoryKeyValueStore : public KeyValueStore {
public:
    std::optional<std::string> Get(const std::string& key) const override;
    void Set(const std::string& key, std::string value) override;
    VoidResult Flush() override { return {}; }

private:
    std::map<std::string, std::string> m_entries;
};

/**
 * JSON file store with an HMAC-SHA256 tag over its entries.
 *
 * File layout:
 *   { "version": 1, "entries": { "<key>": "<value>", ... }, "hmac": "<hex>" }
 *
 * Load() leaves the store empty on any failure (missing file, bad JSON,
 * wrong shape, tag mismatch) and reports why. Flush() writes a sibling
 * temporary file and renames it over the target.
 */
class FileKeyValueStore : public KeyValueStore {
public:
    static constexpr int FORMAT_VERSION = 1;

    FileKeyValueStore(std::string path, std::string key);

    VoidResult Load();

    std::optional<std::string> Get(const std::string& key) const override;
    void Set(const std::string& key, std::string value) override;
    VoidResult Flush() override;

    const std::string& GetPath() const { return m_path; }
    bool IsDirty() const { return m_dirty; }

private:
    std::string m_path;
    std::string m_key;
    std::map<std::string, std::string> m_entries;
    bool m_dirty = false;
};

// Typed access to the high score and leaderboard entries
class ScoreStore {
public:
    static constexpr const char* HIGH_SCORE_KEY = "highScore";
    static constexpr const char* LEADERBOARD_KEY = "leaderboard";

    explicit ScoreStore(KeyValueStore& store);

    // 0 when absent or not a non-negative integer
    int LoadHighScore() const;
    void SaveHighScore(int score);

    // Empty when absent or not a JSON array of integers; otherwise sorted
    // descending and cut to capacity
    std::vector<int> LoadLeaderboard(size_t capacity) const;
    void SaveLeaderboard(const std::vector<int>& scores);

    VoidResult Flush() { return m_store.Flush(); }

private:
    KeyValueStore& m_store;
};

} // namespace JumpDash::Game
