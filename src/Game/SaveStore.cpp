#include <JumpDash/Game/SaveStore.hpp>
#include <JumpDash/Core/Crypto.hpp>
#include <JumpDash/Core/Logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <sstream>
#include <system_error>

namespace JumpDash::Game {

using json = nlohmann::json;

namespace {

// Tag input: version and the entries object in its canonical (key-sorted) dump
std::string TagPayload(int version, const json& entries) {
    return std::to_string(version) + "|" + entries.dump();
}

} // namespace

// ============================================================================
// MemoryKeyValueStore
// ============================================================================

std::optional<std::string> MemoryKeyValueStore::Get(const std::string& key) const {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKeyValueStore::Set(const std::string& key, std::string value) {
    m_entries[key] = std::move(value);
}

// ============================================================================
// FileKeyValueStore
// ============================================================================

FileKeyValueStore::FileKeyValueStore(std::string path, std::string key)
    : m_path(std::move(path))
    , m_key(std::move(key)) {
}

VoidResult FileKeyValueStore::Load() {
    m_entries.clear();
    m_dirty = false;

    std::ifstream file(m_path, std::ios::binary);
    if (!file.is_open()) {
        return ErrorCode::FileNotFound;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return ErrorCode::FileReadError;
    }

    json document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::exception& e) {
        JUMPDASH_LOG_WARNING_F("Save file %s is not valid JSON: %s", m_path.c_str(), e.what());
        return ErrorCode::JsonParseFailed;
    }

    if (!document.is_object()
        || !document.contains("version") || !document["version"].is_number_integer()
        || !document.contains("entries") || !document["entries"].is_object()
        || !document.contains("hmac") || !document["hmac"].is_string()) {
        JUMPDASH_LOG_WARNING_F("Save file %s has an unexpected layout", m_path.c_str());
        return ErrorCode::JsonInvalid;
    }

    int version = document["version"].get<int>();
    if (version != FORMAT_VERSION) {
        JUMPDASH_LOG_WARNING_F("Save file %s has unsupported version %d", m_path.c_str(), version);
        return ErrorCode::JsonInvalid;
    }

    const json& entries = document["entries"];
    for (const auto& item : entries.items()) {
        if (!item.value().is_string()) {
            return ErrorCode::InvalidFieldType;
        }
    }

    auto tag = Crypto::fromHex(document["hmac"].get<std::string>());
    if (tag.isFailure()) {
        return tag.error();
    }

    Crypto::HmacSha256 hmac(asBytes(m_key));
    std::string payload = TagPayload(version, entries);
    auto verified = hmac.verify(asBytes(payload), tag.value());
    if (verified.isFailure()) {
        return verified.error();
    }
    if (!verified.value()) {
        JUMPDASH_LOG_WARNING_F("Save file %s failed its integrity check", m_path.c_str());
        return ErrorCode::SignatureInvalid;
    }

    for (const auto& item : entries.items()) {
        m_entries[item.key()] = item.value().get<std::string>();
    }

    JUMPDASH_LOG_DEBUG_F("Loaded %zu save entries from %s", m_entries.size(), m_path.c_str());
    return {};
}

std::optional<std::string> FileKeyValueStore::Get(const std::string& key) const {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FileKeyValueStore::Set(const std::string& key, std::string value) {
    auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second == value) {
        return;
    }
    m_entries[key] = std::move(value);
    m_dirty = true;
}

VoidResult FileKeyValueStore::Flush() {
    if (!m_dirty) {
        return {};
    }

    json entries = json::object();
    for (const auto& [key, value] : m_entries) {
        entries[key] = value;
    }

    Crypto::HmacSha256 hmac(asBytes(m_key));
    std::string payload = TagPayload(FORMAT_VERSION, entries);
    auto tag = hmac.compute(asBytes(payload));
    if (tag.isFailure()) {
        return tag.error();
    }

    json document = {
        {"version", FORMAT_VERSION},
        {"entries", entries},
        {"hmac", Crypto::toHex(tag.value())}
    };

    std::filesystem::path target(m_path);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            JUMPDASH_LOG_ERROR_F("Cannot create save directory for %s: %s",
                                 m_path.c_str(), ec.message().c_str());
            return ErrorCode::FileWriteError;
        }
    }

    std::filesystem::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            JUMPDASH_LOG_ERROR_F("Cannot open %s for writing", temp.string().c_str());
            return ErrorCode::FileWriteError;
        }
        out << document.dump(2);
        out.flush();
        if (!out) {
            JUMPDASH_LOG_ERROR_F("Short write to %s", temp.string().c_str());
            return ErrorCode::FileWriteError;
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        JUMPDASH_LOG_ERROR_F("Cannot replace %s: %s", m_path.c_str(), ec.message().c_str());
        std::filesystem::remove(temp, ec);
        return ErrorCode::FileWriteError;
    }

    m_dirty = false;
    JUMPDASH_LOG_DEBUG_F("Wrote %zu save entries to %s", m_entries.size(), m_path.c_str());
    return {};
}

// ============================================================================
// ScoreStore
// ============================================================================

ScoreStore::ScoreStore(KeyValueStore& store)
    : m_store(store) {
}

int ScoreStore::LoadHighScore() const {
    auto stored = m_store.Get(HIGH_SCORE_KEY);
    if (!stored) {
        return 0;
    }

    try {
        json value = json::parse(*stored);
        if (value.is_number_integer() && value.get<int64_t>() >= 0
            && value.get<int64_t>() <= std::numeric_limits<int>::max()) {
            return value.get<int>();
        }
    } catch (const json::exception& e) {
        JUMPDASH_LOG_WARNING_F("Stored high score is unreadable: %s", e.what());
        return 0;
    }

    JUMPDASH_LOG_WARNING("Stored high score is not a non-negative integer");
    return 0;
}

void ScoreStore::SaveHighScore(int score) {
    m_store.Set(HIGH_SCORE_KEY, std::to_string(score));
}

std::vector<int> ScoreStore::LoadLeaderboard(size_t capacity) const {
    auto stored = m_store.Get(LEADERBOARD_KEY);
    if (!stored) {
        return {};
    }

    std::vector<int> scores;
    try {
        json value = json::parse(*stored);
        if (!value.is_array()) {
            JUMPDASH_LOG_WARNING("Stored leaderboard is not an array");
            return {};
        }
        for (const auto& entry : value) {
            if (!entry.is_number_integer()) {
                JUMPDASH_LOG_WARNING("Stored leaderboard holds a non-integer entry");
                return {};
            }
            scores.push_back(entry.get<int>());
        }
    } catch (const json::exception& e) {
        JUMPDASH_LOG_WARNING_F("Stored leaderboard is unreadable: %s", e.what());
        return {};
    }

    std::stable_sort(scores.begin(), scores.end(), std::greater<int>());
    if (scores.size() > capacity) {
        scores.resize(capacity);
    }
    return scores;
}

void ScoreStore::SaveLeaderboard(const std::vector<int>& scores) {
    m_store.Set(LEADERBOARD_KEY, json(scores).dump());
}

} // namespace JumpDash::Game
