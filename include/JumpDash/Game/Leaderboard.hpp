#pragma once

#include <cstddef>
#include <vector>

namespace JumpDash::Game {

// Best scores, descending, at most Capacity() entries
class Leaderboard {
public:
    static constexpr size_t DEFAULT_CAPACITY = 5;

    explicit Leaderboard(size_t capacity = DEFAULT_CAPACITY);

    void Insert(int score);

    // Replace the contents; input order does not matter
    void Assign(std::vector<int> scores);

    void Clear() { m_entries.clear(); }

    const std::vector<int>& Entries() const { return m_entries; }
    size_t Capacity() const { return m_capacity; }

private:
    void Normalize();

    size_t m_capacity;
    std::vector<int> m_entries;
};

} // namespace JumpDash::Game
