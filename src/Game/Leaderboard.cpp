#include <JumpDash/Game/Leaderboard.hpp>
#include <algorithm>
#include <functional>
#include <utility>

namespace JumpDash::Game {

Leaderboard::Leaderboard(size_t capacity)
    : m_capacity(capacity) {
}

void Leaderboard::Insert(int score) {
    m_entries.push_back(score);
    Normalize();
}

void Leaderboard::Assign(std::vector<int> scores) {
    m_entries = std::move(scores);
    Normalize();
}

void Leaderboard::Normalize() {
    std::stable_sort(m_entries.begin(), m_entries.end(), std::greater<int>());
    if (m_entries.size() > m_capacity) {
        m_entries.resize(m_capacity);
    }
}

} // namespace JumpDash::Game
