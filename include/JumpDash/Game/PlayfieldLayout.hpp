#pragma once

#include "Physics.hpp"
#include "GameConfig.hpp"

namespace JumpDash::Game {

// Maps logical positions to screen rectangles. The playfield origin is its
// top-left corner; the ground line sits groundLevel pixels above the bottom.
class PlayfieldLayout {
public:
    explicit PlayfieldLayout(const GameConfig& config);

    // Character box for a height above the playfield bottom
    AABB CharacterBounds(float yPos) const;

    // Obstacle box for a horizontal scroll position; obstacles rest on the ground
    AABB ObstacleBounds(float position) const;

    // Right edge, where new obstacles enter
    float SpawnX() const { return m_width; }

    // Screen y of the ground line
    float GroundScreenY() const { return m_height - m_groundLevel; }

    float GetWidth() const { return m_width; }
    float GetHeight() const { return m_height; }

private:
    float m_width;
    float m_height;
    float m_groundLevel;
    float m_characterX;
    float m_characterWidth;
    float m_characterHeight;
    float m_obstacleWidth;
    float m_obstacleHeight;
};

} // namespace JumpDash::Game
