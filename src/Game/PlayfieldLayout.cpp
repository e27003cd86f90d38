#include <JumpDash/Game/PlayfieldLayout.hpp>

namespace JumpDash::Game {

PlayfieldLayout::PlayfieldLayout(const GameConfig& config)
    : m_width(config.playfieldWidth)
    , m_height(config.playfieldHeight)
    , m_groundLevel(config.groundLevel)
    , m_characterX(config.characterX)
    , m_characterWidth(config.characterWidth)
    , m_characterHeight(config.characterHeight)
    , m_obstacleWidth(config.obstacleWidth)
    , m_obstacleHeight(config.obstacleHeight) {
}

AABB PlayfieldLayout::CharacterBounds(float yPos) const {
    float bottom = m_height - yPos;
    return AABB(
        glm::vec2(m_characterX, bottom - m_characterHeight),
        glm::vec2(m_characterX + m_characterWidth, bottom)
    );
}

AABB PlayfieldLayout::ObstacleBounds(float position) const {
    float bottom = GroundScreenY();
    return AABB(
        glm::vec2(position, bottom - m_obstacleHeight),
        glm::vec2(position + m_obstacleWidth, bottom)
    );
}

} // namespace JumpDash::Game
