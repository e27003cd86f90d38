#include <JumpDash/Game/Character.hpp>
#include <JumpDash/Core/Logger.hpp>

namespace JumpDash::Game {

Character::Character(const GameConfig& config, const PlayfieldLayout& layout, EventBus* events)
    : m_layout(layout)
    , m_events(events)
    , m_groundLevel(config.groundLevel)
    , m_jumpPower(config.jumpPower)
    , m_gravity(config.gravity)
    , m_coyoteThreshold(config.coyoteFrames)
    , m_yPos(config.groundLevel)
    , m_velocityY(0.0f)
    , m_isJumping(false)
    , m_coyoteCounter(config.coyoteFrames) {
}

void Character::Reset() {
    m_yPos = m_groundLevel;
    m_velocityY = 0.0f;
    m_isJumping = false;
    m_coyoteCounter = m_coyoteThreshold;
}

void Character::Update() {
    // Grace window refills on the ground and drains in the air
    if (m_yPos == m_groundLevel) {
        m_coyoteCounter = m_coyoteThreshold;
    } else if (m_coyoteCounter > 0) {
        m_coyoteCounter--;
    }

    Physics::ApplyGravity(m_velocityY, m_gravity);
    m_yPos += m_velocityY;

    if (m_yPos < m_groundLevel) {
        bool wasJumping = m_isJumping;
        m_yPos = m_groundLevel;
        m_velocityY = 0.0f;
        m_isJumping = false;

        if (wasJumping) {
            JUMPDASH_LOG_TRACE("Character landed");
            if (m_events) {
                m_events->Publish(GameEvent::Landed);
            }
            if (m_onLand) {
                AABB box = GetBoundingBox();
                m_onLand(box.Left(), box.Top());
            }
        }
    }
}

void Character::Jump() {
    if (m_isJumping && m_coyoteCounter <= 0) return;

    m_isJumping = true;
    m_velocityY = m_jumpPower;
    m_coyoteCounter = 0;

    if (m_events) {
        m_events->Publish(GameEvent::Jumped);
    }
}

AABB Character::GetBoundingBox() const {
    return m_layout.CharacterBounds(m_yPos);
}

} // namespace JumpDash::Game
