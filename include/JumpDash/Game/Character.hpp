#pragma once

#include "Events.hpp"
#include "GameConfig.hpp"
#include "PlayfieldLayout.hpp"
#include <functional>
#include <utility>

namespace JumpDash::Game {

class Character {
public:
    // Receives the top-left corner of the grounded character box
    using LandingCallback = std::function<void(float x, float y)>;

    Character(const GameConfig& config, const PlayfieldLayout& layout, EventBus* events = nullptr);

    // Grounded rest: baseline, no velocity, full grace window
    void Reset();

    // One simulation tick; not scaled by frame time
    void Update();

    // Ignored while airborne once the grace window has run out
    void Jump();

    void SetLandingCallback(LandingCallback callback) { m_onLand = std::move(callback); }

    float GetY() const { return m_yPos; }
    float GetVelocityY() const { return m_velocityY; }
    bool IsJumping() const { return m_isJumping; }
    bool IsGrounded() const { return m_yPos <= m_groundLevel; }
    int GetCoyoteCounter() const { return m_coyoteCounter; }
    float GetGroundLevel() const { return m_groundLevel; }

    AABB GetBoundingBox() const;

private:
    const PlayfieldLayout& m_layout;
    EventBus* m_events;
    LandingCallback m_onLand;

    float m_groundLevel;
    float m_jumpPower;
    float m_gravity;
    int m_coyoteThreshold;

    float m_yPos;
    float m_velocityY;
    bool m_isJumping;
    int m_coyoteCounter;
};

} // namespace JumpDash::Game
