#pragma once

#include <glm/glm.hpp>

namespace JumpDash::Game {

// Axis-aligned bounding box in screen space (origin top-left, y grows down)
struct AABB {
    glm::vec2 min;
    glm::vec2 max;

    AABB() : min(0.0f), max(0.0f) {}
    AABB(const glm::vec2& min, const glm::vec2& max) : min(min), max(max) {}

    float Left() const { return min.x; }
    float Right() const { return max.x; }
    float Top() const { return min.y; }
    float Bottom() const { return max.y; }
};

class Physics {
public:
    Physics() = default;

    // Strict overlap test; boxes that only touch do not collide
    static bool CheckCollision(const AABB& a, const AABB& b);

    // Apply one tick of constant acceleration to a vertical velocity
    static void ApplyGravity(float& velocityY, float gravity);
};

} // namespace JumpDash::Game
