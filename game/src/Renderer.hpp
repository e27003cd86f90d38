#pragma once

#include <GLFW/glfw3.h>
#include <JumpDash/Game/GameSession.hpp>

namespace JumpDash::Frontend {

class Renderer {
public:
    Renderer();
    ~Renderer();

    // Set up an orthographic projection matching the playfield
    bool Initialize(GLFWwindow* window, const Game::PlayfieldLayout& layout);

    void Shutdown();

    // Draw one full frame of the session
    void RenderFrame(const Game::GameSession& session);

    void Present();

private:
    void Clear();
    void RenderGround();
    void RenderCharacter(const Game::GameSession& session);
    void RenderObstacles(const Game::GameSession& session);
    void RenderParticles(const Game::GameSession& session);
    void RenderScoreBar(const Game::GameSession& session);
    void RenderOverlay(const Game::GameSession& session);

    // Filled rectangle from its top-left corner
    void RenderRect(float x, float y, float width, float height,
                    float r, float g, float b, float a = 1.0f);
    void RenderBox(const Game::AABB& box, float r, float g, float b, float a = 1.0f);

    // Seven-segment number, right-aligned at x
    void RenderNumber(int value, float rightX, float y, float height,
                      float r, float g, float b);
    void RenderDigit(int digit, float x, float y, float height,
                     float r, float g, float b);

    GLFWwindow* m_window;
    float m_screenWidth;
    float m_screenHeight;
    float m_groundY;
};

} // namespace JumpDash::Frontend
