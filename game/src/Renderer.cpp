#include "Renderer.hpp"
#include <JumpDash/Core/Logger.hpp>
#include <algorithm>
#include <array>
#include <cstdint>

namespace JumpDash::Frontend {

namespace {

// Segments a..g, clockwise from the top, then the middle bar
constexpr std::array<uint8_t, 10> SEGMENTS = {
    0b0111111, 0b0000110, 0b1011011, 0b1001111, 0b1100110,
    0b1101101, 0b1111101, 0b0000111, 0b1111111, 0b1101111
};

} // namespace

Renderer::Renderer()
    : m_window(nullptr)
    , m_screenWidth(800.0f)
    , m_screenHeight(300.0f)
    , m_groundY(290.0f) {
}

Renderer::~Renderer() {
    Shutdown();
}

bool Renderer::Initialize(GLFWwindow* window, const Game::PlayfieldLayout& layout) {
    m_window = window;
    m_screenWidth = layout.GetWidth();
    m_screenHeight = layout.GetHeight();
    m_groundY = layout.GroundScreenY();

    int width, height;
    glfwGetFramebufferSize(window, &width, &height);
    if (width <= 0 || height <= 0) {
        JUMPDASH_LOG_ERROR_F("Unusable framebuffer size %dx%d", width, height);
        return false;
    }
    glViewport(0, 0, width, height);

    // Logical playfield coordinates, origin top-left
    glMatrixMode(GL_PROJECTION);
    glLoadIdentity();
    glOrtho(0.0, m_screenWidth, m_screenHeight, 0.0, -1.0, 1.0);
    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    return true;
}

void Renderer::Shutdown() {
    // Nothing to clean up for now
}

void Renderer::Clear() {
    // Sky
    glClearColor(0.53f, 0.81f, 0.92f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);
}

void Renderer::Present() {
    glfwSwapBuffers(m_window);
}

void Renderer::RenderFrame(const Game::GameSession& session) {
    Clear();
    RenderGround();
    RenderObstacles(session);
    RenderParticles(session);
    RenderCharacter(session);
    RenderScoreBar(session);
    RenderOverlay(session);
}

void Renderer::RenderGround() {
    RenderRect(0.0f, m_groundY, m_screenWidth, m_screenHeight - m_groundY, 0.45f, 0.33f, 0.2f);
    RenderRect(0.0f, m_groundY, m_screenWidth, 2.0f, 0.2f, 0.6f, 0.2f);
}

void Renderer::RenderCharacter(const Game::GameSession& session) {
    const auto& character = session.GetCharacter();
    if (session.GetState() == Game::GameState::GameOver) {
        // Red when hit
        RenderBox(character.GetBoundingBox(), 1.0f, 0.0f, 0.0f);
    } else {
        RenderBox(character.GetBoundingBox(), 1.0f, 0.8f, 0.0f);
    }
}

void Renderer::RenderObstacles(const Game::GameSession& session) {
    const auto& obstacles = session.GetObstacles();
    const auto& layout = session.GetLayout();
    for (auto id : obstacles.GetActive()) {
        RenderBox(layout.ObstacleBounds(obstacles.Get(id).position), 0.0f, 0.6f, 0.2f);
    }
}

void Renderer::RenderParticles(const Game::GameSession& session) {
    const auto& particles = session.GetParticles();
    for (auto id : particles.GetActive()) {
        const auto& particle = particles.Get(id);
        RenderRect(particle.position.x - 2.0f, particle.position.y - 2.0f, 4.0f, 4.0f,
                   0.6f, 0.5f, 0.4f, particles.Alpha(id));
    }
}

void Renderer::RenderScoreBar(const Game::GameSession& session) {
    RenderRect(0.0f, 0.0f, m_screenWidth, 28.0f, 0.0f, 0.0f, 0.0f, 0.25f);

    // Level on the left, high score and score on the right
    RenderNumber(session.GetLevel(), 40.0f, 6.0f, 16.0f, 0.9f, 0.9f, 0.2f);
    RenderNumber(session.GetHighScore(), m_screenWidth - 120.0f, 6.0f, 16.0f, 0.7f, 0.7f, 0.7f);
    RenderNumber(session.GetDisplayScore(), m_screenWidth - 10.0f, 6.0f, 16.0f, 1.0f, 1.0f, 1.0f);
}

void Renderer::RenderOverlay(const Game::GameSession& session) {
    float centerX = m_screenWidth * 0.5f;
    float centerY = m_screenHeight * 0.5f;

    switch (session.GetState()) {
        case Game::GameState::Running:
            break;

        case Game::GameState::Home:
            RenderRect(0.0f, 0.0f, m_screenWidth, m_screenHeight, 0.0f, 0.0f, 0.0f, 0.4f);
            // Play triangle
            glBegin(GL_TRIANGLES);
            glColor3f(1.0f, 1.0f, 1.0f);
            glVertex2f(centerX - 20.0f, centerY - 25.0f);
            glVertex2f(centerX + 25.0f, centerY);
            glVertex2f(centerX - 20.0f, centerY + 25.0f);
            glEnd();
            break;

        case Game::GameState::Paused:
            RenderRect(0.0f, 0.0f, m_screenWidth, m_screenHeight, 0.0f, 0.0f, 0.0f, 0.4f);
            RenderRect(centerX - 20.0f, centerY - 25.0f, 14.0f, 50.0f, 1.0f, 1.0f, 1.0f);
            RenderRect(centerX + 6.0f, centerY - 25.0f, 14.0f, 50.0f, 1.0f, 1.0f, 1.0f);
            break;

        case Game::GameState::GameOver: {
            RenderRect(0.0f, 0.0f, m_screenWidth, m_screenHeight, 0.0f, 0.0f, 0.0f, 0.5f);

            // Final score, then the leaderboard below it
            RenderNumber(session.GetDisplayScore(), centerX + 60.0f, 50.0f, 40.0f, 1.0f, 0.2f, 0.2f);
            float rowY = 110.0f;
            for (int entry : session.GetLeaderboard().Entries()) {
                RenderNumber(entry, centerX + 60.0f, rowY, 18.0f, 1.0f, 1.0f, 1.0f);
                rowY += 26.0f;
            }
            break;
        }
    }
}

void Renderer::RenderRect(float x, float y, float width, float height,
                          float r, float g, float b, float a) {
    glBegin(GL_QUADS);
    glColor4f(r, g, b, a);
    glVertex2f(x, y);
    glVertex2f(x + width, y);
    glVertex2f(x + width, y + height);
    glVertex2f(x, y + height);
    glEnd();
}

void Renderer::RenderBox(const Game::AABB& box, float r, float g, float b, float a) {
    RenderRect(box.Left(), box.Top(), box.Right() - box.Left(), box.Bottom() - box.Top(), r, g, b, a);
}

void Renderer::RenderNumber(int value, float rightX, float y, float height,
                            float r, float g, float b) {
    value = std::max(value, 0);
    float advance = height * 0.7f;
    float x = rightX - height * 0.5f;
    do {
        RenderDigit(value % 10, x, y, height, r, g, b);
        value /= 10;
        x -= advance;
    } while (value > 0);
}

void Renderer::RenderDigit(int digit, float x, float y, float height,
                           float r, float g, float b) {
    float w = height * 0.5f;
    float half = height * 0.5f;
    float t = std::max(1.0f, height * 0.12f);
    uint8_t mask = SEGMENTS[static_cast<size_t>(digit)];

    if (mask & 0b0000001) RenderRect(x, y, w, t, r, g, b);                        // a
    if (mask & 0b0000010) RenderRect(x + w - t, y, t, half, r, g, b);             // b
    if (mask & 0b0000100) RenderRect(x + w - t, y + half, t, half, r, g, b);      // c
    if (mask & 0b0001000) RenderRect(x, y + height - t, w, t, r, g, b);           // d
    if (mask & 0b0010000) RenderRect(x, y + half, t, half, r, g, b);              // e
    if (mask & 0b0100000) RenderRect(x, y, t, half, r, g, b);                     // f
    if (mask & 0b1000000) RenderRect(x, y + half - t * 0.5f, w, t, r, g, b);      // g
}

} // namespace JumpDash::Frontend
