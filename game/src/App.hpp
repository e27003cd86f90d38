#pragma once

#include <GLFW/glfw3.h>
#include "CueListener.hpp"
#include "Input.hpp"
#include "Renderer.hpp"
#include <JumpDash/Game/GameSession.hpp>
#include <memory>

namespace JumpDash::Frontend {

// Frame clock backed by glfwGetTime
class GlfwTimeSource : public Game::TimeSource {
public:
    double Now() const override { return glfwGetTime(); }
};

class App {
public:
    explicit App(const Game::GameConfig& config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Open the window and restore saved scores
    bool Initialize();

    // Persist scores and close the window
    void Shutdown();

    // Main loop; returns when the window closes or Escape is pressed
    void Run();

    bool ShouldQuit() const;

private:
    void HandleInput();
    void Render();

    static void ErrorCallback(int error, const char* description);

    Game::GameConfig m_config;

    // Systems
    GLFWwindow* m_window;
    bool m_glfwReady;
    Renderer m_renderer;
    Input m_input;
    GlfwTimeSource m_clock;
    Game::MersenneRandom m_random;

    // Scores and session
    Game::FileKeyValueStore m_saveFile;
    Game::ScoreStore m_scores;
    std::unique_ptr<Game::GameSession> m_session;
    std::unique_ptr<CueListener> m_cues;
};

} // namespace JumpDash::Frontend
