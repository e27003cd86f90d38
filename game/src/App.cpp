#include "App.hpp"
#include <JumpDash/Core/Logger.hpp>
#include <string>

namespace JumpDash::Frontend {

App::App(const Game::GameConfig& config)
    : m_config(config)
    , m_window(nullptr)
    , m_glfwReady(false)
    , m_saveFile(config.savePath, config.saveKey)
    , m_scores(m_saveFile) {
}

App::~App() {
    Shutdown();
}

bool App::Initialize() {
    glfwSetErrorCallback(ErrorCallback);

    if (!glfwInit()) {
        JUMPDASH_LOG_CRITICAL("Failed to initialize GLFW");
        return false;
    }
    m_glfwReady = true;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    m_window = glfwCreateWindow(static_cast<int>(m_config.playfieldWidth),
                                static_cast<int>(m_config.playfieldHeight),
                                "Jump Dash", nullptr, nullptr);
    if (!m_window) {
        JUMPDASH_LOG_CRITICAL("Failed to create GLFW window");
        return false;
    }

    glfwMakeContextCurrent(m_window);

    // Enable VSync: one simulation step per display refresh
    glfwSwapInterval(1);

    // Scores are best-effort; a bad or missing file starts from zero
    auto loaded = m_saveFile.Load();
    if (loaded.isFailure()) {
        if (loaded.error() == ErrorCode::FileNotFound) {
            JUMPDASH_LOG_INFO_F("No save file at %s yet", m_config.savePath.c_str());
        } else {
            JUMPDASH_LOG_WARNING_F("Ignoring save file %s: %s", m_config.savePath.c_str(),
                                   std::string(getErrorMessage(loaded.error())).c_str());
        }
    }

    m_session = std::make_unique<Game::GameSession>(m_config, m_clock, m_random, &m_scores);
    m_cues = std::make_unique<CueListener>(*m_session);

    if (!m_renderer.Initialize(m_window, m_session->GetLayout())) {
        JUMPDASH_LOG_CRITICAL("Failed to initialize renderer");
        return false;
    }

    m_input.Initialize(m_window);

    JUMPDASH_LOG_INFO("Jump Dash initialized");
    JUMPDASH_LOG_INFO("SPACE/UP jump, P pause, R restart, A audio, H haptics, ESC quit");
    return true;
}

void App::Shutdown() {
    if (m_session) {
        m_session->Shutdown();
    }
    m_cues.reset();
    m_session.reset();

    m_renderer.Shutdown();

    if (m_window) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }

    if (m_glfwReady) {
        glfwTerminate();
        m_glfwReady = false;
    }
}

void App::Run() {
    while (!ShouldQuit()) {
        glfwPollEvents();
        m_input.Update();

        HandleInput();

        // Tick reads the clock itself and caps the step
        m_session->Tick();

        Render();
    }
}

bool App::ShouldQuit() const {
    return glfwWindowShouldClose(m_window) || m_input.IsJustPressed(Key::Quit);
}

void App::HandleInput() {
    Game::GameSession& session = *m_session;

    if (m_input.IsJustPressed(Key::Jump)) {
        switch (session.GetState()) {
            case Game::GameState::Home:     session.Start(); break;
            case Game::GameState::Running:  session.Jump(); break;
            case Game::GameState::GameOver: session.Restart(); break;
            case Game::GameState::Paused:   break;
        }
    }

    if (m_input.IsJustPressed(Key::Pause)) {
        session.TogglePause();
    }

    if (m_input.IsJustPressed(Key::Restart)) {
        session.Restart();
    }

    if (m_input.IsJustPressed(Key::Audio)) {
        session.SetAudioEnabled(!session.GetSettings().audioEnabled);
        JUMPDASH_LOG_INFO_F("Audio %s", session.GetSettings().audioEnabled ? "on" : "off");
    }

    if (m_input.IsJustPressed(Key::Haptics)) {
        session.SetHapticsEnabled(!session.GetSettings().hapticsEnabled);
        JUMPDASH_LOG_INFO_F("Haptics %s", session.GetSettings().hapticsEnabled ? "on" : "off");
    }
}

void App::Render() {
    m_renderer.RenderFrame(*m_session);
    m_renderer.Present();
}

void App::ErrorCallback(int error, const char* description) {
    JUMPDASH_LOG_ERROR_F("GLFW error %d: %s", error, description);
}

} // namespace JumpDash::Frontend
