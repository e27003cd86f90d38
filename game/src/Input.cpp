#include "Input.hpp"

namespace JumpDash::Frontend {

void Input::Initialize(GLFWwindow* window) {
    m_window = window;
    m_pressed.fill(false);
    m_justPressed.fill(false);
}

bool Input::IsDown(Key key) const {
    auto down = [this](int glfwKey) {
        return glfwGetKey(m_window, glfwKey) == GLFW_PRESS;
    };

    switch (key) {
        case Key::Jump:    return down(GLFW_KEY_SPACE) || down(GLFW_KEY_UP);
        case Key::Pause:   return down(GLFW_KEY_P);
        case Key::Restart: return down(GLFW_KEY_R);
        case Key::Audio:   return down(GLFW_KEY_A);
        case Key::Haptics: return down(GLFW_KEY_H);
        case Key::Quit:    return down(GLFW_KEY_ESCAPE);
        case Key::Count:   break;
    }
    return false;
}

void Input::Update() {
    for (size_t i = 0; i < KEY_COUNT; ++i) {
        bool currentlyPressed = IsDown(static_cast<Key>(i));
        m_justPressed[i] = currentlyPressed && !m_pressed[i];
        m_pressed[i] = currentlyPressed;
    }
}

} // namespace JumpDash::Frontend
