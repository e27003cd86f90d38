#pragma once

#include <GLFW/glfw3.h>
#include <array>

namespace JumpDash::Frontend {

enum class Key {
    Jump,       // Space or Up
    Pause,      // P
    Restart,    // R
    Audio,      // A
    Haptics,    // H
    Quit,       // Escape
    Count
};

class Input {
public:
    Input() = default;

    // Initialize input system with GLFW window
    void Initialize(GLFWwindow* window);

    // Update key states (call once per frame, after polling events)
    void Update();

    // True only on the frame the key went down
    bool IsJustPressed(Key key) const { return m_justPressed[Index(key)]; }

private:
    static constexpr size_t KEY_COUNT = static_cast<size_t>(Key::Count);
    static size_t Index(Key key) { return static_cast<size_t>(key); }

    bool IsDown(Key key) const;

    GLFWwindow* m_window = nullptr;
    std::array<bool, KEY_COUNT> m_pressed{};
    std::array<bool, KEY_COUNT> m_justPressed{};
};

} // namespace JumpDash::Frontend
