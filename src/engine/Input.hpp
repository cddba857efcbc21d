#pragma once

#include "rendering/IRenderer.hpp"

#include <array>
#include <cstddef>

namespace neta {

/// Engine-defined key codes, independent of the backend.
/// Maps 1:1 with Raylib key codes for the current backend.
enum class Key : int {
    A = 65, S = 83, Z = 90,

    F3 = 292, F11 = 300, F12 = 301,

    LeftShift = 340, RightShift = 344,
    LeftControl = 341, RightControl = 345,
    LeftSuper = 343, RightSuper = 347,

    Enter = 257,
    Escape = 256,
    Tab = 258,
    Delete = 261,
    Backspace = 259,
};

/// Engine-defined mouse button codes
enum class MouseButton : int {
    Left = 0,
    Right = 1,
    Middle = 2,
};

constexpr size_t MOUSE_BUTTON_COUNT = 3;

/// Snapshot of the pointer for one frame.  Picking, the pointer event router
/// and the UI consume this instead of querying the backend, so they can be
/// driven directly in tests.
struct PointerState {
    Vec2 position;
    Vec2 delta;
    float wheel = 0.0f;
    std::array<bool, MOUSE_BUTTON_COUNT> down{};
    std::array<bool, MOUSE_BUTTON_COUNT> pressed{};
    std::array<bool, MOUSE_BUTTON_COUNT> released{};
    bool ctrl = false;

    bool isDown(MouseButton b) const { return down[static_cast<size_t>(b)]; }
    bool isPressed(MouseButton b) const { return pressed[static_cast<size_t>(b)]; }
    bool isReleased(MouseButton b) const { return released[static_cast<size_t>(b)]; }
};

/// Thin abstraction over Raylib input.
class Input {
public:
    /// Sample the backend.  Call once per frame after events were polled.
    void update();

    bool isKeyPressed(Key key) const;
    bool isKeyDown(Key key) const;
    bool isKeyReleased(Key key) const;

    /// Either control key (or command on macOS) held
    bool isCtrlDown() const;

    float getMouseX() const { return m_pointer.position.x; }
    float getMouseY() const { return m_pointer.position.y; }
    Vec2  getMousePosition() const { return m_pointer.position; }
    bool  isMouseButtonPressed(MouseButton button) const { return m_pointer.isPressed(button); }
    bool  isMouseButtonDown(MouseButton button) const { return m_pointer.isDown(button); }
    bool  isMouseButtonReleased(MouseButton button) const { return m_pointer.isReleased(button); }
    float getMouseWheelDelta() const { return m_pointer.wheel; }

    const PointerState& getPointer() const { return m_pointer; }

private:
    PointerState m_pointer;
    bool m_hasSample = false;
};

} // namespace neta
