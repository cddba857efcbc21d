#include "engine/Input.hpp"

#include <raylib.h>

namespace neta {

void Input::update() {
    ::Vector2 mouse = GetMousePosition();
    Vec2 position{mouse.x, mouse.y};

    // The first sample has no previous position to diff against
    m_pointer.delta = m_hasSample ? position - m_pointer.position : Vec2{};
    m_pointer.position = position;
    m_hasSample = true;

    m_pointer.wheel = GetMouseWheelMove();
    for (size_t i = 0; i < MOUSE_BUTTON_COUNT; ++i) {
        int button = static_cast<int>(i);
        m_pointer.down[i] = IsMouseButtonDown(button);
        m_pointer.pressed[i] = IsMouseButtonPressed(button);
        m_pointer.released[i] = IsMouseButtonReleased(button);
    }
    m_pointer.ctrl = isCtrlDown();
}

bool Input::isKeyPressed(Key key) const {
    return IsKeyPressed(static_cast<int>(key));
}

bool Input::isKeyDown(Key key) const {
    return IsKeyDown(static_cast<int>(key));
}

bool Input::isKeyReleased(Key key) const {
    return IsKeyReleased(static_cast<int>(key));
}

bool Input::isCtrlDown() const {
#ifdef __APPLE__
    if (isKeyDown(Key::LeftSuper) || isKeyDown(Key::RightSuper)) return true;
#endif
    return isKeyDown(Key::LeftControl) || isKeyDown(Key::RightControl);
}

} // namespace neta
