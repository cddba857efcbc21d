#include "canvas/Navigation.hpp"

namespace neta {

void Navigation::addCanvasHandlers(PointerHandlers& handlers) {
    handlers.on(PointerEventType::Scroll, [this](PointerEvent& event) {
        zoomWithWheel(event.scroll);
    });
    handlers.on(PointerEventType::Drag, [this](PointerEvent& event) {
        if (event.button != MouseButton::Middle) return;
        if (event.isDown(MouseButton::Left) || event.isDown(MouseButton::Right)) return;
        panByScreenDelta(event.delta);
    });
}

void Navigation::zoomWithWheel(float wheel) {
    float step = m_state.settings.zoomStep;
    if (step <= 0.0f) return;
    m_camera.zoomBy(wheel > 0.0f ? step : 1.0f / step);
}

void Navigation::panByScreenDelta(Vec2 screenDelta) {
    m_camera.move(-m_camera.screenDeltaToWorld(screenDelta));
}

} // namespace neta
