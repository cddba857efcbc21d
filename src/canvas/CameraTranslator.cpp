#include "canvas/CameraTranslator.hpp"

namespace neta {

Transform CameraTranslator::toControl(const Transform& world) const {
    float zoom = m_camera.getZoom();
    return Transform{
        m_camera.worldToScreen(world.position),
        world.rotation + m_camera.getRotation(),
        world.scale * zoom
    };
}

Transform CameraTranslator::toMain(const Transform& control) const {
    float zoom = m_camera.getZoom();
    return Transform{
        m_camera.screenToWorld(control.position),
        control.rotation - m_camera.getRotation(),
        control.scale / zoom
    };
}

Rect CameraTranslator::mapRectToMain(const Rect& rect) const {
    Vec2 a = m_camera.screenToWorld({rect.x, rect.y});
    Vec2 b = m_camera.screenToWorld({rect.x + rect.width, rect.y + rect.height});
    return Rect::fromCorners(a, b);
}

} // namespace neta
