#include "rendering/Camera.hpp"
#include <cmath>
#include <algorithm>

namespace neta {

Camera::Camera(float screenWidth, float screenHeight)
    : m_screenSize(screenWidth, screenHeight) {}

void Camera::setZoom(float zoom) {
    m_zoom = std::clamp(zoom, m_minZoom, m_maxZoom);
}

void Camera::zoomBy(float factor) {
    if (factor <= 0.0f) return;
    setZoom(m_zoom * factor);
}

void Camera::setZoomLimits(float minZoom, float maxZoom) {
    if (minZoom <= 0.0f || maxZoom < minZoom) return;
    m_minZoom = minZoom;
    m_maxZoom = maxZoom;
    setZoom(m_zoom);
}

void Camera::setRotation(float degrees) {
    m_rotation = std::fmod(degrees, 360.0f);
    if (m_rotation < 0.0f) m_rotation += 360.0f;
}

Vec2 Camera::screenDeltaToWorld(Vec2 screenDelta) const {
    Vec2 delta = screenDelta / m_zoom;
    if (m_rotation != 0.0f) {
        delta = delta.rotated(-m_rotation * DEG_TO_RAD);
    }
    return delta;
}

Vec2 Camera::screenToWorld(Vec2 screenPos) const {
    // Screen center is at camera position
    Vec2 center = m_screenSize * 0.5f;
    return m_position + screenDeltaToWorld(screenPos - center);
}

Vec2 Camera::worldToScreen(Vec2 worldPos) const {
    Vec2 offset = worldPos - m_position;
    if (m_rotation != 0.0f) {
        offset = offset.rotated(m_rotation * DEG_TO_RAD);
    }

    Vec2 center = m_screenSize * 0.5f;
    return center + (offset * m_zoom);
}

Rect Camera::getVisibleArea() const {
    float visibleWidth = m_screenSize.x / m_zoom;
    float visibleHeight = m_screenSize.y / m_zoom;

    // When rotated, we need a larger bounding box
    if (m_rotation != 0.0f) {
        float radians = m_rotation * DEG_TO_RAD;
        float cosR = std::abs(std::cos(radians));
        float sinR = std::abs(std::sin(radians));
        float newWidth = visibleWidth * cosR + visibleHeight * sinR;
        float newHeight = visibleWidth * sinR + visibleHeight * cosR;
        visibleWidth = newWidth;
        visibleHeight = newHeight;
    }

    return Rect::fromCenterSize(m_position, {visibleWidth, visibleHeight});
}

bool Camera::isVisible(const Rect& worldRect) const {
    return getVisibleArea().intersects(worldRect);
}

} // namespace neta
