#pragma once

#include "rendering/IRenderer.hpp"

namespace neta {

/// 2D camera mapping world space onto the window.
/// The camera position is the world point shown at the screen center.
class Camera {
public:
    Camera() = default;
    Camera(float screenWidth, float screenHeight);

    /// Set the camera position (world coordinates)
    void setPosition(Vec2 position) { m_position = position; }
    void setPosition(float x, float y) { setPosition({x, y}); }
    Vec2 getPosition() const { return m_position; }

    /// Move the camera by a world-space delta
    void move(Vec2 delta) { m_position += delta; }

    /// Set the zoom level (1.0 = one world unit per pixel, 2.0 = magnified).
    /// Clamped to the zoom limits.
    void setZoom(float zoom);
    float getZoom() const { return m_zoom; }

    /// Multiply the zoom by a factor (> 1 zooms in)
    void zoomBy(float factor);

    /// Zoom limits. min must be positive and not above max.
    void setZoomLimits(float minZoom, float maxZoom);
    float getMinZoom() const { return m_minZoom; }
    float getMaxZoom() const { return m_maxZoom; }

    /// Camera rotation in degrees, normalized to [0, 360)
    void setRotation(float degrees);
    float getRotation() const { return m_rotation; }

    void setScreenSize(float width, float height) { m_screenSize = {width, height}; }
    Vec2 getScreenSize() const { return m_screenSize; }

    /// Convert screen coordinates to world coordinates
    Vec2 screenToWorld(Vec2 screenPos) const;

    /// Convert world coordinates to screen coordinates
    Vec2 worldToScreen(Vec2 worldPos) const;

    /// Convert a screen-space displacement into a world-space displacement
    Vec2 screenDeltaToWorld(Vec2 screenDelta) const;

    /// Visible area in world coordinates (bounding box when rotated)
    Rect getVisibleArea() const;

    bool isVisible(const Rect& worldRect) const;

private:
    Vec2 m_position = {0.0f, 0.0f};
    Vec2 m_screenSize = {1280.0f, 720.0f};
    float m_zoom = 1.0f;
    float m_rotation = 0.0f;

    float m_minZoom = DEFAULT_MIN_ZOOM;
    float m_maxZoom = DEFAULT_MAX_ZOOM;

    static constexpr float DEFAULT_MIN_ZOOM = 0.05f;
    static constexpr float DEFAULT_MAX_ZOOM = 20.0f;
};

} // namespace neta
