#pragma once

#include "ecs/Components.hpp"
#include "rendering/Camera.hpp"

namespace neta {

/// Maps between the main camera (world) and the control overlay (screen).
/// The overlay is an identity view of the window, drawn above the world.
class CameraTranslator {
public:
    explicit CameraTranslator(const Camera& mainCamera) : m_camera(mainCamera) {}

    /// World transform to overlay space: screen position, rotation as seen
    /// through the camera, scale multiplied by the zoom.
    Transform toControl(const Transform& world) const;

    /// Overlay transform back into world space
    Transform toMain(const Transform& control) const;

    /// Overlay rectangle to the world-space rectangle spanning its corners
    Rect mapRectToMain(const Rect& rect) const;

    /// Screen-space pointer delta to a world-space delta
    Vec2 viewportDeltaToWorld(Vec2 screenDelta) const {
        return m_camera.screenDeltaToWorld(screenDelta);
    }

    Vec2 toWorld(Vec2 screenPos) const { return m_camera.screenToWorld(screenPos); }

private:
    const Camera& m_camera;
};

} // namespace neta
