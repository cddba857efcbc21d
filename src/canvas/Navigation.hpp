#pragma once

#include "canvas/CanvasState.hpp"
#include "picking/PointerEvents.hpp"
#include "rendering/Camera.hpp"

namespace neta {

/// Zooming and panning the main camera.  Its handlers sit on the canvas and
/// also see events bubbling up from frames.
class Navigation {
public:
    Navigation(Camera& camera, const CanvasState& state) : m_camera(camera), m_state(state) {}

    void addCanvasHandlers(PointerHandlers& handlers);

    /// One wheel notch: positive zooms in by the configured step, anything
    /// else zooms out by it
    void zoomWithWheel(float wheel);

    /// Move the view so the world follows a screen-space pointer delta
    void panByScreenDelta(Vec2 screenDelta);

private:
    Camera& m_camera;
    const CanvasState& m_state;
};

} // namespace neta
