#pragma once

#include "ecs/Registry.hpp"
#include "engine/Window.hpp"
#include "rendering/IRenderer.hpp"

#include <cstdint>
#include <optional>

namespace neta {

/// Rubber-band selection in progress (screen coordinates)
struct SelectionDrag {
    std::optional<Vec2> start;
    std::optional<Vec2> end;

    bool isDragging() const { return start.has_value() || end.has_value(); }
    void clear() { start.reset(); end.reset(); }
};

/// Tunables read from the `canvas.*` config section
struct CanvasSettings {
    float zoomStep = 1.1f;
    float minZoom = 0.05f;
    float maxZoom = 20.0f;
    Color background = Color(30, 30, 36, 255);
};

/// Board-wide state shared by the canvas modules
struct CanvasState {
    Entity canvas = NullEntity;

    /// The one control handle, if any
    Entity currentHandle = NullEntity;

    SelectionDrag selectionDrag;

    /// Frames given a sprite so far; drives the depth of the next one
    uint32_t framesSetUp = 0;

    /// Cursor the canvas asks for; applied to the window once per frame
    CursorShape cursor = CursorShape::Default;

    CanvasSettings settings;
};

} // namespace neta
