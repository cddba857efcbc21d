#pragma once

#include "canvas/CanvasState.hpp"
#include "canvas/ControlHandle.hpp"
#include "ecs/Components.hpp"
#include "picking/PointerEvents.hpp"
#include "rendering/Camera.hpp"

#include <vector>

namespace neta {

/// Hover and selection state of image frames, rubber-band selection and
/// dragging frames around.
class Selection {
public:
    /// Corner radius of hover/selection borders, in pixels
    static constexpr float BORDER_RADIUS = 5.0f;

    Selection(Registry& registry, const Camera& camera, CanvasState& state,
              ControlHandles& handles)
        : m_registry(registry), m_camera(camera), m_state(state), m_handles(handles) {}

    /// Handlers for a freshly set up frame: hover, click-to-select, drag-to-move
    PointerHandlers frameHandlers(Entity frame);

    /// Add the background handlers (deselect, rubber band) to the canvas
    void addCanvasHandlers(PointerHandlers& handlers);

    // --- Selection operations ---

    /// Select only `frame` and attach the control handle to it
    void selectOnly(Entity frame);

    /// Flip the Selected marker of `frame`
    void toggle(Entity frame);

    void deselectAll();

    /// Select every frame whose axis-aligned world rectangle intersects
    /// `worldRect`.  Returns the number of frames selected.
    size_t selectIntersecting(const Rect& worldRect, bool additive);

    std::vector<Entity> selectedFrames() const;

    /// Frames a context action applies to: every hovered or selected frame
    std::vector<Entity> actionTargets() const;

    /// Destroy frames, dropping the control handle if it followed one of them
    void removeFrames(const std::vector<Entity>& frames);

    /// Move a frame by a world-space delta
    void moveFrame(Entity frame, Vec2 worldDelta);

    /// Borders (only while no control handle exists) and the rubber band,
    /// in overlay space
    void draw(IRenderer& renderer) const;

private:
    void finishBand(bool additive);

    Registry& m_registry;
    const Camera& m_camera;
    CanvasState& m_state;
    ControlHandles& m_handles;
};

} // namespace neta
