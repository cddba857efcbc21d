#pragma once

#include "canvas/CameraTranslator.hpp"
#include "canvas/CanvasState.hpp"
#include "ecs/Components.hpp"
#include "picking/PointerEvents.hpp"
#include "rendering/Camera.hpp"

namespace neta {

/// Resize/rotate gizmo drawn over one frame in overlay space.
///
/// The handle is an Overlay entity following its frame, with four corner
/// grips and one rotation grip above the top edge.  At most one exists at a
/// time; CanvasState::currentHandle points to it.
class ControlHandles {
public:
    static constexpr float CORNER_RADIUS = 6.0f;
    /// Distance in pixels between the top edge and the rotation grip
    static constexpr float ROTATION_HANDLE_OFFSET = 30.0f;
    static constexpr float MIN_FRAME_SIZE = 1.0f;

    ControlHandles(Registry& registry, const Camera& camera, CanvasState& state)
        : m_registry(registry), m_camera(camera), m_state(state) {}

    /// Attach a handle to `frame`, replacing the current one
    Entity spawn(Entity frame);

    /// Remove the current handle, if any
    void despawn();

    Entity current() const { return m_state.currentHandle; }

    /// Frame the current handle controls (NullEntity without a handle)
    Entity controlledFrame() const;

    /// Move the handle and its grips onto the frame's on-screen position.
    /// Drops the handle when its frame is gone.
    void track();

    /// Draw outline, grips and the rotation stem (overlay pass)
    void draw(IRenderer& renderer) const;

    // --- Operations behind the grips ---

    /// Resize from a corner by a world-space delta, keeping the opposite
    /// corner fixed.  Size never drops below MIN_FRAME_SIZE.
    void resizeFromCorner(Entity frame, Pivot pivot, Vec2 worldDelta);

    /// Rotate so the pivot's direction points from the frame center at
    /// `cursorWorld`.
    void rotateToward(Entity frame, Pivot pivot, Vec2 cursorWorld);

    /// Resize cursor for a screen direction from the frame center, in
    /// 45 degree sectors
    static CursorShape resizeCursorFor(Vec2 direction);

private:
    Entity spawnGrip(Entity handle, Entity frame, Pivot pivot, HandlePivot::Kind kind);
    PointerHandlers cornerHandlers(Entity frame, Pivot pivot);
    PointerHandlers rotationHandlers(Entity frame, Pivot pivot);

    /// Offset of a grip from the handle origin, in handle space
    static Vec2 gripOffset(Vec2 screenSize, Pivot pivot, HandlePivot::Kind kind);

    Registry& m_registry;
    const Camera& m_camera;
    CanvasState& m_state;
};

} // namespace neta
