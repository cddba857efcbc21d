#include "canvas/ControlHandle.hpp"
#include "engine/Log.hpp"
#include "rendering/Shapes.hpp"

#include <algorithm>
#include <cmath>

namespace neta {

namespace {

constexpr Pivot CORNER_PIVOTS[] = {
    Pivot::TopLeft, Pivot::TopRight, Pivot::BottomLeft, Pivot::BottomRight,
};

constexpr Pivot ROTATION_PIVOT = Pivot::TopCenter;

Vec2 absScale(const Transform& t) {
    return {std::abs(t.scale.x), std::abs(t.scale.y)};
}

} // namespace

Entity ControlHandles::spawn(Entity frame) {
    despawn();

    if (!m_registry.hasAll<Transform, Sprite>(frame)) {
        LOG_WARN("ControlHandles: {} has no sprite to control", entityLabel(frame));
        return NullEntity;
    }

    Entity handle = m_registry.create();
    m_registry.add<Name>(handle, "ControlHandle");
    m_registry.add<ControlHandle>(handle, ControlHandle{frame});
    m_registry.add<Transform>(handle);
    m_registry.add<Overlay>(handle);

    for (Pivot pivot : CORNER_PIVOTS) {
        spawnGrip(handle, frame, pivot, HandlePivot::Kind::Corner);
    }
    spawnGrip(handle, frame, ROTATION_PIVOT, HandlePivot::Kind::Rotation);

    m_state.currentHandle = handle;
    track();

    LOG_DEBUG("ControlHandles: attached {} to frame {}", entityLabel(handle), entityLabel(frame));
    return handle;
}

Entity ControlHandles::spawnGrip(Entity handle, Entity frame, Pivot pivot, HandlePivot::Kind kind) {
    Entity grip = m_registry.create();
    bool rotation = kind == HandlePivot::Kind::Rotation;

    m_registry.add<Name>(grip, std::string(rotation ? "RotationGrip " : "CornerGrip ") + pivotName(pivot));
    m_registry.add<HandlePivot>(grip, HandlePivot{pivot, kind, handle});
    m_registry.add<Transform>(grip);
    m_registry.add<Overlay>(grip);
    m_registry.add<PickingCircle>(grip, PickingCircle{CORNER_RADIUS});
    m_registry.add<Parent>(grip, Parent{handle});
    m_registry.add<PointerHandlers>(grip, rotation ? rotationHandlers(frame, pivot)
                                                   : cornerHandlers(frame, pivot));
    return grip;
}

void ControlHandles::despawn() {
    Entity handle = m_state.currentHandle;
    m_state.currentHandle = NullEntity;
    if (!m_registry.valid(handle)) {
        return;
    }

    for (Entity grip : m_registry.collect<HandlePivot>()) {
        if (m_registry.get<HandlePivot>(grip).handle == handle) {
            m_registry.destroy(grip);
        }
    }
    m_registry.destroy(handle);
    m_state.cursor = CursorShape::Default;
}

Entity ControlHandles::controlledFrame() const {
    const auto* control = m_registry.tryGet<ControlHandle>(m_state.currentHandle);
    return control ? control->frame : NullEntity;
}

Vec2 ControlHandles::gripOffset(Vec2 screenSize, Pivot pivot, HandlePivot::Kind kind) {
    Vec2 offset = screenSize.scaled(pivotOffset(pivot));
    if (kind == HandlePivot::Kind::Rotation) {
        offset += pivotOffset(pivot).normalized() * ROTATION_HANDLE_OFFSET;
    }
    return offset;
}

void ControlHandles::track() {
    Entity handle = m_state.currentHandle;
    if (!m_registry.valid(handle)) {
        return;
    }

    Entity frame = controlledFrame();
    if (!m_registry.hasAll<Transform, Sprite>(frame)) {
        despawn();
        return;
    }

    CameraTranslator translator(m_camera);
    Transform control = translator.toControl(m_registry.get<Transform>(frame));
    Vec2 screenSize = m_registry.get<Sprite>(frame).size.scaled(absScale(control));

    // Grips keep their pixel size whatever the zoom
    auto& handleTransform = m_registry.get<Transform>(handle);
    handleTransform = Transform{control.position, control.rotation};

    for (auto grip : m_registry.view<HandlePivot, Transform>()) {
        const auto& pivot = m_registry.get<HandlePivot>(grip);
        if (pivot.handle != handle) continue;

        Vec2 offset = gripOffset(screenSize, pivot.pivot, pivot.kind);
        m_registry.get<Transform>(grip) =
            Transform{handleTransform.toParent(offset), handleTransform.rotation};
    }
}

void ControlHandles::draw(IRenderer& renderer) const {
    Entity handle = m_state.currentHandle;
    Entity frame = controlledFrame();
    if (!m_registry.valid(handle) || !m_registry.hasAll<Transform, Sprite>(frame)) {
        return;
    }

    CameraTranslator translator(m_camera);
    Transform control = translator.toControl(m_registry.get<Transform>(frame));
    Vec2 screenSize = m_registry.get<Sprite>(frame).size.scaled(absScale(control));
    const auto& handleTransform = m_registry.get<Transform>(handle);

    auto corners = rotatedRectCorners(handleTransform.position, screenSize, handleTransform.rotation);
    renderer.drawPolyline({corners.begin(), corners.end()}, true, Color::White(), 2.0f);

    for (auto grip : m_registry.view<HandlePivot, Transform>()) {
        const auto& pivot = m_registry.get<HandlePivot>(grip);
        if (pivot.handle != handle) continue;

        Vec2 position = m_registry.get<Transform>(grip).position;
        if (pivot.kind == HandlePivot::Kind::Rotation) {
            Vec2 edge = handleTransform.toParent(screenSize.scaled(pivotOffset(pivot.pivot)));
            renderer.drawLine(edge, position, Color::White(), 1.0f);
        }
        renderer.drawCircle(position, CORNER_RADIUS, Color::White());
        renderer.drawCircleOutline(position, CORNER_RADIUS, Color::LightGray(), 1.0f);
    }
}

void ControlHandles::resizeFromCorner(Entity frame, Pivot pivot, Vec2 worldDelta) {
    auto* transform = m_registry.tryGet<Transform>(frame);
    auto* sprite = m_registry.tryGet<Sprite>(frame);
    if (!transform || !sprite) {
        return;
    }
    if (transform->scale.x == 0.0f || transform->scale.y == 0.0f) {
        return;
    }

    float radians = transform->rotation * DEG_TO_RAD;
    Vec2 sign = pivotOffset(pivot) * 2.0f;

    Vec2 local = worldDelta.rotated(-radians);
    local = {local.x / transform->scale.x, local.y / transform->scale.y};

    Vec2 size = sprite->size;
    Vec2 newSize{
        std::max(size.x + local.x * sign.x, MIN_FRAME_SIZE),
        std::max(size.y + local.y * sign.y, MIN_FRAME_SIZE),
    };
    Vec2 growth = newSize - size;

    // Shift the center by half the growth so the opposite corner stays put
    Vec2 shift = growth.scaled(sign).scaled(transform->scale).rotated(radians) * 0.5f;
    transform->position += shift;
    sprite->size = newSize;
}

void ControlHandles::rotateToward(Entity frame, Pivot pivot, Vec2 cursorWorld) {
    auto* transform = m_registry.tryGet<Transform>(frame);
    if (!transform) {
        return;
    }

    Vec2 toCursor = cursorWorld - transform->position;
    Vec2 pivotDir = pivotOffset(pivot);
    if (toCursor.lengthSquared() == 0.0f || pivotDir.lengthSquared() == 0.0f) {
        return;
    }

    transform->rotation = Vec2::angleBetween(pivotDir.normalized(), toCursor.normalized()) * RAD_TO_DEG;
}

CursorShape ControlHandles::resizeCursorFor(Vec2 direction) {
    if (direction.lengthSquared() == 0.0f) {
        return CursorShape::Default;
    }

    // Fold opposite directions together: 0 and 180 share a cursor
    float degrees = std::atan2(direction.y, direction.x) * RAD_TO_DEG;
    degrees = std::fmod(degrees + 360.0f, 180.0f);

    if (degrees < 22.5f || degrees >= 157.5f) return CursorShape::ResizeEW;
    if (degrees < 67.5f) return CursorShape::ResizeNWSE;
    if (degrees < 112.5f) return CursorShape::ResizeNS;
    return CursorShape::ResizeNESW;
}

PointerHandlers ControlHandles::cornerHandlers(Entity frame, Pivot pivot) {
    auto updateCursor = [this, frame](const PointerEvent& event) {
        const auto* transform = m_registry.tryGet<Transform>(frame);
        if (!transform) return;
        Vec2 center = m_camera.worldToScreen(transform->position);
        m_state.cursor = resizeCursorFor(event.position - center);
    };

    PointerHandlers handlers;
    handlers.on(PointerEventType::Drag, [this, frame, pivot, updateCursor](PointerEvent& event) {
        event.stopPropagation();
        updateCursor(event);
        resizeFromCorner(frame, pivot, m_camera.screenDeltaToWorld(event.delta));
    });
    handlers.on(PointerEventType::Over, [updateCursor](PointerEvent& event) {
        event.stopPropagation();
        updateCursor(event);
    });
    handlers.on(PointerEventType::Out, [this](PointerEvent& event) {
        event.stopPropagation();
        m_state.cursor = CursorShape::Default;
    });
    handlers.on(PointerEventType::DragEnd, [this](PointerEvent& event) {
        event.stopPropagation();
        m_state.cursor = CursorShape::Default;
    });
    handlers.on(PointerEventType::Click, [](PointerEvent& event) {
        event.stopPropagation();
    });
    return handlers;
}

PointerHandlers ControlHandles::rotationHandlers(Entity frame, Pivot pivot) {
    PointerHandlers handlers;
    handlers.on(PointerEventType::Drag, [this, frame, pivot](PointerEvent& event) {
        event.stopPropagation();
        m_state.cursor = CursorShape::Grabbing;
        rotateToward(frame, pivot, m_camera.screenToWorld(event.position));
    });
    handlers.on(PointerEventType::Over, [this](PointerEvent& event) {
        event.stopPropagation();
        m_state.cursor = CursorShape::Grab;
    });
    handlers.on(PointerEventType::Out, [this](PointerEvent& event) {
        event.stopPropagation();
        m_state.cursor = CursorShape::Default;
    });
    handlers.on(PointerEventType::DragEnd, [this](PointerEvent& event) {
        event.stopPropagation();
        m_state.cursor = CursorShape::Default;
    });
    handlers.on(PointerEventType::Click, [](PointerEvent& event) {
        event.stopPropagation();
    });
    return handlers;
}

} // namespace neta
