#include "canvas/Selection.hpp"
#include "canvas/CameraTranslator.hpp"
#include "engine/Log.hpp"
#include "rendering/Shapes.hpp"

#include <algorithm>
#include <cmath>

namespace neta {

namespace {

const Color BAND_COLOR = Color::fromFloat(0.5f, 0.5f, 1.0f, 0.5f);

} // namespace

PointerHandlers Selection::frameHandlers(Entity frame) {
    PointerHandlers handlers;

    handlers.on(PointerEventType::Over, [this, frame](PointerEvent&) {
        if (m_state.selectionDrag.isDragging()) return;
        m_registry.addOrReplace<Hovered>(frame);
    });
    handlers.on(PointerEventType::Out, [this, frame](PointerEvent&) {
        m_registry.remove<Hovered>(frame);
    });
    handlers.on(PointerEventType::Click, [this, frame](PointerEvent& event) {
        // Keep the canvas from deselecting what we just selected
        event.stopPropagation();
        if (event.ctrl) {
            toggle(frame);
        } else {
            selectOnly(frame);
        }
    });
    handlers.on(PointerEventType::Drag, [this, frame](PointerEvent& event) {
        if (event.button != MouseButton::Left) return;
        event.stopPropagation();
        moveFrame(frame, m_camera.screenDeltaToWorld(event.delta));
    });

    return handlers;
}

void Selection::addCanvasHandlers(PointerHandlers& handlers) {
    // Only events that hit the background itself; bubbled ones came from a
    // frame that let them through
    handlers.on(PointerEventType::Click, [this](PointerEvent& event) {
        if (event.target != m_state.canvas || event.button != MouseButton::Left) return;
        m_handles.despawn();
        if (!event.ctrl) {
            deselectAll();
        }
    });
    handlers.on(PointerEventType::DragStart, [this](PointerEvent& event) {
        if (event.target != m_state.canvas || event.button != MouseButton::Left) return;
        m_state.selectionDrag.start = event.position;
        m_state.selectionDrag.end.reset();
    });
    handlers.on(PointerEventType::Drag, [this](PointerEvent& event) {
        if (event.target != m_state.canvas || event.button != MouseButton::Left) return;
        if (!m_state.selectionDrag.start) return;
        m_state.selectionDrag.end = event.position;
    });
    handlers.on(PointerEventType::DragEnd, [this](PointerEvent& event) {
        if (event.target != m_state.canvas || event.button != MouseButton::Left) return;
        finishBand(event.ctrl);
    });
}

void Selection::finishBand(bool additive) {
    auto start = m_state.selectionDrag.start;
    auto end = m_state.selectionDrag.end;
    m_state.selectionDrag.clear();
    if (!start || !end) {
        return;
    }

    CameraTranslator translator(m_camera);
    Rect band = translator.mapRectToMain(Rect::fromCorners(*start, *end));
    size_t count = selectIntersecting(band, additive);
    LOG_DEBUG("Rubber band selected {} frames", count);
}

void Selection::selectOnly(Entity frame) {
    for (Entity other : m_registry.collect<Selected>()) {
        if (other != frame) {
            m_registry.remove<Selected>(other);
        }
    }
    m_registry.addOrReplace<Selected>(frame);
    m_handles.spawn(frame);
}

void Selection::toggle(Entity frame) {
    if (m_registry.has<Selected>(frame)) {
        m_registry.remove<Selected>(frame);
    } else {
        m_registry.addOrReplace<Selected>(frame);
    }
}

void Selection::deselectAll() {
    for (Entity entity : m_registry.collect<Selected>()) {
        m_registry.remove<Selected>(entity);
    }
}

size_t Selection::selectIntersecting(const Rect& worldRect, bool additive) {
    if (!additive) {
        deselectAll();
    }

    size_t count = 0;
    for (auto frame : m_registry.view<ImageFrame, Transform, Sprite>()) {
        const auto& transform = m_registry.get<Transform>(frame);
        const auto& sprite = m_registry.get<Sprite>(frame);

        Vec2 size = sprite.size.scaled(transform.scale);
        Rect bounds = Rect::fromCenterSize(transform.position, {std::abs(size.x), std::abs(size.y)});
        if (worldRect.intersects(bounds)) {
            m_registry.addOrReplace<Selected>(frame);
            ++count;
        }
    }
    return count;
}

std::vector<Entity> Selection::selectedFrames() const {
    return m_registry.collect<Selected>();
}

std::vector<Entity> Selection::actionTargets() const {
    std::vector<Entity> targets;
    for (auto frame : m_registry.view<ImageFrame>()) {
        if (m_registry.hasAny<Hovered, Selected>(frame)) {
            targets.push_back(frame);
        }
    }
    return targets;
}

void Selection::removeFrames(const std::vector<Entity>& frames) {
    Entity controlled = m_handles.controlledFrame();
    for (Entity frame : frames) {
        if (!m_registry.valid(frame)) continue;
        if (frame == controlled) {
            m_handles.despawn();
        }
        LOG_INFO("Removed frame {}", entityLabel(frame));
        m_registry.destroy(frame);
    }
}

void Selection::moveFrame(Entity frame, Vec2 worldDelta) {
    if (auto* transform = m_registry.tryGet<Transform>(frame)) {
        transform->position += worldDelta;
    }
}

void Selection::draw(IRenderer& renderer) const {
    if (!m_registry.valid(m_state.currentHandle)) {
        CameraTranslator translator(m_camera);
        for (auto frame : m_registry.view<ImageFrame, Transform, Sprite>()) {
            bool selected = m_registry.has<Selected>(frame);
            if (!selected && !m_registry.has<Hovered>(frame)) continue;

            Transform control = translator.toControl(m_registry.get<Transform>(frame));
            Vec2 size = m_registry.get<Sprite>(frame).size.scaled(control.scale);
            auto outline = roundedRectOutline(control.position, size, control.rotation, BORDER_RADIUS);
            renderer.drawPolyline(outline, true, selected ? Color::Green() : Color::White(), 1.0f);
        }
    }

    const auto& band = m_state.selectionDrag;
    if (band.start && band.end) {
        renderer.drawRectangleOutline(Rect::fromCorners(*band.start, *band.end), BAND_COLOR, 1.0f);
    }
}

} // namespace neta
