#include "picking/PointerEvents.hpp"
#include "ecs/Components.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace neta {

namespace {

// Parent chains deeper than this are treated as cycles
constexpr int MAX_BUBBLE_DEPTH = 64;

} // namespace

const char* pointerEventName(PointerEventType type) {
    switch (type) {
        case PointerEventType::Over:      return "Over";
        case PointerEventType::Out:       return "Out";
        case PointerEventType::Pressed:   return "Pressed";
        case PointerEventType::Released:  return "Released";
        case PointerEventType::Click:     return "Click";
        case PointerEventType::DragStart: return "DragStart";
        case PointerEventType::Drag:      return "Drag";
        case PointerEventType::DragEnd:   return "DragEnd";
        case PointerEventType::Scroll:    return "Scroll";
    }
    return "?";
}

void PointerEventRouter::update(Registry& registry, const PointerState& pointer, Entity hovered) {
    if (hovered != NullEntity && !registry.valid(hovered)) {
        hovered = NullEntity;
    }

    if (hovered != m_hovered) {
        Entity previous = m_hovered;
        m_hovered = hovered;
        emit(registry, PointerEventType::Out, MouseButton::Left, previous, pointer);
        emit(registry, PointerEventType::Over, MouseButton::Left, hovered, pointer);
    }

    bool moved = pointer.delta.x != 0.0f || pointer.delta.y != 0.0f;

    for (size_t i = 0; i < MOUSE_BUTTON_COUNT; ++i) {
        auto button = static_cast<MouseButton>(i);
        ButtonState& state = slot(button);

        if (pointer.isPressed(button)) {
            state.held = true;
            state.dragging = false;
            state.pressTarget = hovered;
            emit(registry, PointerEventType::Pressed, button, hovered, pointer);
        } else if (state.held && pointer.isDown(button) && moved) {
            if (!state.dragging) {
                state.dragging = true;
                emit(registry, PointerEventType::DragStart, button, state.pressTarget, pointer);
            }
            emit(registry, PointerEventType::Drag, button, state.pressTarget, pointer);
        }

        if (pointer.isReleased(button) && state.held) {
            emit(registry, PointerEventType::Released, button, hovered, pointer);
            if (hovered != NullEntity && hovered == state.pressTarget) {
                emit(registry, PointerEventType::Click, button, hovered, pointer);
            }
            if (state.dragging) {
                emit(registry, PointerEventType::DragEnd, button, state.pressTarget, pointer);
            }
            state = ButtonState{};
        }
    }

    if (pointer.wheel != 0.0f) {
        emit(registry, PointerEventType::Scroll, MouseButton::Middle, hovered, pointer);
    }
}

void PointerEventRouter::emit(Registry& registry, PointerEventType type, MouseButton button,
                              Entity target, const PointerState& pointer) {
    if (!registry.valid(target)) {
        return;
    }

    PointerEvent event;
    event.type = type;
    event.button = button;
    event.target = target;
    event.position = pointer.position;
    event.delta = pointer.delta;
    event.scroll = pointer.wheel;
    event.ctrl = pointer.ctrl;
    event.down = pointer.down;
    dispatch(registry, event);
}

void PointerEventRouter::dispatch(Registry& registry, PointerEvent& event) {
    // Observers may add or remove observers while running
    auto observers = m_observers;
    for (auto& [id, callback] : observers) {
        event.listener = NullEntity;
        callback(event);
    }

    Entity current = event.target;
    for (int depth = 0; depth < MAX_BUBBLE_DEPTH; ++depth) {
        if (!registry.valid(current)) {
            return;
        }

        if (const auto* handlers = registry.tryGet<PointerHandlers>(current)) {
            // Handlers may replace the component or destroy the entity
            std::vector<PointerCallback> matching;
            for (const auto& [type, callback] : handlers->entries) {
                if (type == event.type) {
                    matching.push_back(callback);
                }
            }

            for (auto& callback : matching) {
                event.listener = current;
                callback(event);
            }
        }

        if (!event.isPropagating()) {
            return;
        }

        const auto* parent = registry.tryGet<Parent>(current);
        if (!parent) {
            return;
        }
        current = parent->entity;
    }

    LOG_WARN("PointerEventRouter: {} on {} exceeded the bubbling depth limit",
             pointerEventName(event.type), entityLabel(event.target));
}

size_t PointerEventRouter::addObserver(PointerCallback callback) {
    size_t id = m_nextObserverId++;
    m_observers.emplace_back(id, std::move(callback));
    return id;
}

void PointerEventRouter::removeObserver(size_t id) {
    m_observers.erase(
        std::remove_if(m_observers.begin(), m_observers.end(),
            [id](const auto& entry) { return entry.first == id; }),
        m_observers.end());
}

void PointerEventRouter::reset() {
    m_buttons = {};
    m_hovered = NullEntity;
}

} // namespace neta
