#pragma once

#include "ecs/Registry.hpp"
#include "engine/Input.hpp"

#include <array>
#include <functional>
#include <optional>
#include <vector>

namespace neta {

enum class PointerEventType {
    Over,       // Pointer entered the target
    Out,        // Pointer left the target
    Pressed,    // Button went down over the target
    Released,   // Button went up over the target
    Click,      // Released over the entity it was pressed on
    DragStart,  // First movement while a button is held
    Drag,       // Every movement while dragging, with the screen delta
    DragEnd,    // Button released after dragging
    Scroll,     // Mouse wheel over the target
};

const char* pointerEventName(PointerEventType type);

/// A pointer event on its way up the parent chain
struct PointerEvent {
    PointerEventType type = PointerEventType::Over;
    MouseButton button = MouseButton::Left;
    Entity target = NullEntity;     // Entity the event was emitted on
    Entity listener = NullEntity;   // Entity whose handler is running
    Vec2 position;                  // Screen position
    Vec2 delta;                     // Screen delta (Drag)
    float scroll = 0.0f;            // Wheel amount (Scroll), positive is up
    bool ctrl = false;              // Ctrl (Cmd on macOS) held
    std::array<bool, MOUSE_BUTTON_COUNT> down{};  // Buttons held this frame

    bool isDown(MouseButton b) const { return down[static_cast<size_t>(b)]; }

    /// Keep the event from reaching the listener's parents
    void stopPropagation() { m_propagate = false; }
    bool isPropagating() const { return m_propagate; }

private:
    bool m_propagate = true;
};

using PointerCallback = std::function<void(PointerEvent&)>;

/// Handlers attached to an entity.  Replacing the component replaces the
/// handlers; destroying the entity drops them.
struct PointerHandlers {
    std::vector<std::pair<PointerEventType, PointerCallback>> entries;

    PointerHandlers& on(PointerEventType type, PointerCallback callback) {
        entries.emplace_back(type, std::move(callback));
        return *this;
    }
};

/// Turns per-frame pointer snapshots plus the picked entity into pointer
/// events, and delivers them to PointerHandlers along the Parent chain.
class PointerEventRouter {
public:
    /// Feed one frame.  `hovered` is the picked entity, NullEntity when the
    /// pointer is over the UI or outside the window.
    void update(Registry& registry, const PointerState& pointer, Entity hovered);

    /// Deliver an event to `event.target` and bubble it through Parent links.
    /// Observers see it first, before any entity handler.
    void dispatch(Registry& registry, PointerEvent& event);

    /// Observe every event regardless of target.  Returns an id for removal.
    size_t addObserver(PointerCallback callback);
    void removeObserver(size_t id);

    Entity getHovered() const { return m_hovered; }

    /// Entity the button went down on (NullEntity when not held)
    Entity getPressTarget(MouseButton button) const { return slot(button).pressTarget; }
    bool isDragging(MouseButton button) const { return slot(button).dragging; }

    /// Drop all press/drag state (e.g. when the pressed entity is destroyed
    /// and the UI took over)
    void reset();

private:
    struct ButtonState {
        Entity pressTarget = NullEntity;
        bool held = false;
        bool dragging = false;
    };

    ButtonState& slot(MouseButton b) { return m_buttons[static_cast<size_t>(b)]; }
    const ButtonState& slot(MouseButton b) const { return m_buttons[static_cast<size_t>(b)]; }

    void emit(Registry& registry, PointerEventType type, MouseButton button,
              Entity target, const PointerState& pointer);

    std::array<ButtonState, MOUSE_BUTTON_COUNT> m_buttons{};
    Entity m_hovered = NullEntity;

    std::vector<std::pair<size_t, PointerCallback>> m_observers;
    size_t m_nextObserverId = 1;
};

} // namespace neta
