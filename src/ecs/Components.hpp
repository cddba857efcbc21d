#pragma once

#include "ecs/Registry.hpp"
#include "rendering/IRenderer.hpp"
#include "rendering/Texture.hpp"

#include <string>

namespace neta {

/// Transform component - position, rotation, scale.
/// Frames live in world space, control handle parts in overlay (screen) space.
struct Transform {
    Vec2 position{0.0f, 0.0f};
    float rotation = 0.0f;      // Degrees, clockwise on screen
    Vec2 scale{1.0f, 1.0f};

    constexpr Transform() = default;
    constexpr Transform(Vec2 pos) : position(pos) {}
    constexpr Transform(Vec2 pos, float rot) : position(pos), rotation(rot) {}
    constexpr Transform(Vec2 pos, float rot, Vec2 scl)
        : position(pos), rotation(rot), scale(scl) {}

    /// Map a point from local space into the space this transform lives in
    Vec2 toParent(Vec2 local) const {
        return local.scaled(scale).rotated(rotation * DEG_TO_RAD) + position;
    }

    /// Map a point into local space.  Zero scale axes map to 0.
    Vec2 toLocal(Vec2 point) const {
        Vec2 p = (point - position).rotated(-rotation * DEG_TO_RAD);
        return {scale.x != 0.0f ? p.x / scale.x : 0.0f,
                scale.y != 0.0f ? p.y / scale.y : 0.0f};
    }
};

/// Name component - for debugging and the inspector
struct Name {
    std::string value;

    Name() = default;
    Name(const std::string& n) : value(n) {}
    Name(const char* n) : value(n) {}
};

/// Parent link.  Pointer events bubble along it.
struct Parent {
    Entity entity = NullEntity;
};

/// Sprite component - a texture stretched to `size`, centered on the transform
struct Sprite {
    const Texture* texture = nullptr;
    Vec2 size{0.0f, 0.0f};       // Unscaled size in world units
    Color tint = Color::White();
    float depth = 0.0f;          // Higher draws on top and wins picking
    bool visible = true;

    Sprite() = default;
    explicit Sprite(const Texture* tex) : texture(tex) {
        if (tex) size = tex->getSize();
    }
    Sprite(const Texture* tex, Vec2 sz, float d = 0.0f) : texture(tex), size(sz), depth(d) {}
};

// ============================================================================
// Canvas components
// ============================================================================

/// The single root entity all frames hang from.  Receives pointer events
/// that hit nothing else.
struct Canvas {};

/// An image on the canvas.  Frames without a Sprite are still loading.
struct ImageFrame {
    std::string path;
    std::string source;  // Resolved file the texture was loaded from
};

/// Frame queued by a file drop, turned into an ImageFrame at the cursor
struct DropImageFrame {
    std::string path;
};

/// Opt-in picking marker.  Entities without it still block lower hits unless
/// picking is restricted to marked entities.
struct Pickable {
    bool blocksLower = true;
    bool hoverable = true;
};

/// Pointer is over this frame
struct Hovered {};

/// Frame is part of the selection
struct Selected {};

/// Drawn and picked in overlay (screen) space, above the world
struct Overlay {};

/// Circular pick area centered on the transform
struct PickingCircle {
    float radius = 0.0f;
};

/// Root of the resize/rotate gizmo, tracking `frame`
struct ControlHandle {
    Entity frame = NullEntity;
};

/// Anchor points on a frame, as offsets in units of the frame size (y-down)
enum class Pivot {
    TopLeft,
    TopCenter,
    TopRight,
    CenterLeft,
    CenterRight,
    BottomLeft,
    BottomCenter,
    BottomRight,
};

inline Vec2 pivotOffset(Pivot pivot) {
    switch (pivot) {
        case Pivot::TopLeft:      return {-0.5f, -0.5f};
        case Pivot::TopCenter:    return { 0.0f, -0.5f};
        case Pivot::TopRight:     return { 0.5f, -0.5f};
        case Pivot::CenterLeft:   return {-0.5f,  0.0f};
        case Pivot::CenterRight:  return { 0.5f,  0.0f};
        case Pivot::BottomLeft:   return {-0.5f,  0.5f};
        case Pivot::BottomCenter: return { 0.0f,  0.5f};
        case Pivot::BottomRight:  return { 0.5f,  0.5f};
    }
    return {0.0f, 0.0f};
}

inline const char* pivotName(Pivot pivot) {
    switch (pivot) {
        case Pivot::TopLeft:      return "TopLeft";
        case Pivot::TopCenter:    return "TopCenter";
        case Pivot::TopRight:     return "TopRight";
        case Pivot::CenterLeft:   return "CenterLeft";
        case Pivot::CenterRight:  return "CenterRight";
        case Pivot::BottomLeft:   return "BottomLeft";
        case Pivot::BottomCenter: return "BottomCenter";
        case Pivot::BottomRight:  return "BottomRight";
    }
    return "?";
}

/// One grip of a control handle
struct HandlePivot {
    enum class Kind { Corner, Rotation };

    Pivot pivot = Pivot::TopLeft;
    Kind kind = Kind::Corner;
    Entity handle = NullEntity;  // Owning ControlHandle entity
};

} // namespace neta
