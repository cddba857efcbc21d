#pragma once

#include "ecs/Components.hpp"
#include "rendering/Camera.hpp"

#include <vector>

namespace neta {

struct PickingSettings {
    /// Only entities with a Pickable component can be hit
    bool requireMarkers = false;
};

/// One entity under the pointer
struct PickHit {
    Entity entity = NullEntity;
    int order = 0;          // 1 = overlay, 0 = world
    float depth = 0.0f;     // Sprite depth inside the world layer
    Vec2 local;             // Pointer in the entity's local space
};

/// True when `point` lies inside the sprite's rectangle in sprite-local space
/// (rotation and scale applied).  Both arguments share one space.
bool spriteContains(const Transform& transform, const Sprite& sprite, Vec2 point);

/// True when `point` is strictly inside the circle in circle-local space
bool circleContains(const Transform& transform, const PickingCircle& circle, Vec2 point);

/// Hit testing for the two layers: overlay circles in screen space, world
/// sprites through the main camera.
class Picker {
public:
    void setSettings(const PickingSettings& settings) { m_settings = settings; }
    const PickingSettings& getSettings() const { return m_settings; }

    /// All hits, top-most first, cut off after the first entity that blocks
    /// lower ones.
    std::vector<PickHit> pickAll(const Registry& registry, const Camera& camera,
                                 Vec2 screenPos) const;

    /// Top-most hit, or `fallback` (the canvas) when nothing is hit
    Entity pick(const Registry& registry, const Camera& camera, Vec2 screenPos,
                Entity fallback) const;

private:
    /// Whether the entity may be hit, and whether it hides the ones below
    bool isCandidate(const Registry& registry, Entity entity) const;
    bool blocksLower(const Registry& registry, Entity entity) const;

    PickingSettings m_settings;
};

} // namespace neta
