#include "picking/Picking.hpp"

#include <algorithm>
#include <cmath>

namespace neta {

bool spriteContains(const Transform& transform, const Sprite& sprite, Vec2 point) {
    if (transform.scale.x == 0.0f || transform.scale.y == 0.0f) {
        return false;
    }
    Vec2 local = transform.toLocal(point);
    Vec2 half = sprite.size * 0.5f;
    return std::abs(local.x) <= half.x && std::abs(local.y) <= half.y;
}

bool circleContains(const Transform& transform, const PickingCircle& circle, Vec2 point) {
    if (transform.scale.x == 0.0f || transform.scale.y == 0.0f) {
        return false;
    }
    return transform.toLocal(point).length() < circle.radius;
}

bool Picker::isCandidate(const Registry& registry, Entity entity) const {
    const auto* pickable = registry.tryGet<Pickable>(entity);
    if (!pickable) {
        return !m_settings.requireMarkers;
    }
    return pickable->hoverable;
}

bool Picker::blocksLower(const Registry& registry, Entity entity) const {
    const auto* pickable = registry.tryGet<Pickable>(entity);
    return !pickable || pickable->blocksLower;
}

std::vector<PickHit> Picker::pickAll(const Registry& registry, const Camera& camera,
                                     Vec2 screenPos) const {
    std::vector<PickHit> overlayHits;
    for (auto entity : registry.view<Overlay, Transform, PickingCircle>()) {
        const auto& transform = registry.get<Transform>(entity);
        const auto& circle = registry.get<PickingCircle>(entity);
        if (circleContains(transform, circle, screenPos)) {
            overlayHits.push_back({entity, 1, 0.0f, transform.toLocal(screenPos)});
        }
    }

    Vec2 worldPos = camera.screenToWorld(screenPos);
    std::vector<PickHit> worldHits;
    for (auto entity : registry.view<Transform, Sprite>()) {
        if (registry.has<Overlay>(entity)) continue;

        const auto& sprite = registry.get<Sprite>(entity);
        if (!sprite.visible) continue;

        const auto& transform = registry.get<Transform>(entity);
        if (spriteContains(transform, sprite, worldPos)) {
            worldHits.push_back({entity, 0, sprite.depth, transform.toLocal(worldPos)});
        }
    }
    std::stable_sort(worldHits.begin(), worldHits.end(),
        [](const PickHit& a, const PickHit& b) { return a.depth > b.depth; });

    std::vector<PickHit> hits;
    for (const auto* layer : {&overlayHits, &worldHits}) {
        for (const auto& hit : *layer) {
            if (m_settings.requireMarkers && !registry.has<Pickable>(hit.entity)) {
                continue;
            }
            if (isCandidate(registry, hit.entity)) {
                hits.push_back(hit);
            }
            if (blocksLower(registry, hit.entity)) {
                return hits;
            }
        }
    }
    return hits;
}

Entity Picker::pick(const Registry& registry, const Camera& camera, Vec2 screenPos,
                    Entity fallback) const {
    auto hits = pickAll(registry, camera, screenPos);
    return hits.empty() ? fallback : hits.front().entity;
}

} // namespace neta
