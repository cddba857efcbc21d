#include "canvas/CanvasSystems.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace neta {

// =============================================================================
// PointerSystem
// =============================================================================

void PointerSystem::update(float /*dt*/) {
    auto& registry = getRegistry();

    m_ui.update(m_pointer);

    if (m_ui.didConsumeInput() || m_ui.isPointerOver(m_pointer.position)) {
        m_hovered = NullEntity;
    } else {
        m_hovered = m_picker.pick(registry, m_camera, m_pointer.position, m_state.canvas);
    }

    m_router.update(registry, m_pointer, m_hovered);
}

// =============================================================================
// FrameSetupSystem
// =============================================================================

void FrameSetupSystem::update(float /*dt*/) {
    if (getRegistry().count<DropImageFrame>() > 0) {
        m_frames.placeDroppedFrames(m_camera.screenToWorld(m_pointer.position));
    }
    m_frames.setupPendingFrames();
}

// =============================================================================
// AssetWatchSystem
// =============================================================================

void AssetWatchSystem::update(float dt) {
    // Files stay watched only while a frame still shows them
    std::unordered_set<std::string> sources;
    auto view = getRegistry().view<ImageFrame>();
    for (auto entity : view) {
        sources.insert(view.get<ImageFrame>(entity).source);
    }
    if (size_t dropped = m_watcher.retainOnly(sources)) {
        ASSET_LOG_DEBUG("Stopped watching {} files without frames", dropped);
    }

    auto changed = m_watcher.poll(dt);
    if (changed.empty()) return;

    size_t refreshed = m_frames.refreshFrames(changed);
    ASSET_LOG_INFO("{} files changed, {} frames refreshed", changed.size(), refreshed);
}

// =============================================================================
// SpriteRenderSystem
// =============================================================================

void SpriteRenderSystem::update(float /*dt*/) {
    auto& registry = getRegistry();
    m_drawn = 0;

    struct DrawItem {
        const Transform* transform;
        const Sprite* sprite;
    };
    std::vector<DrawItem> items;

    auto view = registry.view<Transform, Sprite>();
    for (auto entity : view) {
        if (registry.has<Overlay>(entity)) continue;

        const auto& sprite = view.get<Sprite>(entity);
        if (!sprite.visible || !sprite.texture || !sprite.texture->isValid()) continue;

        const auto& transform = view.get<Transform>(entity);
        Vec2 size{sprite.size.x * std::abs(transform.scale.x),
                  sprite.size.y * std::abs(transform.scale.y)};

        // Square around the rotated rectangle
        float extent = std::sqrt(size.x * size.x + size.y * size.y);
        if (!m_camera.isVisible(Rect::fromCenterSize(transform.position, {extent, extent}))) {
            continue;
        }
        items.push_back({&transform, &sprite});
    }

    std::stable_sort(items.begin(), items.end(),
        [](const DrawItem& a, const DrawItem& b) {
            return a.sprite->depth < b.sprite->depth;
        });

    float zoom = m_camera.getZoom();
    for (const auto& item : items) {
        const Transform& transform = *item.transform;
        const Sprite& sprite = *item.sprite;
        const Texture* texture = sprite.texture;

        // Negative source extents mirror the image
        Rect source(0.0f, 0.0f,
                    static_cast<float>(texture->getWidth()) * (transform.scale.x < 0.0f ? -1.0f : 1.0f),
                    static_cast<float>(texture->getHeight()) * (transform.scale.y < 0.0f ? -1.0f : 1.0f));

        Vec2 screen = m_camera.worldToScreen(transform.position);
        float width = sprite.size.x * std::abs(transform.scale.x) * zoom;
        float height = sprite.size.y * std::abs(transform.scale.y) * zoom;
        Rect dest(screen.x, screen.y, width, height);

        m_renderer.drawTexturePro(texture, source, dest, {width * 0.5f, height * 0.5f},
                                  transform.rotation + m_camera.getRotation(), sprite.tint);
        ++m_drawn;
    }
}

// =============================================================================
// OverlayRenderSystem
// =============================================================================

void OverlayRenderSystem::update(float /*dt*/) {
    m_selection.draw(m_renderer);
    m_handles.draw(m_renderer);
    if (m_gizmos) {
        m_gizmos->render(m_renderer, m_camera);
    }
}

} // namespace neta
