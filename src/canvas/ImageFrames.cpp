#include "canvas/ImageFrames.hpp"
#include "engine/Log.hpp"

#include <filesystem>

namespace neta {

namespace {

std::string frameName(const std::string& path) {
    std::string name = std::filesystem::path(path).filename().string();
    return name.empty() ? path : name;
}

} // namespace

Entity FrameLoader::spawnFrame(const std::string& path, std::optional<Vec2> position) {
    Entity frame = m_registry.create();
    m_registry.add<ImageFrame>(frame, ImageFrame{path, ""});
    m_registry.add<Transform>(frame, Transform{position.value_or(Vec2{})});
    m_registry.add<Parent>(frame, Parent{m_state.canvas});
    m_registry.add<Name>(frame, frameName(path));

    LOG_DEBUG("FrameLoader: requested '{}' as {}", path, entityLabel(frame));
    return frame;
}

Entity FrameLoader::queueDrop(const std::string& path) {
    Entity drop = m_registry.create();
    m_registry.add<DropImageFrame>(drop, DropImageFrame{path});
    m_registry.add<Parent>(drop, Parent{m_state.canvas});
    return drop;
}

size_t FrameLoader::placeDroppedFrames(Vec2 worldPosition) {
    auto drops = m_registry.collect<DropImageFrame>();
    for (Entity drop : drops) {
        std::string path = m_registry.get<DropImageFrame>(drop).path;
        m_registry.destroy(drop);
        spawnFrame(path, worldPosition);
    }
    return drops.size();
}

size_t FrameLoader::setupPendingFrames() {
    std::vector<Entity> pending;
    for (auto entity : m_registry.view<ImageFrame>()) {
        if (!m_registry.has<Sprite>(entity)) {
            pending.push_back(entity);
        }
    }

    size_t ready = 0;
    for (Entity frame : pending) {
        const std::string path = m_registry.get<ImageFrame>(frame).path;

        const Texture* texture = nullptr;
        auto resolved = m_policy.resolve(path);
        if (resolved) {
            texture = m_textures.loadTexture(*resolved);
        }

        if (!texture) {
            LOG_ERROR("FrameLoader: could not load '{}', removing frame {}", path, entityLabel(frame));
            m_registry.destroy(frame);
            continue;
        }

        if (!m_registry.has<Transform>(frame)) {
            m_registry.add<Transform>(frame);
        }

        m_registry.get<ImageFrame>(frame).source = *resolved;

        float depth = static_cast<float>(m_state.framesSetUp) * FRAME_DEPTH_STEP;
        m_registry.add<Sprite>(frame, texture, texture->getSize(), depth);
        m_registry.addOrReplace<Pickable>(frame);
        ++m_state.framesSetUp;
        ++ready;

        if (m_onFrameReady) {
            m_onFrameReady(frame);
        }

        LOG_INFO("FrameLoader: frame {} ready ({}x{}) from '{}'", entityLabel(frame),
                 texture->getWidth(), texture->getHeight(), path);
    }
    return ready;
}

size_t FrameLoader::refreshFrames(const std::vector<std::string>& changedFiles) {
    size_t refreshed = 0;
    for (const auto& file : changedFiles) {
        const Texture* texture = m_textures.reloadTexture(file);
        if (!texture) {
            ASSET_LOG_WARN("FrameLoader: '{}' did not reload, frames keep no texture", file);
        }

        for (auto frame : m_registry.view<ImageFrame, Sprite>()) {
            if (m_registry.get<ImageFrame>(frame).source != file) continue;
            m_registry.get<Sprite>(frame).texture = texture;
            ++refreshed;
        }
    }

    if (refreshed > 0) {
        LOG_INFO("FrameLoader: refreshed {} frames", refreshed);
    }
    return refreshed;
}

} // namespace neta
