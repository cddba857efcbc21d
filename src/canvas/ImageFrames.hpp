#pragma once

#include "asset/AssetPolicy.hpp"
#include "canvas/CanvasState.hpp"
#include "ecs/Components.hpp"
#include "rendering/Texture.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace neta {

/// Depth step between consecutively loaded frames
constexpr float FRAME_DEPTH_STEP = 1.0f / 65536.0f;

/// Creates image frames and turns them into sprites once their texture loads.
class FrameLoader {
public:
    using FrameReadyCallback = std::function<void(Entity)>;

    FrameLoader(Registry& registry, CanvasState& state, TextureManager& textures,
                const AssetPolicy& policy)
        : m_registry(registry), m_state(state), m_textures(textures), m_policy(policy) {}

    /// Called for every frame that got its sprite (attach handlers here)
    void setOnFrameReady(FrameReadyCallback callback) { m_onFrameReady = std::move(callback); }

    /// Create a frame under the canvas.  Without a position it is placed at
    /// the world origin.
    Entity spawnFrame(const std::string& path, std::optional<Vec2> position = std::nullopt);

    /// Queue a dropped file; it becomes a frame at the cursor once the cursor
    /// position is known.
    Entity queueDrop(const std::string& path);

    /// Turn queued drops into frames at `worldPosition`.  Returns the count.
    size_t placeDroppedFrames(Vec2 worldPosition);

    /// Load textures for frames without a sprite.  Frames whose image fails to
    /// load are destroyed.  Returns the number of frames set up.
    size_t setupPendingFrames();

    /// Reload changed image files and point the frames showing them at the
    /// new textures.  Frames keep their size.  A file that no longer loads
    /// leaves its frames without a texture until it comes back.
    /// Returns the number of frames refreshed.
    size_t refreshFrames(const std::vector<std::string>& changedFiles);

private:
    Registry& m_registry;
    CanvasState& m_state;
    TextureManager& m_textures;
    const AssetPolicy& m_policy;
    FrameReadyCallback m_onFrameReady;
};

} // namespace neta
