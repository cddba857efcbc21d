#pragma once

#include "asset/AssetWatcher.hpp"
#include "canvas/CanvasState.hpp"
#include "canvas/ControlHandle.hpp"
#include "canvas/ImageFrames.hpp"
#include "canvas/Selection.hpp"
#include "dev/DebugGizmos.hpp"
#include "ecs/Systems.hpp"
#include "picking/Picking.hpp"
#include "picking/PointerEvents.hpp"
#include "ui/UISystem.hpp"

namespace neta {

/// PreUpdate: feed the pointer to the UI, pick what is under it unless the
/// UI has it, then dispatch pointer events.
class PointerSystem : public System {
public:
    PointerSystem(const PointerState& pointer, UISystem& ui, const Camera& camera,
                  const Picker& picker, PointerEventRouter& router, const CanvasState& state)
        : System("PointerSystem"), m_pointer(pointer), m_ui(ui), m_camera(camera),
          m_picker(picker), m_router(router), m_state(state) {}

    void update(float dt) override;

    /// Entity picked this frame (NullEntity over the UI)
    Entity getHovered() const { return m_hovered; }

private:
    const PointerState& m_pointer;
    UISystem& m_ui;
    const Camera& m_camera;
    const Picker& m_picker;
    PointerEventRouter& m_router;
    const CanvasState& m_state;
    Entity m_hovered = NullEntity;
};

/// Update: place dropped files at the cursor and give loaded frames their
/// sprites.
class FrameSetupSystem : public System {
public:
    FrameSetupSystem(FrameLoader& frames, const Camera& camera, const PointerState& pointer)
        : System("FrameSetupSystem"), m_frames(frames), m_camera(camera), m_pointer(pointer) {}

    void update(float dt) override;

private:
    FrameLoader& m_frames;
    const Camera& m_camera;
    const PointerState& m_pointer;
};

/// Update: poll watched image files and refresh the frames showing them
class AssetWatchSystem : public System {
public:
    AssetWatchSystem(AssetWatcher& watcher, FrameLoader& frames)
        : System("AssetWatchSystem"), m_watcher(watcher), m_frames(frames) {}

    void update(float dt) override;

private:
    AssetWatcher& m_watcher;
    FrameLoader& m_frames;
};

/// PostUpdate: keep the control handle on its frame after everything moved
class HandleTrackSystem : public System {
public:
    explicit HandleTrackSystem(ControlHandles& handles)
        : System("HandleTrackSystem"), m_handles(handles) {}

    void update(float) override { m_handles.track(); }

private:
    ControlHandles& m_handles;
};

/// Render: world sprites through the main camera, lowest depth first.
/// Sprites without a texture and sprites outside the view are skipped.
class SpriteRenderSystem : public System {
public:
    SpriteRenderSystem(IRenderer& renderer, const Camera& camera)
        : System("SpriteRenderSystem"), m_renderer(renderer), m_camera(camera) {}

    void update(float dt) override;

    /// Sprites drawn by the last update
    size_t getDrawnCount() const { return m_drawn; }

private:
    IRenderer& m_renderer;
    const Camera& m_camera;
    size_t m_drawn = 0;
};

/// PostRender: selection borders, rubber band, control handle and gizmos
class OverlayRenderSystem : public System {
public:
    OverlayRenderSystem(IRenderer& renderer, const Camera& camera, const Selection& selection,
                        const ControlHandles& handles, DebugGizmos* gizmos)
        : System("OverlayRenderSystem"), m_renderer(renderer), m_camera(camera),
          m_selection(selection), m_handles(handles), m_gizmos(gizmos) {}

    void update(float dt) override;

private:
    IRenderer& m_renderer;
    const Camera& m_camera;
    const Selection& m_selection;
    const ControlHandles& m_handles;
    DebugGizmos* m_gizmos;
};

} // namespace neta
