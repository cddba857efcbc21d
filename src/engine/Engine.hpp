#pragma once

#include "asset/AssetPolicy.hpp"
#include "asset/AssetWatcher.hpp"
#include "canvas/CanvasState.hpp"
#include "canvas/ControlHandle.hpp"
#include "canvas/ImageFrames.hpp"
#include "canvas/Navigation.hpp"
#include "canvas/Selection.hpp"
#include "dev/DebugGizmos.hpp"
#include "dev/Inspector.hpp"
#include "dev/PickingDebugOverlay.hpp"
#include "ecs/Registry.hpp"
#include "ecs/Systems.hpp"
#include "engine/Config.hpp"
#include "engine/FileDialog.hpp"
#include "engine/Input.hpp"
#include "engine/Window.hpp"
#include "picking/Picking.hpp"
#include "picking/PointerEvents.hpp"
#include "rendering/Camera.hpp"
#include "rendering/IRenderer.hpp"
#include "rendering/Texture.hpp"
#include "ui/ContextMenu.hpp"
#include "ui/UISystem.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace neta {

class Engine {
public:
    bool init(const std::string& configPath = "config.json");
    void run();
    void shutdown();

    /// Request a graceful shutdown (used by the SIGTERM/SIGINT handler)
    void requestShutdown();

    Config& getConfig() { return m_config; }
    Window& getWindow() { return m_window; }
    Input&  getInput()  { return m_input; }

    // Rendering accessors
    IRenderer* getRenderer() { return m_renderer.get(); }
    Camera& getCamera() { return m_camera; }
    TextureManager& getTextureManager() { return m_textureManager; }

    // ECS accessors
    Registry& getRegistry() { return m_registry; }
    SystemScheduler& getSystemScheduler() { return m_systemScheduler; }

    // Canvas accessors
    CanvasState& getCanvasState() { return m_canvasState; }
    FrameLoader& getFrameLoader() { return m_frameLoader; }
    Selection& getSelection() { return m_selection; }
    ControlHandles& getControlHandles() { return m_controlHandles; }
    PointerEventRouter& getPointerEvents() { return m_pointerEvents; }

    UISystem* getUISystem() { return &m_uiSystem; }
    ContextMenu* getContextMenu() { return m_contextMenu.get(); }

    const std::string& getLocalConfigPath() const { return m_localConfigPath; }

private:
    void loadConfig(const std::string& configPath);
    void createCanvas();
    void registerSystems();
    void initDevTools();

    /// Frame got its sprite: attach pointer handlers and watch its file
    void onFrameReady(Entity frame);

    void processInput();
    void update(float dt);
    void render();

    Config m_config;
    Window m_window;
    Input  m_input;

    // Rendering
    std::unique_ptr<IRenderer> m_renderer;
    Camera m_camera;
    TextureManager m_textureManager;
    AssetPolicy m_assetPolicy;

    // ECS
    Registry m_registry;
    SystemScheduler m_systemScheduler;

    // Canvas
    CanvasState m_canvasState;
    FrameLoader m_frameLoader{m_registry, m_canvasState, m_textureManager, m_assetPolicy};
    ControlHandles m_controlHandles{m_registry, m_camera, m_canvasState};
    Selection m_selection{m_registry, m_camera, m_canvasState, m_controlHandles};
    Navigation m_navigation{m_camera, m_canvasState};
    Picker m_picker;
    PointerEventRouter m_pointerEvents;

    // UI
    UISystem m_uiSystem;
    std::unique_ptr<IFileDialog> m_fileDialog;
    std::unique_ptr<ContextMenu> m_contextMenu;

    // Developer tooling (NETA_DEV / NETA_DEV_NATIVE)
    AssetWatcher m_assetWatcher;
    DebugGizmos m_gizmos;
    Inspector m_inspector{m_registry, m_uiSystem};
    PickingDebugOverlay m_pickingOverlay;

    std::string m_localConfigPath;  ///< Per-device overrides next to the base config

    bool m_running = false;

    static std::atomic<bool> s_signalReceived;
    static void signalHandler(int signum);
};

} // namespace neta
