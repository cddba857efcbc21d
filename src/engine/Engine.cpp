#include "engine/Engine.hpp"
#include "engine/BuildInfo.hpp"
#include "engine/Log.hpp"
#include "canvas/CanvasSystems.hpp"
#include "canvas/Packing.hpp"
#include "rendering/RaylibRenderer.hpp"

#include <raylib.h>
#include <csignal>
#include <filesystem>

namespace neta {

std::atomic<bool> Engine::s_signalReceived{false};

void Engine::signalHandler(int /*signum*/) {
    // Signal-safe: only set an atomic flag. Logging and cleanup
    // happen in the main loop when it checks this flag.
    s_signalReceived.store(true, std::memory_order_relaxed);
}

void Engine::requestShutdown() {
    m_running = false;
}

void Engine::loadConfig(const std::string& configPath) {
    bool loaded = m_config.loadFromFile(configPath);

    // config.json -> config.local.json, device-specific and not versioned
    namespace fs = std::filesystem;
    fs::path base(configPath);
    fs::path localFile = base.parent_path()
        / (base.stem().string() + ".local" + base.extension().string());
    m_localConfigPath = localFile.string();
    bool merged = m_config.mergeFromFile(m_localConfigPath);

    Log::init(m_config.getString("logging.file", ""),
              m_config.getString("logging.level", "debug"),
              BuildInfo::DEV_TOOLS);

    if (loaded) {
        LOG_INFO("Configuration loaded from '{}'", configPath);
    } else {
        LOG_WARN("Could not load config from '{}', using defaults", configPath);
    }
    if (merged) {
        LOG_INFO("Per-device config merged from '{}'", m_localConfigPath);
    }
}

bool Engine::init(const std::string& configPath) {
    loadConfig(configPath);
    LOG_INFO("{} starting...", BuildInfo::summary());

    WindowConfig winCfg;
    winCfg.width      = m_config.getInt("window.width", winCfg.width);
    winCfg.height     = m_config.getInt("window.height", winCfg.height);
    winCfg.title      = m_config.getString("window.title", winCfg.title);
    winCfg.fullscreen = m_config.getBool("window.fullscreen", winCfg.fullscreen);
    winCfg.vsync      = m_config.getBool("window.vsync", winCfg.vsync);
    winCfg.reactive   = m_config.getBool("window.reactive", winCfg.reactive);
    winCfg.tickRate   = m_config.getInt("window.tick_rate", winCfg.tickRate);

    if (!m_window.init(winCfg)) {
        LOG_CRITICAL("Failed to create window");
        return false;
    }
    LOG_INFO("Window created: {}x{} ({})", winCfg.width, winCfg.height,
             winCfg.fullscreen ? "fullscreen" : "windowed");

    m_renderer = std::make_unique<RaylibRenderer>();
    if (!m_renderer->init(m_window.getWidth(), m_window.getHeight())) {
        LOG_CRITICAL("Failed to initialize renderer");
        return false;
    }
    m_textureManager.setRenderer(m_renderer.get());

    // Canvas settings
    CanvasSettings& canvas = m_canvasState.settings;
    canvas.zoomStep   = m_config.getFloat("canvas.zoom_step", canvas.zoomStep);
    canvas.minZoom    = m_config.getFloat("canvas.min_zoom", canvas.minZoom);
    canvas.maxZoom    = m_config.getFloat("canvas.max_zoom", canvas.maxZoom);
    canvas.background = m_config.getColor("canvas.background", canvas.background);
    if (canvas.zoomStep <= 1.0f) {
        LOG_WARN("canvas.zoom_step must be greater than 1 (got {}), using 1.1", canvas.zoomStep);
        canvas.zoomStep = 1.1f;
    }

    m_camera = Camera(static_cast<float>(m_window.getWidth()),
                      static_cast<float>(m_window.getHeight()));
    m_camera.setZoomLimits(canvas.minZoom, canvas.maxZoom);

    AssetSettings assets;
    assets.root               = m_config.getString("assets.root", assets.root);
    assets.allowExternalPaths = m_config.getBool("assets.allow_external_paths",
                                                 assets.allowExternalPaths);
    assets.watchInterval      = m_config.getFloat("assets.watch_interval", assets.watchInterval);
    m_assetPolicy = AssetPolicy(assets);

    LOG_INFO("Rendering initialized (zoom {}..{}, step {})",
             canvas.minZoom, canvas.maxZoom, canvas.zoomStep);

    // Canvas root and frame lifecycle
    m_systemScheduler.init(m_registry);
    createCanvas();
    m_frameLoader.setOnFrameReady([this](Entity frame) { onFrameReady(frame); });

    // UI
    if (!m_uiSystem.init(m_renderer.get())) {
        LOG_ERROR("UI system failed to initialize");
        return false;
    }

    m_fileDialog = createFileDialog();
    LOG_INFO("File dialog backend: {} ({})", m_fileDialog->backendName(),
             m_fileDialog->isAvailable() ? "available" : "unavailable");

    m_contextMenu = std::make_unique<ContextMenu>(m_registry, m_uiSystem, m_selection,
                                                  m_frameLoader, *m_fileDialog);
    m_contextMenu->init(m_pointerEvents,
                        ContextMenuTheme::load(m_textureManager,
                                               m_config.getString("ui.theme_dir",
                                                                  "assets/ui")));

    registerSystems();
    initDevTools();

    std::signal(SIGTERM, Engine::signalHandler);
    std::signal(SIGINT, Engine::signalHandler);

    m_running = true;
    LOG_INFO("Engine initialized ({} systems)", m_systemScheduler.getTotalSystemCount());
    return true;
}

void Engine::createCanvas() {
    m_canvasState.canvas = m_registry.create(Name("Canvas"), Canvas{}, Transform{});

    PointerHandlers handlers;
    m_selection.addCanvasHandlers(handlers);
    m_navigation.addCanvasHandlers(handlers);
    m_registry.add<PointerHandlers>(m_canvasState.canvas, std::move(handlers));
}

void Engine::registerSystems() {
    const PointerState& pointer = m_input.getPointer();

    m_systemScheduler.addSystem<PointerSystem>(
        SystemPhase::PreUpdate, pointer, m_uiSystem, m_camera, m_picker,
        m_pointerEvents, m_canvasState);
    m_systemScheduler.addSystem<FrameSetupSystem>(
        SystemPhase::Update, m_frameLoader, m_camera, pointer);
    if (BuildInfo::FILE_WATCHER) {
        m_systemScheduler.addSystem<AssetWatchSystem>(
            SystemPhase::Update, m_assetWatcher, m_frameLoader);
    }
    m_systemScheduler.addSystem<HandleTrackSystem>(SystemPhase::PostUpdate, m_controlHandles);
    m_systemScheduler.addSystem<SpriteRenderSystem>(SystemPhase::Render, *m_renderer, m_camera);
    m_systemScheduler.addSystem<OverlayRenderSystem>(
        SystemPhase::PostRender, *m_renderer, m_camera, m_selection, m_controlHandles,
        BuildInfo::DEV_TOOLS ? &m_gizmos : nullptr);
}

void Engine::initDevTools() {
    if (!BuildInfo::DEV_TOOLS) return;

    m_pickingOverlay.setVisible(m_config.getBool("dev.picking_overlay", true));
    m_assetWatcher.setPollInterval(m_assetPolicy.getSettings().watchInterval);

    m_contextMenu->setOnOrganized([this](const std::vector<Packing::ShapePosition>& shapes) {
        for (const auto& shape : shapes) {
            std::vector<Vec2> vertices = shape.vertices();
            Vec2 center = shape.translation;
            m_gizmos.add([vertices, center](GizmoPainter& painter) {
                painter.polygon(vertices, Color::Green());
                painter.point(center, Color::Green());
            });
        }
    });

    LOG_INFO("Developer tools enabled (F12 inspector, F3 picking overlay{})",
             BuildInfo::FILE_WATCHER ? ", asset hot reload" : "");
}

void Engine::onFrameReady(Entity frame) {
    m_registry.addOrReplace<PointerHandlers>(frame, m_selection.frameHandlers(frame));

    if (BuildInfo::FILE_WATCHER) {
        if (const ImageFrame* image = m_registry.tryGet<ImageFrame>(frame)) {
            m_assetWatcher.watchFile(image->source);
        }
    }
}

void Engine::run() {
    LOG_INFO("Entering main loop");

    while (m_running && !m_window.shouldClose()) {
        if (s_signalReceived.load(std::memory_order_relaxed)) {
            LOG_INFO("Termination signal received, shutting down");
            m_running = false;
            break;
        }

        float dt = GetFrameTime();

        processInput();
        update(dt);
        render();
    }

    LOG_INFO("Main loop exited");
}

void Engine::processInput() {
    m_input.update();

    if (m_window.pollSizeChanged()) {
        m_renderer->setScreenSize(m_window.getWidth(), m_window.getHeight());
        m_camera.setScreenSize(static_cast<float>(m_window.getWidth()),
                               static_cast<float>(m_window.getHeight()));
    }

    if (m_input.isKeyPressed(Key::F11)) {
        m_window.toggleFullscreen();
        m_config.setBool("window.fullscreen", !m_config.getBool("window.fullscreen", false));
    }

    if (BuildInfo::DEV_TOOLS) {
        if (m_input.isKeyReleased(Key::F12)) {
            m_inspector.open();
        }
        if (m_input.isKeyPressed(Key::F3)) {
            m_pickingOverlay.toggle();
            LOG_INFO("Picking overlay {}", m_pickingOverlay.isVisible() ? "shown" : "hidden");
        }
    }

    for (const auto& path : m_window.takeDroppedFiles()) {
        m_frameLoader.queueDrop(path);
    }
}

void Engine::update(float dt) {
    m_systemScheduler.update(dt);

    if (BuildInfo::DEV_TOOLS) {
        m_gizmos.update(dt);
        m_inspector.refresh();
    }

    m_window.setCursor(m_canvasState.cursor);

    // Watched files and gizmo lifetimes need frames even without input
    TimedWork work;
    if (BuildInfo::FILE_WATCHER) work.watchedFiles = m_assetWatcher.watchedFileCount();
    if (BuildInfo::DEV_TOOLS) work.liveGizmos = m_gizmos.commandCount();
    m_window.setPacing(choosePacing(m_window.isReactive(), work));
}

void Engine::render() {
    m_renderer->beginFrame();
    m_renderer->clear(m_canvasState.settings.background);

    // Sprites, then the overlay (borders, handle, gizmos)
    m_systemScheduler.render(0.0f);

    if (BuildInfo::DEV_TOOLS) {
        m_pickingOverlay.render(*m_renderer, m_registry, m_camera, m_picker,
                                m_input.getMousePosition(), m_pointerEvents.getHovered());
    }

    m_uiSystem.render();

    m_renderer->endFrame();
}

void Engine::shutdown() {
    LOG_INFO("Shutting down...");

    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);

    // The menu and inspector hold UI screens and router observers
    m_contextMenu.reset();
    m_inspector.closeAll();
    m_uiSystem.shutdown();

    m_assetWatcher.unwatchAll();
    m_gizmos.clear();

    m_systemScheduler.shutdown();
    m_registry.clear();

    m_textureManager.unloadAll();

    if (m_renderer) {
        m_renderer->shutdown();
        m_renderer.reset();
    }

    if (m_config.saveOverridesToFile(m_localConfigPath)) {
        LOG_INFO("Settings saved to '{}'", m_localConfigPath);
    }

    m_window.shutdown();
    Log::shutdown();
}

} // namespace neta
