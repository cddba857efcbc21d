#include "engine/Window.hpp"
#include "engine/Log.hpp"

#include <raylib.h>

namespace neta {

bool Window::init(const WindowConfig& config) {
    unsigned int flags = FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT;
    if (config.vsync) {
        flags |= FLAG_VSYNC_HINT;
    }
    SetConfigFlags(flags);

    InitWindow(config.width, config.height, config.title.c_str());

    if (!IsWindowReady()) {
        return false;
    }

    // Escape belongs to the application, not to window closing
    SetExitKey(KEY_NULL);

    if (config.fullscreen) {
        ToggleBorderlessWindowed();
    }

    m_reactive = config.reactive;
    m_tickRate = config.tickRate > 0 ? config.tickRate : 30;
    if (m_reactive) {
        setPacing(FramePacing::WaitForEvents);
        LOG_DEBUG("Window: reactive redraw enabled, {} fps while ticking", m_tickRate);
    }

    m_lastWidth = GetScreenWidth();
    m_lastHeight = GetScreenHeight();
    m_initialized = true;
    return true;
}

void Window::setPacing(FramePacing pacing) {
    if (pacing == m_pacing) return;

    if (pacing == FramePacing::WaitForEvents) {
        SetTargetFPS(0);
        EnableEventWaiting();
    } else {
        DisableEventWaiting();
        SetTargetFPS(pacing == FramePacing::Ticking ? m_tickRate : 0);
    }
    LOG_TRACE("Window: pacing {} -> {}", framePacingName(m_pacing), framePacingName(pacing));
    m_pacing = pacing;
}

void Window::shutdown() {
    if (m_initialized) {
        CloseWindow();
        m_initialized = false;
    }
}

bool Window::shouldClose() const {
    return WindowShouldClose();
}

int Window::getWidth() const {
    return GetScreenWidth();
}

int Window::getHeight() const {
    return GetScreenHeight();
}

void Window::setTitle(const std::string& title) {
    SetWindowTitle(title.c_str());
}

void Window::toggleFullscreen() {
    ToggleBorderlessWindowed();
}

bool Window::isFocused() const {
    return IsWindowFocused();
}

bool Window::pollSizeChanged() {
    int w = getWidth();
    int h = getHeight();
    if (w != m_lastWidth || h != m_lastHeight) {
        m_lastWidth = w;
        m_lastHeight = h;
        return true;
    }
    return false;
}

void Window::setCursor(CursorShape shape) {
    if (shape == m_cursor) return;
    m_cursor = shape;

    int cursor = MOUSE_CURSOR_DEFAULT;
    switch (shape) {
        case CursorShape::Default:    cursor = MOUSE_CURSOR_DEFAULT; break;
        case CursorShape::ResizeEW:   cursor = MOUSE_CURSOR_RESIZE_EW; break;
        case CursorShape::ResizeNS:   cursor = MOUSE_CURSOR_RESIZE_NS; break;
        case CursorShape::ResizeNWSE: cursor = MOUSE_CURSOR_RESIZE_NWSE; break;
        case CursorShape::ResizeNESW: cursor = MOUSE_CURSOR_RESIZE_NESW; break;
        // raylib has no grab cursors; use the closest system shapes
        case CursorShape::Grab:       cursor = MOUSE_CURSOR_POINTING_HAND; break;
        case CursorShape::Grabbing:   cursor = MOUSE_CURSOR_RESIZE_ALL; break;
    }
    SetMouseCursor(cursor);
}

std::vector<std::string> Window::takeDroppedFiles() {
    std::vector<std::string> paths;
    if (!IsFileDropped()) {
        return paths;
    }

    FilePathList dropped = LoadDroppedFiles();
    paths.reserve(dropped.count);
    for (unsigned int i = 0; i < dropped.count; ++i) {
        paths.emplace_back(dropped.paths[i]);
    }
    UnloadDroppedFiles(dropped);

    LOG_DEBUG("Window: {} file(s) dropped", paths.size());
    return paths;
}

} // namespace neta
