#pragma once

#include "engine/FramePacing.hpp"

#include <string>
#include <vector>

namespace neta {

/// Mouse cursor shapes the application asks for
enum class CursorShape {
    Default,
    ResizeEW,    // horizontal
    ResizeNS,    // vertical
    ResizeNWSE,  // diagonal, top-left to bottom-right
    ResizeNESW,  // diagonal, top-right to bottom-left
    Grab,
    Grabbing,
};

struct WindowConfig {
    int         width      = 1280;
    int         height     = 720;
    std::string title      = "neta";
    bool        fullscreen = false;
    bool        vsync      = false;
    /// Only redraw when input arrives (desktop-app style)
    bool        reactive   = true;
    /// Frames per second while a reactive window has timed work
    int         tickRate   = 30;
};

class Window {
public:
    bool init(const WindowConfig& config);
    void shutdown();

    bool shouldClose() const;

    int  getWidth() const;
    int  getHeight() const;
    void setTitle(const std::string& title);
    void toggleFullscreen();
    bool isFocused() const;

    /// Returns true once after the framebuffer size changed
    bool pollSizeChanged();

    /// Apply a cursor shape; repeated calls with the same shape are no-ops
    void setCursor(CursorShape shape);
    CursorShape getCursor() const { return m_cursor; }

    /// Paths dropped onto the window since the last call
    std::vector<std::string> takeDroppedFiles();

    bool isReactive() const { return m_reactive; }

    /// Switch event waiting and the frame cap; no-op when unchanged
    void setPacing(FramePacing pacing);
    FramePacing getPacing() const { return m_pacing; }

private:
    bool m_initialized = false;
    bool m_reactive = false;
    int m_tickRate = 30;
    FramePacing m_pacing = FramePacing::Continuous;
    int m_lastWidth = 0;
    int m_lastHeight = 0;
    CursorShape m_cursor = CursorShape::Default;
};

} // namespace neta
