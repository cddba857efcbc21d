#pragma once

#include "rendering/Camera.hpp"
#include "rendering/IRenderer.hpp"

#include <functional>
#include <string>
#include <vector>

namespace neta {

/// World-space drawing handed to gizmo commands.  Positions and sizes are in
/// world units and follow the camera.
class GizmoPainter {
public:
    GizmoPainter(IRenderer& renderer, const Camera& camera)
        : m_renderer(renderer), m_camera(camera) {}

    void line(Vec2 from, Vec2 to, const Color& color, float thickness = 1.0f);

    /// Closed outline through `points`
    void polygon(const std::vector<Vec2>& points, const Color& color, float thickness = 1.0f);

    void circle(Vec2 center, float radius, const Color& color, float thickness = 1.0f);

    /// Filled dot of a fixed pixel size
    void point(Vec2 position, const Color& color, float pixels = 3.0f);

    void text(const std::string& text, Vec2 position, const Color& color = Color::White(),
              int fontSize = 14);

private:
    IRenderer& m_renderer;
    const Camera& m_camera;
};

/// Drawing commands that stay on screen for a while (30 s by default), used
/// to look at intermediate geometry such as packing polygons.
class DebugGizmos {
public:
    using Command = std::function<void(GizmoPainter&)>;

    static constexpr float DEFAULT_TIMEOUT = 30.0f;

    DebugGizmos() = default;

    /// Queue a command, drawn every frame until `timeout` seconds have passed
    void add(Command command, float timeout = DEFAULT_TIMEOUT);

    /// Age the commands and drop expired ones
    void update(float dt);

    /// Draw every live command (overlay pass)
    void render(IRenderer& renderer, const Camera& camera);

    void clear() { m_commands.clear(); }
    size_t commandCount() const { return m_commands.size(); }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

private:
    struct Entry {
        float remaining = 0.0f;
        Command command;
    };

    std::vector<Entry> m_commands;
    bool m_enabled = true;
};

} // namespace neta
