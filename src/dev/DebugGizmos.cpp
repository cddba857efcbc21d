#include "dev/DebugGizmos.hpp"

#include <algorithm>

namespace neta {

// =========================================================================
// GizmoPainter
// =========================================================================

void GizmoPainter::line(Vec2 from, Vec2 to, const Color& color, float thickness) {
    m_renderer.drawLine(m_camera.worldToScreen(from), m_camera.worldToScreen(to), color, thickness);
}

void GizmoPainter::polygon(const std::vector<Vec2>& points, const Color& color, float thickness) {
    if (points.size() < 2) return;

    std::vector<Vec2> screen;
    screen.reserve(points.size());
    for (const Vec2& p : points) {
        screen.push_back(m_camera.worldToScreen(p));
    }
    m_renderer.drawPolyline(screen, true, color, thickness);
}

void GizmoPainter::circle(Vec2 center, float radius, const Color& color, float thickness) {
    m_renderer.drawCircleOutline(m_camera.worldToScreen(center), radius * m_camera.getZoom(),
                                 color, thickness);
}

void GizmoPainter::point(Vec2 position, const Color& color, float pixels) {
    m_renderer.drawCircle(m_camera.worldToScreen(position), pixels, color);
}

void GizmoPainter::text(const std::string& text, Vec2 position, const Color& color, int fontSize) {
    m_renderer.drawText(text, m_camera.worldToScreen(position), fontSize, color);
}

// =========================================================================
// DebugGizmos
// =========================================================================

void DebugGizmos::add(Command command, float timeout) {
    if (!command) return;
    m_commands.push_back({timeout, std::move(command)});
}

void DebugGizmos::update(float dt) {
    for (auto& entry : m_commands) {
        entry.remaining -= dt;
    }
    m_commands.erase(
        std::remove_if(m_commands.begin(), m_commands.end(),
            [](const Entry& entry) { return entry.remaining <= 0.0f; }),
        m_commands.end());
}

void DebugGizmos::render(IRenderer& renderer, const Camera& camera) {
    if (!m_enabled) return;

    GizmoPainter painter(renderer, camera);
    for (auto& entry : m_commands) {
        entry.command(painter);
    }
}

} // namespace neta
