#include "dev/PickingDebugOverlay.hpp"
#include "ecs/Components.hpp"
#include "picking/Picking.hpp"

#include <algorithm>
#include <cstdio>

namespace neta {

namespace {

std::string displayName(const Registry& registry, Entity entity) {
    std::string label = entityLabel(entity);
    if (const Name* name = registry.tryGet<Name>(entity)) {
        label += " " + name->value;
    }
    return label;
}

} // namespace

std::vector<std::string> PickingDebugOverlay::describe(const Registry& registry,
                                                       const Camera& camera,
                                                       const Picker& picker, Vec2 pointer,
                                                       Entity hovered) const {
    std::vector<std::string> lines;
    char buf[128];

    Vec2 world = camera.screenToWorld(pointer);
    snprintf(buf, sizeof(buf), "screen (%.0f, %.0f)  world (%.1f, %.1f)",
             pointer.x, pointer.y, world.x, world.y);
    lines.emplace_back(buf);

    lines.push_back("hovered: " + (hovered == NullEntity ? std::string("none")
                                                         : displayName(registry, hovered)));

    for (const PickHit& hit : picker.pickAll(registry, camera, pointer)) {
        snprintf(buf, sizeof(buf), "  %s depth %.5f",
                 hit.order > 0 ? "overlay" : "world", hit.depth);
        lines.push_back(displayName(registry, hit.entity) + buf);
    }
    return lines;
}

void PickingDebugOverlay::render(IRenderer& renderer, const Registry& registry,
                                 const Camera& camera, const Picker& picker, Vec2 pointer,
                                 Entity hovered) const {
    if (!m_visible) return;

    auto lines = describe(registry, camera, picker, pointer, hovered);

    int width = 0;
    for (const auto& line : lines) {
        width = std::max(width, renderer.measureTextWidth(line, kFontSize));
    }
    float height = static_cast<float>(lines.size() * kLineHeight + kPadding * 2);
    float panelWidth = static_cast<float>(width + kPadding * 2);

    // Keep the panel on screen
    float x = std::min(pointer.x + kCursorOffset,
                       static_cast<float>(renderer.getScreenWidth()) - panelWidth);
    float y = std::min(pointer.y + kCursorOffset,
                       static_cast<float>(renderer.getScreenHeight()) - height);
    x = std::max(x, 0.0f);
    y = std::max(y, 0.0f);

    renderer.drawRectangle(Rect(x, y, panelWidth, height), Color(0, 0, 0, 180));

    float lineY = y + kPadding;
    for (size_t i = 0; i < lines.size(); ++i) {
        Color color = i == 1 && hovered != NullEntity ? Color::Green() : Color::White();
        renderer.drawText(lines[i], {x + kPadding, lineY}, kFontSize, color);
        lineY += kLineHeight;
    }
}

} // namespace neta
