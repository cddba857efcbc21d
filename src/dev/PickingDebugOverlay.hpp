#pragma once

#include "ecs/Registry.hpp"
#include "engine/Input.hpp"
#include "rendering/Camera.hpp"
#include "rendering/IRenderer.hpp"

#include <string>
#include <vector>

namespace neta {

class Picker;

/// Screen-space readout of what the pointer hits: pointer position on screen
/// and in the world, and the entities under it top-most first with their
/// layer and depth.  F3 toggles it.
class PickingDebugOverlay {
public:
    void toggle() { m_visible = !m_visible; }
    void setVisible(bool visible) { m_visible = visible; }
    bool isVisible() const { return m_visible; }

    /// Text lines for the current pointer (also what render() draws)
    std::vector<std::string> describe(const Registry& registry, const Camera& camera,
                                      const Picker& picker, Vec2 pointer,
                                      Entity hovered) const;

    /// Draw the readout next to the pointer
    void render(IRenderer& renderer, const Registry& registry, const Camera& camera,
                const Picker& picker, Vec2 pointer, Entity hovered) const;

private:
    static constexpr int kFontSize   = 14;
    static constexpr int kLineHeight = 16;
    static constexpr int kPadding    = 6;
    /// Offset of the panel from the pointer
    static constexpr float kCursorOffset = 16.0f;

    bool m_visible = false;
};

} // namespace neta
