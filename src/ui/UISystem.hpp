#pragma once

#include "ui/UIElement.hpp"
#include "ui/UILayout.hpp"
#include "ui/UIWidgets.hpp"
#include "engine/Input.hpp"

#include <string>
#include <unordered_map>
#include <memory>
#include <vector>

namespace neta {

class IRenderer;

struct UISystemConfig {
    bool enabled = true;
};

/// Screen-space widgets drawn above the board.
///
/// Screens are named trees ("context_menu", "inspector_1", ...) that start
/// hidden.  Each frame update() lays out the visible ones and hands the
/// pointer to them top-most first.  The canvas
/// asks isPointerOver() before picking so widgets hide what is under them.
class UISystem {
public:
    UISystem() = default;

    bool init(IRenderer* renderer);
    void shutdown();

    void update(const PointerState& pointer);

    /// Visible screens, lowest z-order first
    void render();

    void registerScreen(const std::string& name, std::shared_ptr<UIElement> root);

    void removeScreen(const std::string& name);
    bool hasScreen(const std::string& name) const { return m_screens.count(name) > 0; }

    void showScreen(const std::string& name);
    void hideScreen(const std::string& name);
    bool isScreenVisible(const std::string& name) const;

    /// Higher z-order draws on top and gets the pointer first
    void setScreenZOrder(const std::string& name, int zOrder);

    /// Root of a registered screen, visible or not
    UIElement* getScreen(const std::string& name);

    /// A widget took the primary button this frame
    bool didConsumeInput() const { return m_consumedInput; }

    /// A visible screen covers the point in the last layout
    bool isPointerOver(Vec2 position) const;

    const UISystemConfig& getConfig() const { return m_config; }
    void setEnabled(bool enabled) { m_config.enabled = enabled; }

private:
    struct ScreenEntry {
        std::string name;
        std::shared_ptr<UIElement> root;
        bool visible = false;
        int zOrder = 0;
    };

    ScreenEntry* find(const std::string& name);

    /// Visible screens with a tree, lowest z-order first (ties by name)
    std::vector<const ScreenEntry*> visibleInOrder() const;

    /// Press and release of the primary button.  True when a widget took it.
    static bool routeButton(UIElement* root, const PointerState& pointer);

    /// Wheel to the innermost scroll panel under the pointer
    static bool routeWheel(UIElement* element, Vec2 position, float wheel);

    std::unordered_map<std::string, ScreenEntry> m_screens;
    UILayout m_layout;
    UISystemConfig m_config;

    IRenderer* m_renderer = nullptr;
    bool m_consumedInput = false;
};

} // namespace neta
