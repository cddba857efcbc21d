#pragma once

#include "ecs/Components.hpp"
#include "ui/UISystem.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace neta {

/// Entity inspector panels.  Every open() adds another panel, offset from the
/// previous one, listing all entities as a tree along their Parent links
/// with their name and components.
class Inspector {
public:
    static constexpr float PANEL_WIDTH = 360.0f;
    static constexpr float PANEL_HEIGHT = 420.0f;
    static constexpr float PANEL_MARGIN = 20.0f;
    /// Offset between consecutive panels
    static constexpr float CASCADE_STEP = 20.0f;
    static constexpr int FONT_SIZE = 14;

    Inspector(Registry& registry, UISystem& ui) : m_registry(registry), m_ui(ui) {}
    ~Inspector();

    Inspector(const Inspector&) = delete;
    Inspector& operator=(const Inspector&) = delete;

    /// Open a new panel.  Returns its screen name ("inspector_<n>").
    std::string open();

    /// Hide a panel; it is dropped on the next refresh()
    void close(const std::string& screenName);
    void closeAll();

    /// Drop closed panels and rebuild the entity list of the others
    void refresh();

    /// Panels not closed yet
    size_t openCount() const {
        return static_cast<size_t>(std::count_if(m_panels.begin(), m_panels.end(),
            [](const Panel& panel) { return !panel.closing; }));
    }

    /// One list line per entity, depth-first along Parent links, roots first
    std::vector<std::string> describeEntities() const;

    /// Names of the known components attached to `entity`
    static std::vector<std::string> componentNames(const Registry& registry, Entity entity);

private:
    struct Panel {
        std::string screen;
        bool closing = false;
    };

    /// Entity list of a registered panel, or null when its screen is gone
    UIScrollPanel* findList(const std::string& screen) const;

    void fillList(UIScrollPanel& list) const;
    void describeTree(Entity entity, int depth,
                      const std::vector<std::pair<Entity, Entity>>& parents,
                      std::vector<std::string>& lines) const;

    Registry& m_registry;
    UISystem& m_ui;
    std::vector<Panel> m_panels;
    int m_nextId = 1;
};

} // namespace neta
