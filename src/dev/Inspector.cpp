#include "dev/Inspector.hpp"
#include "engine/Log.hpp"
#include "picking/PointerEvents.hpp"

#include <algorithm>

namespace neta {

namespace {

const Color PANEL_COLOR = Color(25, 25, 32, 235);
const Color TITLE_COLOR = Color(230, 230, 240, 255);
const Color LINE_COLOR = Color(190, 200, 210, 255);

template<typename Component>
void appendIfPresent(const Registry& registry, Entity entity, const char* name,
                     std::vector<std::string>& out) {
    if (registry.has<Component>(entity)) {
        out.emplace_back(name);
    }
}

} // namespace

Inspector::~Inspector() {
    closeAll();
}

std::vector<std::string> Inspector::componentNames(const Registry& registry, Entity entity) {
    std::vector<std::string> names;
    appendIfPresent<Transform>(registry, entity, "Transform", names);
    appendIfPresent<Sprite>(registry, entity, "Sprite", names);
    appendIfPresent<Parent>(registry, entity, "Parent", names);
    appendIfPresent<Canvas>(registry, entity, "Canvas", names);
    appendIfPresent<ImageFrame>(registry, entity, "ImageFrame", names);
    appendIfPresent<DropImageFrame>(registry, entity, "DropImageFrame", names);
    appendIfPresent<Pickable>(registry, entity, "Pickable", names);
    appendIfPresent<PickingCircle>(registry, entity, "PickingCircle", names);
    appendIfPresent<Overlay>(registry, entity, "Overlay", names);
    appendIfPresent<Hovered>(registry, entity, "Hovered", names);
    appendIfPresent<Selected>(registry, entity, "Selected", names);
    appendIfPresent<ControlHandle>(registry, entity, "ControlHandle", names);
    appendIfPresent<HandlePivot>(registry, entity, "HandlePivot", names);
    appendIfPresent<PointerHandlers>(registry, entity, "PointerHandlers", names);
    return names;
}

std::string Inspector::open() {
    int id = m_nextId++;
    std::string screen = "inspector_" + std::to_string(id);
    float offset = PANEL_MARGIN + CASCADE_STEP * static_cast<float>(m_panels.size());

    auto root = std::make_shared<UIBox>(screen);
    auto& style = root->getStyle();
    style.position = PositionType::Absolute;
    style.left = offset;
    style.top = offset;
    style.width = UIDimension::Fixed(PANEL_WIDTH);
    style.height = UIDimension::Fixed(PANEL_HEIGHT);
    style.flexDirection = FlexDirection::Column;
    style.padding = UIEdges(8.0f);
    style.gap = 6.0f;
    style.backgroundColor = PANEL_COLOR;
    style.border = {1.0f, Color(90, 90, 110, 255)};

    auto header = std::make_shared<UIBox>(screen + "_header");
    header->getStyle().flexDirection = FlexDirection::Row;
    header->getStyle().width = UIDimension::Grow();
    header->getStyle().justifyContent = JustifyContent::SpaceBetween;

    auto title = std::make_shared<UIText>(screen + "_title", "Inspector " + std::to_string(id));
    title->getStyle().fontSize = FONT_SIZE + 2;
    title->getStyle().textColor = TITLE_COLOR;
    header->addChild(title);

    auto closeButton = std::make_shared<UIButton>(screen + "_close", "x");
    closeButton->getStyle().fontSize = FONT_SIZE;
    closeButton->getStyle().padding = UIEdges(2, 8);
    closeButton->setOnClick([this, screen]() { close(screen); });
    header->addChild(closeButton);
    root->addChild(header);

    auto list = std::make_shared<UIScrollPanel>(screen + "_list");
    list->getStyle().width = UIDimension::Grow();
    list->getStyle().height = UIDimension::Grow();
    list->getStyle().gap = 2.0f;
    root->addChild(list);

    fillList(*list);

    m_ui.registerScreen(screen, root);
    m_ui.setScreenZOrder(screen, 50 + id);
    m_ui.showScreen(screen);
    m_panels.push_back({screen});

    LOG_DEBUG("Opened {}", screen);
    return screen;
}

void Inspector::close(const std::string& screenName) {
    auto it = std::find_if(m_panels.begin(), m_panels.end(),
        [&](const Panel& panel) { return panel.screen == screenName; });
    if (it == m_panels.end() || it->closing) return;

    // Runs from the panel's own close button, so the tree is only hidden
    // here and removed on the next refresh()
    m_ui.hideScreen(it->screen);
    it->closing = true;
}

void Inspector::closeAll() {
    for (const auto& panel : m_panels) {
        m_ui.removeScreen(panel.screen);
    }
    m_panels.clear();
}

void Inspector::refresh() {
    for (const auto& panel : m_panels) {
        if (panel.closing) {
            m_ui.removeScreen(panel.screen);
            LOG_DEBUG("Closed {}", panel.screen);
        }
    }
    m_panels.erase(std::remove_if(m_panels.begin(), m_panels.end(),
                       [](const Panel& panel) { return panel.closing; }),
                   m_panels.end());

    for (const auto& panel : m_panels) {
        if (UIScrollPanel* list = findList(panel.screen)) {
            fillList(*list);
        } else {
            LOG_WARN("{} lost its entity list", panel.screen);
        }
    }
}

UIScrollPanel* Inspector::findList(const std::string& screen) const {
    UIElement* root = m_ui.getScreen(screen);
    UIElement* list = root ? root->findById(screen + "_list") : nullptr;
    if (!list || list->getType() != UIElementType::ScrollPanel) return nullptr;
    return static_cast<UIScrollPanel*>(list);
}

void Inspector::fillList(UIScrollPanel& list) const {
    list.clearChildren();
    for (const auto& line : describeEntities()) {
        auto text = std::make_shared<UIText>("", line);
        text->getStyle().fontSize = FONT_SIZE;
        text->getStyle().textColor = LINE_COLOR;
        list.addChild(text);
    }
}

std::vector<std::string> Inspector::describeEntities() const {
    std::vector<std::pair<Entity, Entity>> parents; // (child, parent)
    std::vector<Entity> roots;

    for (Entity entity : m_registry.allEntities()) {
        const Parent* parent = m_registry.tryGet<Parent>(entity);
        if (parent && m_registry.valid(parent->entity)) {
            parents.emplace_back(entity, parent->entity);
        } else {
            roots.push_back(entity);
        }
    }

    std::vector<std::string> lines;
    for (Entity root : roots) {
        describeTree(root, 0, parents, lines);
    }
    return lines;
}

void Inspector::describeTree(Entity entity, int depth,
                             const std::vector<std::pair<Entity, Entity>>& parents,
                             std::vector<std::string>& lines) const {
    std::string line(static_cast<size_t>(depth) * 2, ' ');
    line += entityLabel(entity);
    if (const Name* name = m_registry.tryGet<Name>(entity)) {
        line += " " + name->value;
    }

    auto components = componentNames(m_registry, entity);
    if (!components.empty()) {
        line += " [";
        for (size_t i = 0; i < components.size(); ++i) {
            if (i > 0) line += ", ";
            line += components[i];
        }
        line += "]";
    }
    lines.push_back(std::move(line));

    for (const auto& [child, parent] : parents) {
        if (parent == entity) {
            describeTree(child, depth + 1, parents, lines);
        }
    }
}

} // namespace neta
