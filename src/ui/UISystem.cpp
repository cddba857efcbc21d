#include "ui/UISystem.hpp"
#include "engine/Log.hpp"
#include "rendering/IRenderer.hpp"

#include <algorithm>

namespace neta {

bool UISystem::init(IRenderer* renderer) {
    if (!renderer) {
        LOG_ERROR("UISystem: no renderer");
        return false;
    }
    m_renderer = renderer;
    m_layout.setRenderer(renderer);
    LOG_INFO("UISystem: initialized");
    return true;
}

void UISystem::shutdown() {
    m_screens.clear();
    LOG_INFO("UISystem: shut down");
}

void UISystem::update(const PointerState& pointer) {
    m_consumedInput = false;
    if (!m_config.enabled || !m_renderer) return;

    float screenW = static_cast<float>(m_renderer->getScreenWidth());
    float screenH = static_cast<float>(m_renderer->getScreenHeight());

    auto screens = visibleInOrder();
    for (const ScreenEntry* entry : screens) {
        m_layout.computeLayout(entry->root.get(), screenW, screenH);
    }

    for (auto it = screens.rbegin(); it != screens.rend(); ++it) {
        if (routeButton((*it)->root.get(), pointer)) {
            m_consumedInput = true;
            break;
        }
    }
    if (pointer.wheel != 0.0f) {
        for (auto it = screens.rbegin(); it != screens.rend(); ++it) {
            if (routeWheel((*it)->root.get(), pointer.position, pointer.wheel)) break;
        }
    }
}

bool UISystem::routeButton(UIElement* root, const PointerState& pointer) {
    float mx = pointer.position.x;
    float my = pointer.position.y;
    root->handleMouseMove(mx, my);

    bool taken = false;
    if (pointer.isPressed(MouseButton::Left)) taken = root->handleMousePress(mx, my);
    if (pointer.isReleased(MouseButton::Left)) taken = root->handleMouseRelease(mx, my) || taken;
    return taken;
}

bool UISystem::routeWheel(UIElement* element, Vec2 position, float wheel) {
    if (!element->isVisible() || !element->getLayout().containsPoint(position.x, position.y)) {
        return false;
    }
    const auto& children = element->getChildren();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if (routeWheel(it->get(), position, wheel)) return true;
    }
    if (element->getType() != UIElementType::ScrollPanel) return false;
    static_cast<UIScrollPanel*>(element)->handleScroll(wheel);
    return true;
}

void UISystem::render() {
    if (!m_config.enabled || !m_renderer) return;
    for (const ScreenEntry* entry : visibleInOrder()) entry->root->render(m_renderer);
}

void UISystem::registerScreen(const std::string& name, std::shared_ptr<UIElement> root) {
    m_layout.prepareMeasurement(root.get());
    ScreenEntry& entry = m_screens[name] = ScreenEntry{};
    entry.name = name;
    entry.root = std::move(root);
    LOG_DEBUG("UISystem: registered screen '{}'", name);
}

void UISystem::removeScreen(const std::string& name) {
    m_screens.erase(name);
}

UISystem::ScreenEntry* UISystem::find(const std::string& name) {
    auto it = m_screens.find(name);
    return it != m_screens.end() ? &it->second : nullptr;
}

void UISystem::showScreen(const std::string& name) {
    ScreenEntry* entry = find(name);
    if (!entry) {
        LOG_WARN("UISystem: cannot show unknown screen '{}'", name);
        return;
    }
    entry->visible = true;
}

void UISystem::hideScreen(const std::string& name) {
    if (ScreenEntry* entry = find(name)) entry->visible = false;
}

bool UISystem::isScreenVisible(const std::string& name) const {
    auto it = m_screens.find(name);
    return it != m_screens.end() && it->second.visible;
}

void UISystem::setScreenZOrder(const std::string& name, int zOrder) {
    if (ScreenEntry* entry = find(name)) entry->zOrder = zOrder;
}

UIElement* UISystem::getScreen(const std::string& name) {
    ScreenEntry* entry = find(name);
    return entry ? entry->root.get() : nullptr;
}

bool UISystem::isPointerOver(Vec2 position) const {
    if (!m_config.enabled) return false;

    auto screens = visibleInOrder();
    return std::any_of(screens.begin(), screens.end(), [&](const ScreenEntry* entry) {
        return entry->root->hitTest(position.x, position.y) != nullptr;
    });
}

std::vector<const UISystem::ScreenEntry*> UISystem::visibleInOrder() const {
    std::vector<const ScreenEntry*> screens;
    for (const auto& [name, entry] : m_screens) {
        if (entry.visible && entry.root) screens.push_back(&entry);
    }
    std::sort(screens.begin(), screens.end(), [](const ScreenEntry* a, const ScreenEntry* b) {
        return a->zOrder != b->zOrder ? a->zOrder < b->zOrder : a->name < b->name;
    });
    return screens;
}

} // namespace neta
