#include "ui/UIElement.hpp"
#include "rendering/IRenderer.hpp"

#include <algorithm>

namespace neta {

UIElement::UIElement(UIElementType type, const std::string& id)
    : m_type(type), m_id(id) {}

void UIElement::addChild(std::shared_ptr<UIElement> child) {
    child->m_parent = this;
    child->setMeasureRenderer(m_measureRenderer);
    m_children.push_back(std::move(child));
}

void UIElement::removeChild(const std::string& id) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
        [&id](const std::shared_ptr<UIElement>& child) { return child->m_id == id; });
    if (it == m_children.end()) return;
    (*it)->m_parent = nullptr;
    m_children.erase(it);
}

void UIElement::clearChildren() {
    for (auto& child : m_children) child->m_parent = nullptr;
    m_children.clear();
}

UIElement* UIElement::findById(const std::string& id) {
    return const_cast<UIElement*>(static_cast<const UIElement*>(this)->findById(id));
}

const UIElement* UIElement::findById(const std::string& id) const {
    if (m_id == id) return this;
    for (const auto& child : m_children) {
        if (const UIElement* found = child->findById(id)) return found;
    }
    return nullptr;
}

bool UIElement::isSolid() const {
    return m_style.backgroundColor.a > 0 || m_style.backgroundImage != nullptr;
}

const UIElement* UIElement::hitTest(float mx, float my) const {
    if (!m_style.visible) return nullptr;

    // Later children draw on top, and may stick out of their parent
    for (auto it = m_children.rbegin(); it != m_children.rend(); ++it) {
        if (const UIElement* hit = (*it)->hitTest(mx, my)) return hit;
    }
    if (isSolid() && m_layout.containsPoint(mx, my)) return this;
    return nullptr;
}

void UIElement::setMeasureRenderer(IRenderer* renderer) {
    m_measureRenderer = renderer;
    for (auto& child : m_children) child->setMeasureRenderer(renderer);
}

float UIElement::measureText(const std::string& text) const {
    if (text.empty()) return 0.0f;
    if (m_measureRenderer) {
        return static_cast<float>(m_measureRenderer->measureTextWidth(text, m_style.fontSize));
    }
    return static_cast<float>(text.size()) * static_cast<float>(m_style.fontSize) * 0.6f;
}

void UIElement::render(IRenderer* renderer) const {
    if (!m_style.visible) return;
    renderBackground(renderer);
    renderBorder(renderer);
    renderChildren(renderer);
}

bool UIElement::handleMousePress(float mx, float my) {
    if (!m_style.visible || !m_layout.containsPoint(mx, my)) return false;

    for (auto it = m_children.rbegin(); it != m_children.rend(); ++it) {
        if ((*it)->handleMousePress(mx, my)) return true;
    }
    return hitTest(mx, my) != nullptr;
}

bool UIElement::handleMouseRelease(float mx, float my) {
    if (!m_style.visible) return false;

    // Buttons finish their press wherever the release lands
    bool handled = false;
    for (auto it = m_children.rbegin(); it != m_children.rend() && !handled; ++it) {
        handled = (*it)->handleMouseRelease(mx, my);
    }
    return handled;
}

bool UIElement::handleMouseMove(float mx, float my) {
    if (!m_style.visible) return false;

    bool entered = !m_hovered;
    m_hovered = m_layout.containsPoint(mx, my);
    for (auto& child : m_children) child->handleMouseMove(mx, my);
    return m_hovered && entered;
}

void UIElement::renderBackground(IRenderer* renderer) const {
    Rect box = m_layout.toRect();
    if (m_style.backgroundColor.a > 0) {
        renderer->drawRectangle(box, m_style.backgroundColor);
    }
    if (m_style.backgroundImage) {
        renderer->drawTextureNineSlice(m_style.backgroundImage, box, m_style.imageSliceBorder);
    }
}

void UIElement::renderBorder(IRenderer* renderer) const {
    if (m_style.border.width > 0.0f) {
        renderer->drawRectangleOutline(m_layout.toRect(), m_style.border.color, m_style.border.width);
    }
}

void UIElement::renderChildren(IRenderer* renderer) const {
    for (const auto& child : m_children) child->render(renderer);
}

} // namespace neta
