#include "ui/UIWidgets.hpp"
#include "rendering/Texture.hpp"

#include <algorithm>
#include <cmath>

namespace neta {

namespace {

constexpr float SCROLL_STEP = 30.0f;
constexpr float SCROLLBAR_WIDTH = 4.0f;
constexpr float SCROLLBAR_MIN_LENGTH = 20.0f;

const Color BUTTON_FILL(60, 60, 80, 255);
const Color BUTTON_HOVER(80, 80, 110, 255);
const Color BUTTON_HELD(40, 40, 60, 255);
const Color BUTTON_EDGE(100, 100, 130, 255);

/// Outer extent of a child along one axis, margins included.  Percent and
/// grow sizes depend on the parent, so they count as their content.
float childExtent(const UIElement& child, bool horizontal) {
    const UIStyle& cs = child.getStyle();
    const UIDimension& dim = cs.size(horizontal);
    float content = horizontal ? child.getContentWidth() : child.getContentHeight();
    float size = dim.mode == SizeMode::Fixed ? dim.value : content + cs.padding.along(horizontal);
    return cs.constrain(size, horizontal) + cs.margin.along(horizontal);
}

/// Children stack along the main axis and share the cross axis
float wrapChildren(const UIElement& element, bool horizontal) {
    bool mainAxis = element.getStyle().isRow() == horizontal;
    float total = 0.0f;
    int count = 0;
    for (const auto& child : element.getChildren()) {
        if (!child->isVisible()) continue;
        float extent = childExtent(*child, horizontal);
        total = mainAxis ? total + extent : std::max(total, extent);
        ++count;
    }
    if (mainAxis && count > 1) {
        total += element.getStyle().gap * static_cast<float>(count - 1);
    }
    return total;
}

} // namespace

// ---------------------------------------------------------------------------
// UIBox
// ---------------------------------------------------------------------------

float UIBox::getContentWidth() const {
    return wrapChildren(*this, true);
}

float UIBox::getContentHeight() const {
    return wrapChildren(*this, false);
}

// ---------------------------------------------------------------------------
// UIText
// ---------------------------------------------------------------------------

float UIText::getContentHeight() const {
    return m_text.empty() ? 0.0f : static_cast<float>(m_style.fontSize);
}

void UIText::render(IRenderer* renderer) const {
    if (!m_style.visible || m_text.empty()) return;
    renderBackground(renderer);

    float x = m_layout.x + m_style.padding.left;
    if (m_style.textAlign != TextAlign::Left) {
        float slack = m_layout.width - m_style.padding.horizontal()
                    - static_cast<float>(renderer->measureTextWidth(m_text, m_style.fontSize));
        x += m_style.textAlign == TextAlign::Center ? slack * 0.5f : slack;
    }
    renderer->drawText(m_text, {x, m_layout.y + m_style.padding.top},
                       m_style.fontSize, m_style.textColor);
    renderBorder(renderer);
}

// ---------------------------------------------------------------------------
// UIButton
// ---------------------------------------------------------------------------

UIButton::UIButton(const std::string& id, const std::string& label)
    : UIElement(UIElementType::Button, id), m_label(label)
{
    m_style.backgroundColor = BUTTON_FILL;
    m_style.border = {1.0f, BUTTON_EDGE};
    m_style.padding = UIEdges(8, 16);
}

void UIButton::setImages(const Texture* normal, const Texture* pressed, float sliceBorder) {
    m_normalImage = normal;
    m_pressedImage = pressed;
    m_sliceBorder = sliceBorder;
}

const Texture* UIButton::getCurrentImage() const {
    return (m_pressed && m_pressedImage) ? m_pressedImage : m_normalImage;
}

void UIButton::render(IRenderer* renderer) const {
    if (!m_style.visible) return;

    Rect box = m_layout.toRect();
    if (const Texture* image = getCurrentImage()) {
        renderer->drawTextureNineSlice(image, box, m_sliceBorder);
    } else {
        Color fill = m_pressed ? BUTTON_HELD : (m_hovered ? BUTTON_HOVER : m_style.backgroundColor);
        if (fill.a > 0) renderer->drawRectangle(box, fill);
        renderBorder(renderer);
    }

    if (!m_label.empty()) {
        float labelWidth = static_cast<float>(renderer->measureTextWidth(m_label, m_style.fontSize));
        Vec2 at(box.x + (box.width - labelWidth) * 0.5f,
                box.y + (box.height - static_cast<float>(m_style.fontSize)) * 0.5f);
        renderer->drawText(m_label, at, m_style.fontSize, m_style.textColor);
    }
    renderChildren(renderer);
}

bool UIButton::handleMousePress(float mx, float my) {
    if (!m_style.visible || !m_layout.containsPoint(mx, my)) return false;
    m_pressed = true;
    return true;
}

bool UIButton::handleMouseRelease(float mx, float my) {
    if (!m_style.visible || !m_pressed) return false;
    m_pressed = false;
    if (m_onClick && m_layout.containsPoint(mx, my)) m_onClick();
    return true;
}

// ---------------------------------------------------------------------------
// UIScrollPanel
// ---------------------------------------------------------------------------

float UIScrollPanel::getContentHeight() const {
    // Rows were placed shifted up by the offset
    float top = m_layout.y + m_style.padding.top - m_scrollY;
    float bottom = top;
    for (const auto& child : m_children) {
        if (!child->isVisible()) continue;
        const auto& cl = child->getLayout();
        bottom = std::max(bottom, cl.y + cl.height + child->getStyle().margin.bottom);
    }
    return bottom - top;
}

float UIScrollPanel::getContentWidth() const {
    float widest = 0.0f;
    for (const auto& child : m_children) {
        if (child->isVisible()) widest = std::max(widest, child->getLayout().width);
    }
    return widest;
}

void UIScrollPanel::handleScroll(float wheel) {
    float view = m_layout.height - m_style.padding.vertical();
    float range = std::max(0.0f, getContentHeight() - view);
    m_scrollY = std::clamp(m_scrollY - wheel * SCROLL_STEP, 0.0f, range);
}

void UIScrollPanel::render(IRenderer* renderer) const {
    if (!m_style.visible) return;
    renderBackground(renderer);

    float viewTop = m_layout.y;
    float viewBottom = m_layout.y + m_layout.height;
    for (const auto& child : m_children) {
        const auto& cl = child->getLayout();
        if (cl.y + cl.height < viewTop || cl.y > viewBottom) continue;
        child->render(renderer);
    }

    float view = m_layout.height - m_style.padding.vertical();
    float content = getContentHeight();
    if (view > 0.0f && content > view) {
        float length = std::max(SCROLLBAR_MIN_LENGTH, view * view / content);
        Rect bar(m_layout.x + m_layout.width - SCROLLBAR_WIDTH - 2.0f,
                 m_layout.y + m_style.padding.top + m_scrollY / content * view,
                 SCROLLBAR_WIDTH, length);
        renderer->drawRectangle(bar, Color(150, 150, 150, 120));
    }
    renderBorder(renderer);
}

bool UIScrollPanel::handleMousePress(float mx, float my) {
    if (!m_style.visible || !m_layout.containsPoint(mx, my)) return false;
    for (auto it = m_children.rbegin(); it != m_children.rend(); ++it) {
        if ((*it)->handleMousePress(mx, my)) return true;
    }
    return true;
}

} // namespace neta
