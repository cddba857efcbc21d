#include "ui/UILayout.hpp"
#include "ui/UIWidgets.hpp"

#include <algorithm>
#include <vector>

namespace neta {

namespace {

/// Padded content size along one axis
float naturalSize(const UIElement& element, bool horizontal) {
    float content = horizontal ? element.getContentWidth() : element.getContentHeight();
    return content + element.getStyle().padding.along(horizontal);
}

/// Border-box size along one axis inside `available` space.  Grow resolves
/// to the whole space; containers share it out afterwards.
float sizeOn(const UIElement& element, bool horizontal, float available) {
    const UIStyle& style = element.getStyle();
    const UIDimension& dim = style.size(horizontal);
    float size = naturalSize(element, horizontal);
    switch (dim.mode) {
        case SizeMode::Fixed:   size = dim.value; break;
        case SizeMode::Percent: size = available * dim.value / 100.0f; break;
        case SizeMode::Grow:    size = available; break;
        case SizeMode::Auto:    break;
    }
    return style.constrain(size, horizontal);
}

struct Slot {
    UIElement* element = nullptr;
    float main = 0.0f;
    float grow = 0.0f;
};

} // namespace

void UILayout::computeLayout(UIElement* root, float availableWidth, float availableHeight) {
    if (!root) return;

    const UIStyle& style = root->getStyle();
    UIComputedLayout& box = root->getLayoutMut();
    bool placed = style.position == PositionType::Absolute;
    box.x = (placed ? style.left : 0.0f) + style.margin.left;
    box.y = (placed ? style.top : 0.0f) + style.margin.top;
    box.width = sizeOn(*root, true, availableWidth);
    box.height = sizeOn(*root, false, availableHeight);

    arrangeChildren(root);
}

void UILayout::prepareMeasurement(UIElement* root) const {
    if (root) root->setMeasureRenderer(m_renderer);
}

void UILayout::arrangeChildren(UIElement* element) {
    const UIStyle& style = element->getStyle();
    const UIComputedLayout& box = element->getLayout();

    // Scroll panels are unbounded columns shifted by their offset
    bool scrolling = element->getType() == UIElementType::ScrollPanel;
    bool mainX = !scrolling && style.isRow();
    bool crossX = !mainX;

    float innerMain = box.extent(mainX) - style.padding.along(mainX);
    float innerCross = box.extent(crossX) - style.padding.along(crossX);
    float mainStart = box.origin(mainX) + style.padding.leading(mainX);
    float crossStart = box.origin(crossX) + style.padding.leading(crossX);
    if (scrolling) {
        mainStart -= static_cast<const UIScrollPanel*>(element)->getScrollY();
    }

    // Measure along the main axis
    std::vector<Slot> slots;
    float used = 0.0f;
    float weights = 0.0f;
    for (const auto& child : element->getChildren()) {
        if (!child->isVisible()) continue;
        Slot slot;
        slot.element = child.get();
        const UIDimension& dim = child->getStyle().size(mainX);
        if (dim.mode == SizeMode::Grow && !scrolling) {
            slot.grow = dim.value > 0.0f ? dim.value : 1.0f;
            weights += slot.grow;
        } else {
            slot.main = sizeOn(*child, mainX, innerMain);
        }
        used += slot.main + child->getStyle().margin.along(mainX);
        slots.push_back(slot);
    }
    if (slots.empty()) return;
    used += style.gap * static_cast<float>(slots.size() - 1);

    // Leftover space goes to Grow children by weight
    if (weights > 0.0f) {
        float share = std::max(0.0f, innerMain - used) / weights;
        for (Slot& slot : slots) {
            if (slot.grow <= 0.0f) continue;
            slot.main = slot.element->getStyle().constrain(share * slot.grow, mainX);
            used += slot.main;
        }
    }

    float cursor = mainStart;
    float spacing = style.gap;
    if (!scrolling) {
        float slack = innerMain - used;
        switch (style.justifyContent) {
            case JustifyContent::Start:
                break;
            case JustifyContent::Center:
                cursor += slack * 0.5f;
                break;
            case JustifyContent::End:
                cursor += slack;
                break;
            case JustifyContent::SpaceBetween:
                if (slots.size() > 1) spacing += slack / static_cast<float>(slots.size() - 1);
                break;
        }
    }

    for (const Slot& slot : slots) {
        UIElement* child = slot.element;
        const UIStyle& cs = child->getStyle();
        UIComputedLayout& cl = child->getLayoutMut();

        cl.origin(mainX) = cursor + cs.margin.leading(mainX);
        cl.extent(mainX) = slot.main;
        cursor += slot.main + cs.margin.along(mainX) + spacing;

        float size = sizeOn(*child, crossX, innerCross);
        float at = crossStart + cs.margin.leading(crossX);
        switch (style.alignItems) {
            case AlignItems::Start:
                break;
            case AlignItems::Center:
                at = crossStart + (innerCross - size) * 0.5f;
                break;
            case AlignItems::End:
                at = crossStart + innerCross - size - cs.margin.trailing(crossX);
                break;
            case AlignItems::Stretch:
                size = innerCross - cs.margin.along(crossX);
                break;
        }
        cl.origin(crossX) = at;
        cl.extent(crossX) = size;

        arrangeChildren(child);
    }
}

} // namespace neta
