#pragma once

#include "ui/UIElement.hpp"
#include "rendering/IRenderer.hpp"

namespace neta {

/// Single-line flex layout.  Each container stacks its visible children
/// along its direction, distributes leftover space to Grow children, then
/// places them on the cross axis.  Scroll panels stack vertically with no
/// bound on their content.
class UILayout {
public:
    UILayout() = default;

    /// Renderer used to measure text; handed to trees in prepareMeasurement
    void setRenderer(IRenderer* renderer) { m_renderer = renderer; }

    /// Lay out a whole screen.  An absolute root is placed at its
    /// `left`/`top`, any other root at the origin.
    void computeLayout(UIElement* root, float availableWidth, float availableHeight);

    /// Hand the measuring renderer to a freshly built tree
    void prepareMeasurement(UIElement* root) const;

private:
    /// Place the children of an element whose own box is already final
    void arrangeChildren(UIElement* element);

    IRenderer* m_renderer = nullptr;
};

} // namespace neta
