#pragma once

#include "ui/UITypes.hpp"

#include <string>
#include <vector>
#include <memory>

namespace neta {

class IRenderer;

/// Node of a screen's widget tree.  A node owns its children; the parent
/// link is a plain back pointer.
class UIElement {
public:
    explicit UIElement(UIElementType type, const std::string& id = "");
    virtual ~UIElement() = default;

    UIElement(const UIElement&) = delete;
    UIElement& operator=(const UIElement&) = delete;

    UIElementType getType() const { return m_type; }
    const std::string& getId() const { return m_id; }

    UIStyle& getStyle() { return m_style; }
    const UIStyle& getStyle() const { return m_style; }

    bool isVisible() const { return m_style.visible; }
    void setVisible(bool visible) { m_style.visible = visible; }

    const UIComputedLayout& getLayout() const { return m_layout; }
    UIComputedLayout& getLayoutMut() { return m_layout; }

    void addChild(std::shared_ptr<UIElement> child);
    void removeChild(const std::string& id);
    void clearChildren();
    const std::vector<std::shared_ptr<UIElement>>& getChildren() const { return m_children; }
    size_t getChildCount() const { return m_children.size(); }
    UIElement* getParent() const { return m_parent; }

    UIElement* findById(const std::string& id);
    const UIElement* findById(const std::string& id) const;

    /// Deepest visible solid element under the point, or nullptr
    const UIElement* hitTest(float mx, float my) const;

    /// Renderer used to measure text for Auto sizing.  Applied to the subtree.
    void setMeasureRenderer(IRenderer* renderer);

    virtual void render(IRenderer* renderer) const;

    /// Primary button.  True when the press or release landed on this subtree.
    virtual bool handleMousePress(float mx, float my);
    virtual bool handleMouseRelease(float mx, float my);

    /// Refresh hover flags.  True when this element became hovered.
    bool handleMouseMove(float mx, float my);

    bool isHovered() const { return m_hovered; }

    bool isPressed() const { return m_pressed; }
    void setPressed(bool pressed) { m_pressed = pressed; }

    /// Natural size without padding, used for Auto dimensions
    virtual float getContentWidth() const { return 0.0f; }
    virtual float getContentHeight() const { return 0.0f; }

protected:
    /// Solid elements take hits and swallow presses
    virtual bool isSolid() const;

    void renderBackground(IRenderer* renderer) const;
    void renderBorder(IRenderer* renderer) const;
    void renderChildren(IRenderer* renderer) const;

    /// Text width through the measuring renderer, estimated without one
    float measureText(const std::string& text) const;

    UIElementType m_type;
    std::string m_id;
    UIStyle m_style;
    UIComputedLayout m_layout;

    std::vector<std::shared_ptr<UIElement>> m_children;
    UIElement* m_parent = nullptr;
    IRenderer* m_measureRenderer = nullptr;

    bool m_hovered = false;
    bool m_pressed = false;
};

} // namespace neta
