#pragma once

#include "ui/UIElement.hpp"
#include "rendering/IRenderer.hpp"

#include <string>

namespace neta {

/// Plain container.  Auto-sized boxes wrap their visible children.
class UIBox : public UIElement {
public:
    explicit UIBox(const std::string& id = "")
        : UIElement(UIElementType::Box, id) {}

    float getContentWidth() const override;
    float getContentHeight() const override;
};

/// Single line of text
class UIText : public UIElement {
public:
    explicit UIText(const std::string& id = "", const std::string& text = "")
        : UIElement(UIElementType::Text, id), m_text(text) {}

    void setText(const std::string& text) { m_text = text; }
    const std::string& getText() const { return m_text; }

    float getContentWidth() const override { return measureText(m_text); }
    float getContentHeight() const override;

    void render(IRenderer* renderer) const override;

private:
    std::string m_text;
};

/// Labelled push button.  Fires on a release inside after a press inside.
/// With images set, the normal and pressed images are nine-sliced into the
/// button instead of the flat colors.
class UIButton : public UIElement {
public:
    explicit UIButton(const std::string& id = "", const std::string& label = "");

    const std::string& getLabel() const { return m_label; }
    void setOnClick(UICallback callback) { m_onClick = std::move(callback); }

    /// `pressed` may be null to keep `normal` while held
    void setImages(const Texture* normal, const Texture* pressed, float sliceBorder);
    const Texture* getCurrentImage() const;

    float getContentWidth() const override { return measureText(m_label); }
    float getContentHeight() const override { return static_cast<float>(m_style.fontSize); }

    void render(IRenderer* renderer) const override;

    bool handleMousePress(float mx, float my) override;
    bool handleMouseRelease(float mx, float my) override;

protected:
    bool isSolid() const override { return true; }

private:
    std::string m_label;
    UICallback m_onClick;
    const Texture* m_normalImage = nullptr;
    const Texture* m_pressedImage = nullptr;
    float m_sliceBorder = 0.0f;
};

/// Vertical list clipped to its box and scrolled by the wheel.  Rows outside
/// the view are skipped when drawing.
class UIScrollPanel : public UIElement {
public:
    explicit UIScrollPanel(const std::string& id = "")
        : UIElement(UIElementType::ScrollPanel, id) {}

    float getScrollY() const { return m_scrollY; }
    void setScrollY(float offset) { m_scrollY = offset; }

    /// Height of the rows from the last layout, independent of the offset
    float getContentHeight() const override;
    float getContentWidth() const override;

    void render(IRenderer* renderer) const override;
    bool handleMousePress(float mx, float my) override;

    /// Wheel units; positive scrolls toward the top
    void handleScroll(float wheel);

protected:
    bool isSolid() const override { return true; }

private:
    float m_scrollY = 0.0f;
};

} // namespace neta
