#pragma once

#include "rendering/IRenderer.hpp"

#include <string>
#include <cstdint>
#include <functional>

namespace neta {

class Texture;

enum class SizeMode {
    Auto,       // Wraps content
    Fixed,      // Pixels
    Percent,    // Of the parent's inner size
    Grow        // Shares the parent's leftover main-axis space by weight
};

/// One side length of an element's box
struct UIDimension {
    SizeMode mode = SizeMode::Auto;
    float value = 0.0f;

    static UIDimension Auto() { return {SizeMode::Auto, 0.0f}; }
    static UIDimension Fixed(float px) { return {SizeMode::Fixed, px}; }
    static UIDimension Percent(float pct) { return {SizeMode::Percent, pct}; }
    static UIDimension Grow(float weight = 1.0f) { return {SizeMode::Grow, weight}; }
};

/// Roots are either at the screen origin (Relative) or at `left`/`top`
/// (Absolute).  Children always flow.
enum class PositionType {
    Relative,
    Absolute
};

enum class FlexDirection {
    Row,
    Column
};

/// Main-axis packing of a container's children
enum class JustifyContent {
    Start,
    Center,
    End,
    SpaceBetween
};

/// Cross-axis placement of a container's children
enum class AlignItems {
    Start,
    Center,
    End,
    Stretch
};

enum class TextAlign {
    Left,
    Center,
    Right
};

/// Padding or margin widths
struct UIEdges {
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float left = 0.0f;

    UIEdges() = default;
    explicit UIEdges(float all) : top(all), right(all), bottom(all), left(all) {}
    UIEdges(float vertical, float horizontal)
        : top(vertical), right(horizontal), bottom(vertical), left(horizontal) {}
    UIEdges(float t, float r, float b, float l)
        : top(t), right(r), bottom(b), left(l) {}

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }

    /// Both sides along one axis
    float along(bool horizontalAxis) const { return horizontalAxis ? horizontal() : vertical(); }
    /// The side an axis starts from (left or top)
    float leading(bool horizontalAxis) const { return horizontalAxis ? left : top; }
    float trailing(bool horizontalAxis) const { return horizontalAxis ? right : bottom; }
};

struct UIBorder {
    float width = 0.0f;
    Color color = Color::White();
};

struct UIStyle {
    UIDimension width = UIDimension::Auto();
    UIDimension height = UIDimension::Auto();
    float minWidth = 0.0f;
    float minHeight = 0.0f;
    float maxWidth = 0.0f;  // 0 = unbounded
    float maxHeight = 0.0f;

    FlexDirection flexDirection = FlexDirection::Column;
    JustifyContent justifyContent = JustifyContent::Start;
    AlignItems alignItems = AlignItems::Start;
    float gap = 0.0f;

    PositionType position = PositionType::Relative;
    float left = 0.0f;
    float top = 0.0f;

    UIEdges padding;
    UIEdges margin;

    Color backgroundColor = Color(0, 0, 0, 0);
    UIBorder border;

    /// Nine-sliced over the background color when set
    const Texture* backgroundImage = nullptr;
    float imageSliceBorder = 0.0f;

    int fontSize = 20;
    Color textColor = Color::White();
    TextAlign textAlign = TextAlign::Left;

    bool visible = true;

    bool isRow() const { return flexDirection == FlexDirection::Row; }
    const UIDimension& size(bool horizontalAxis) const { return horizontalAxis ? width : height; }

    /// Clamp a size on one axis to its min/max
    float constrain(float value, bool horizontalAxis) const;
};

inline float UIStyle::constrain(float value, bool horizontalAxis) const {
    float lo = horizontalAxis ? minWidth : minHeight;
    float hi = horizontalAxis ? maxWidth : maxHeight;
    if (lo > 0.0f && value < lo) value = lo;
    if (hi > 0.0f && value > hi) value = hi;
    return value < 0.0f ? 0.0f : value;
}

/// Screen-space box an element was given by the last layout
struct UIComputedLayout {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    Rect toRect() const { return Rect(x, y, width, height); }
    bool containsPoint(float px, float py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    float& origin(bool horizontalAxis) { return horizontalAxis ? x : y; }
    float& extent(bool horizontalAxis) { return horizontalAxis ? width : height; }
    float origin(bool horizontalAxis) const { return horizontalAxis ? x : y; }
    float extent(bool horizontalAxis) const { return horizontalAxis ? width : height; }
};

enum class UIElementType {
    Box,
    Text,
    Button,
    ScrollPanel
};

using UICallback = std::function<void()>;

} // namespace neta
