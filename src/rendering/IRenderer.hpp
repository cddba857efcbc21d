#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cmath>
#include <algorithm>

namespace neta {

// Math constants
constexpr float PI = 3.14159265358979323846f;
constexpr float DEG_TO_RAD = PI / 180.0f;
constexpr float RAD_TO_DEG = 180.0f / PI;

// Forward declarations
class Texture;

/// Color representation with RGBA components
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    /// Build a color from normalized [0, 1] channels.
    static Color fromFloat(float r, float g, float b, float a = 1.0f) {
        auto channel = [](float v) {
            return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
        };
        return {channel(r), channel(g), channel(b), channel(a)};
    }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    static constexpr Color White()     { return {255, 255, 255, 255}; }
    static constexpr Color Black()     { return {0, 0, 0, 255}; }
    static constexpr Color Green()     { return {0, 255, 0, 255}; }
    static constexpr Color LightGray() { return {211, 211, 211, 255}; }
    static constexpr Color DarkGray()  { return {40, 40, 40, 255}; }
    static constexpr Color Transparent() { return {0, 0, 0, 0}; }
};

/// 2D vector for positions, sizes, etc.
/// World and screen space are both y-down.
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    // Arithmetic operators
    Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }
    Vec2 operator-() const { return {-x, -y}; }
    Vec2 operator*(float scalar) const { return {x * scalar, y * scalar}; }
    Vec2 operator/(float scalar) const { return {x / scalar, y / scalar}; }
    Vec2& operator+=(const Vec2& other) { x += other.x; y += other.y; return *this; }
    Vec2& operator-=(const Vec2& other) { x -= other.x; y -= other.y; return *this; }
    Vec2& operator*=(float scalar) { x *= scalar; y *= scalar; return *this; }
    Vec2& operator/=(float scalar) { x /= scalar; y /= scalar; return *this; }

    // Comparison operators
    bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }

    // Utility functions
    float length() const { return std::sqrt(x * x + y * y); }
    float lengthSquared() const { return x * x + y * y; }
    Vec2 normalized() const {
        float len = length();
        return len > 0.0f ? Vec2(x / len, y / len) : Vec2();
    }

    /// Component-wise product
    Vec2 scaled(const Vec2& other) const { return {x * other.x, y * other.y}; }

    /// Rotate by an angle in radians (positive is clockwise on a y-down screen)
    Vec2 rotated(float radians) const {
        float c = std::cos(radians);
        float s = std::sin(radians);
        return {x * c - y * s, x * s + y * c};
    }

    static float dot(const Vec2& a, const Vec2& b) { return a.x * b.x + a.y * b.y; }
    /// 2D cross product (z of the 3D cross product)
    static float cross(const Vec2& a, const Vec2& b) { return a.x * b.y - a.y * b.x; }
    static float distance(const Vec2& a, const Vec2& b) { return (b - a).length(); }

    /// Signed angle in radians that rotates direction `from` onto `to`
    static float angleBetween(const Vec2& from, const Vec2& to) {
        return std::atan2(cross(from, to), dot(from, to));
    }
};

/// Axis-aligned rectangle (top-left corner plus size)
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x, float y, float w, float h)
        : x(x), y(y), width(w), height(h) {}

    static Rect fromCorners(Vec2 a, Vec2 b) {
        float minX = std::min(a.x, b.x);
        float minY = std::min(a.y, b.y);
        return {minX, minY, std::max(a.x, b.x) - minX, std::max(a.y, b.y) - minY};
    }

    static Rect fromCenterSize(Vec2 center, Vec2 size) {
        return {center.x - size.x * 0.5f, center.y - size.y * 0.5f, size.x, size.y};
    }

    Vec2 center() const { return {x + width * 0.5f, y + height * 0.5f}; }
    Vec2 size() const { return {width, height}; }

    bool contains(Vec2 point) const {
        return point.x >= x && point.x < x + width &&
               point.y >= y && point.y < y + height;
    }

    /// True when the rectangles share a region of positive area
    bool intersects(const Rect& other) const {
        return x < other.x + other.width && x + width > other.x &&
               y < other.y + other.height && y + height > other.y;
    }
};

/// Abstract renderer interface for backend-agnostic rendering.
/// Tests substitute a recording implementation.
class IRenderer {
public:
    virtual ~IRenderer() = default;

    /// Initialize the renderer (called after window creation)
    virtual bool init(int screenWidth, int screenHeight) = 0;

    /// Shutdown and release resources
    virtual void shutdown() = 0;

    virtual void beginFrame() = 0;
    virtual void endFrame() = 0;

    /// Clear the screen with a color
    virtual void clear(const Color& color) = 0;

    virtual int getScreenWidth() const = 0;
    virtual int getScreenHeight() const = 0;

    /// Update screen dimensions (e.g., after window resize)
    virtual void setScreenSize(int width, int height) = 0;

    /// Load a texture from file. Returns nullptr on failure.
    virtual Texture* loadTexture(const std::string& path) = 0;

    /// Unload a texture. The pointer is invalid afterwards.
    virtual void unloadTexture(Texture* texture) = 0;

    /// Draw a portion of a texture into dest, rotated (degrees) around origin
    /// (origin is relative to dest's top-left corner)
    virtual void drawTexturePro(const Texture* texture, const Rect& source,
                                const Rect& dest, Vec2 origin, float rotation,
                                Color tint = Color::White()) = 0;

    /// Draw a texture nine-sliced into dest: corners keep `border` pixels,
    /// edges and center stretch
    virtual void drawTextureNineSlice(const Texture* texture, const Rect& dest,
                                      float border, Color tint = Color::White()) = 0;

    /// Draw a filled rectangle
    virtual void drawRectangle(const Rect& rect, const Color& color) = 0;

    /// Draw a rectangle outline
    virtual void drawRectangleOutline(const Rect& rect, const Color& color, float thickness = 1.0f) = 0;

    /// Draw a line between two points
    virtual void drawLine(Vec2 start, Vec2 end, const Color& color, float thickness = 1.0f) = 0;

    /// Draw connected line segments, closing the loop when `closed` is set
    virtual void drawPolyline(const std::vector<Vec2>& points, bool closed,
                              const Color& color, float thickness = 1.0f) = 0;

    /// Draw a filled circle
    virtual void drawCircle(Vec2 center, float radius, const Color& color) = 0;

    /// Draw a circle outline centered on the radius
    virtual void drawCircleOutline(Vec2 center, float radius, const Color& color, float thickness = 1.0f) = 0;

    /// Draw text (default font)
    virtual void drawText(const std::string& text, Vec2 position, int fontSize,
                         const Color& color) = 0;

    /// Measure text width (for layout)
    virtual int measureTextWidth(const std::string& text, int fontSize) = 0;
};

} // namespace neta
