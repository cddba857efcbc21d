#pragma once

#include "rendering/IRenderer.hpp"
#include "rendering/Texture.hpp"
#include <raylib.h>
#include <unordered_map>
#include <memory>

namespace neta {

/// Raylib implementation of the IRenderer interface
class RaylibRenderer : public IRenderer {
public:
    RaylibRenderer() = default;
    ~RaylibRenderer() override;

    bool init(int screenWidth, int screenHeight) override;
    void shutdown() override;

    void beginFrame() override;
    void endFrame() override;

    void clear(const Color& color) override;

    int getScreenWidth() const override { return m_screenWidth; }
    int getScreenHeight() const override { return m_screenHeight; }
    void setScreenSize(int width, int height) override;

    Texture* loadTexture(const std::string& path) override;
    void unloadTexture(Texture* texture) override;

    void drawTexturePro(const Texture* texture, const Rect& source,
                        const Rect& dest, Vec2 origin, float rotation,
                        Color tint = Color::White()) override;

    void drawTextureNineSlice(const Texture* texture, const Rect& dest,
                              float border, Color tint = Color::White()) override;

    void drawRectangle(const Rect& rect, const Color& color) override;
    void drawRectangleOutline(const Rect& rect, const Color& color,
                              float thickness = 1.0f) override;

    void drawLine(Vec2 start, Vec2 end, const Color& color, float thickness = 1.0f) override;
    void drawPolyline(const std::vector<Vec2>& points, bool closed,
                      const Color& color, float thickness = 1.0f) override;

    void drawCircle(Vec2 center, float radius, const Color& color) override;
    void drawCircleOutline(Vec2 center, float radius, const Color& color,
                           float thickness = 1.0f) override;

    void drawText(const std::string& text, Vec2 position, int fontSize,
                 const Color& color) override;

    int measureTextWidth(const std::string& text, int fontSize) override;

private:
    /// Get the Raylib Texture2D for a texture
    const ::Texture2D* getRaylibTexture(const Texture* texture) const;

    struct RaylibTextureData {
        ::Texture2D raylibTexture{};
        std::unique_ptr<Texture> engineTexture;
    };

    int m_screenWidth = 0;
    int m_screenHeight = 0;
    bool m_initialized = false;

    // Map from engine texture ID to Raylib texture data
    std::unordered_map<unsigned int, RaylibTextureData> m_textures;
    unsigned int m_nextTextureId = 1;
};

} // namespace neta
