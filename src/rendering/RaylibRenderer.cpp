#include "rendering/RaylibRenderer.hpp"
#include "engine/Log.hpp"

namespace neta {

// Helper to convert our Color to Raylib Color
static ::Color toRaylibColor(const Color& c) {
    return {c.r, c.g, c.b, c.a};
}

static Rectangle toRaylibRect(const Rect& r) {
    return {r.x, r.y, r.width, r.height};
}

static Vector2 toRaylibVec2(const Vec2& v) {
    return {v.x, v.y};
}

RaylibRenderer::~RaylibRenderer() {
    if (m_initialized) {
        shutdown();
    }
}

bool RaylibRenderer::init(int screenWidth, int screenHeight) {
    m_screenWidth = screenWidth;
    m_screenHeight = screenHeight;
    m_initialized = true;

    LOG_INFO("RaylibRenderer: Initialized ({}x{})", screenWidth, screenHeight);
    return true;
}

void RaylibRenderer::shutdown() {
    for (auto& [id, data] : m_textures) {
        UnloadTexture(data.raylibTexture);
    }
    m_textures.clear();

    m_initialized = false;
    LOG_INFO("RaylibRenderer: Shut down");
}

void RaylibRenderer::beginFrame() {
    BeginDrawing();
}

void RaylibRenderer::endFrame() {
    EndDrawing();
}

void RaylibRenderer::clear(const Color& color) {
    ClearBackground(toRaylibColor(color));
}

void RaylibRenderer::setScreenSize(int width, int height) {
    m_screenWidth = width;
    m_screenHeight = height;
}

Texture* RaylibRenderer::loadTexture(const std::string& path) {
    if (!FileExists(path.c_str())) {
        ASSET_LOG_ERROR("RaylibRenderer: File not found '{}'", path);
        return nullptr;
    }

    ::Texture2D rlTexture = LoadTexture(path.c_str());
    if (rlTexture.id == 0) {
        ASSET_LOG_ERROR("RaylibRenderer: Failed to decode texture '{}'", path);
        return nullptr;
    }
    SetTextureFilter(rlTexture, TEXTURE_FILTER_BILINEAR);

    unsigned int id = m_nextTextureId++;

    RaylibTextureData data;
    data.raylibTexture = rlTexture;
    data.engineTexture = std::make_unique<Texture>(rlTexture.width, rlTexture.height, id);

    Texture* result = data.engineTexture.get();
    m_textures[id] = std::move(data);

    ASSET_LOG_DEBUG("RaylibRenderer: Loaded texture '{}' ({}x{}, id={})",
                    path, rlTexture.width, rlTexture.height, id);
    return result;
}

void RaylibRenderer::unloadTexture(Texture* texture) {
    if (!texture) return;

    unsigned int id = texture->getId();
    auto it = m_textures.find(id);
    if (it != m_textures.end()) {
        UnloadTexture(it->second.raylibTexture);
        m_textures.erase(it);
        ASSET_LOG_DEBUG("RaylibRenderer: Unloaded texture id={}", id);
    }
}

const ::Texture2D* RaylibRenderer::getRaylibTexture(const Texture* texture) const {
    if (!texture) return nullptr;

    auto it = m_textures.find(texture->getId());
    if (it != m_textures.end()) {
        return &it->second.raylibTexture;
    }
    return nullptr;
}

void RaylibRenderer::drawTexturePro(const Texture* texture, const Rect& source,
                                    const Rect& dest, Vec2 origin, float rotation,
                                    Color tint) {
    const ::Texture2D* rlTex = getRaylibTexture(texture);
    if (!rlTex) return;

    DrawTexturePro(*rlTex, toRaylibRect(source), toRaylibRect(dest),
                   toRaylibVec2(origin), rotation, toRaylibColor(tint));
}

void RaylibRenderer::drawTextureNineSlice(const Texture* texture, const Rect& dest,
                                          float border, Color tint) {
    const ::Texture2D* rlTex = getRaylibTexture(texture);
    if (!rlTex) return;

    int b = static_cast<int>(border);
    NPatchInfo info;
    info.source = {0.0f, 0.0f, static_cast<float>(rlTex->width),
                   static_cast<float>(rlTex->height)};
    info.left = b;
    info.top = b;
    info.right = b;
    info.bottom = b;
    info.layout = NPATCH_NINE_PATCH;

    DrawTextureNPatch(*rlTex, info, toRaylibRect(dest), {0.0f, 0.0f}, 0.0f,
                      toRaylibColor(tint));
}

void RaylibRenderer::drawRectangle(const Rect& rect, const Color& color) {
    DrawRectangleRec(toRaylibRect(rect), toRaylibColor(color));
}

void RaylibRenderer::drawRectangleOutline(const Rect& rect, const Color& color,
                                          float thickness) {
    DrawRectangleLinesEx(toRaylibRect(rect), thickness, toRaylibColor(color));
}

void RaylibRenderer::drawLine(Vec2 start, Vec2 end, const Color& color, float thickness) {
    DrawLineEx(toRaylibVec2(start), toRaylibVec2(end), thickness, toRaylibColor(color));
}

void RaylibRenderer::drawPolyline(const std::vector<Vec2>& points, bool closed,
                                  const Color& color, float thickness) {
    if (points.size() < 2) return;

    ::Color c = toRaylibColor(color);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        DrawLineEx(toRaylibVec2(points[i]), toRaylibVec2(points[i + 1]), thickness, c);
    }
    if (closed) {
        DrawLineEx(toRaylibVec2(points.back()), toRaylibVec2(points.front()), thickness, c);
    }
}

void RaylibRenderer::drawCircle(Vec2 center, float radius, const Color& color) {
    DrawCircleV(toRaylibVec2(center), radius, toRaylibColor(color));
}

void RaylibRenderer::drawCircleOutline(Vec2 center, float radius, const Color& color,
                                       float thickness) {
    float half = thickness * 0.5f;
    DrawRing(toRaylibVec2(center), radius - half, radius + half, 0.0f, 360.0f, 36,
             toRaylibColor(color));
}

void RaylibRenderer::drawText(const std::string& text, Vec2 position,
                              int fontSize, const Color& color) {
    DrawText(text.c_str(), static_cast<int>(position.x), static_cast<int>(position.y),
             fontSize, toRaylibColor(color));
}

int RaylibRenderer::measureTextWidth(const std::string& text, int fontSize) {
    return MeasureText(text.c_str(), fontSize);
}

} // namespace neta
