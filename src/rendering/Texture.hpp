#pragma once

#include "rendering/IRenderer.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace neta {

/// Texture handle - wrapper around the backend's texture representation
/// The actual texture data is managed by the renderer implementation
class Texture {
public:
    Texture() = default;
    Texture(int width, int height, unsigned int id)
        : m_width(width), m_height(height), m_id(id) {}

    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }
    unsigned int getId() const { return m_id; }

    Vec2 getSize() const {
        return {static_cast<float>(m_width), static_cast<float>(m_height)};
    }

    bool isValid() const { return m_id != 0; }

private:
    int m_width = 0;
    int m_height = 0;
    unsigned int m_id = 0;  // Backend-specific texture ID
};

/// Caches loaded textures by path.
/// Textures are owned by the renderer, TextureManager maps paths to them.
class TextureManager {
public:
    TextureManager() = default;
    ~TextureManager() = default;

    // Prevent copying
    TextureManager(const TextureManager&) = delete;
    TextureManager& operator=(const TextureManager&) = delete;

    /// Set the renderer (required before loading textures)
    void setRenderer(IRenderer* renderer) { m_renderer = renderer; }

    /// Load a texture from file (cached). Returns nullptr on failure.
    Texture* loadTexture(const std::string& path);

    /// Drop the cached texture and load the file again.
    /// Returns the new texture, or nullptr if the file no longer loads
    /// (the old texture is released either way).
    Texture* reloadTexture(const std::string& path);

    /// Get a cached texture (returns nullptr if not loaded)
    Texture* getTexture(const std::string& path) const;

    /// Unload a specific texture
    void unloadTexture(const std::string& path);

    /// Unload all textures
    void unloadAll();

    [[nodiscard]] bool hasTexture(const std::string& path) const;

    /// Paths of every cached texture
    std::vector<std::string> getLoadedPaths() const;

private:
    IRenderer* m_renderer = nullptr;
    std::unordered_map<std::string, Texture*> m_textures;
};

} // namespace neta
