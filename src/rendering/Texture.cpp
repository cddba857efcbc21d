#include "rendering/Texture.hpp"
#include "engine/Log.hpp"

namespace neta {

Texture* TextureManager::loadTexture(const std::string& path) {
    auto it = m_textures.find(path);
    if (it != m_textures.end()) {
        return it->second;
    }

    if (!m_renderer) {
        ASSET_LOG_ERROR("TextureManager: No renderer set, cannot load texture '{}'", path);
        return nullptr;
    }

    Texture* texture = m_renderer->loadTexture(path);
    if (!texture) {
        ASSET_LOG_ERROR("TextureManager: Failed to load texture '{}'", path);
        return nullptr;
    }

    m_textures[path] = texture;
    ASSET_LOG_DEBUG("TextureManager: Loaded texture '{}' ({}x{})", path,
                    texture->getWidth(), texture->getHeight());
    return texture;
}

Texture* TextureManager::reloadTexture(const std::string& path) {
    unloadTexture(path);
    return loadTexture(path);
}

Texture* TextureManager::getTexture(const std::string& path) const {
    auto it = m_textures.find(path);
    if (it != m_textures.end()) {
        return it->second;
    }
    return nullptr;
}

void TextureManager::unloadTexture(const std::string& path) {
    auto it = m_textures.find(path);
    if (it != m_textures.end()) {
        if (m_renderer) {
            m_renderer->unloadTexture(it->second);
        }
        m_textures.erase(it);
        ASSET_LOG_DEBUG("TextureManager: Unloaded texture '{}'", path);
    }
}

void TextureManager::unloadAll() {
    if (m_renderer) {
        for (auto& [path, texture] : m_textures) {
            m_renderer->unloadTexture(texture);
        }
    }
    m_textures.clear();
    ASSET_LOG_DEBUG("TextureManager: Unloaded all textures");
}

bool TextureManager::hasTexture(const std::string& path) const {
    return m_textures.find(path) != m_textures.end();
}

std::vector<std::string> TextureManager::getLoadedPaths() const {
    std::vector<std::string> paths;
    paths.reserve(m_textures.size());
    for (const auto& [path, texture] : m_textures) {
        paths.push_back(path);
    }
    return paths;
}

} // namespace neta
