#include "asset/AssetPolicy.hpp"
#include "engine/Log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace neta {

std::string AssetPolicy::absolute(const std::string& path) const {
    fs::path p(path);
    if (p.is_relative()) {
        p = fs::path(m_settings.root) / p;
    }
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(p, ec);
    if (ec) {
        resolved = p.lexically_normal();
    }
    return resolved.string();
}

bool AssetPolicy::isExternal(const std::string& path) const {
    std::error_code ec;
    fs::path root = fs::weakly_canonical(fs::path(m_settings.root), ec);
    if (ec) {
        root = fs::path(m_settings.root).lexically_normal();
    }

    fs::path relative = fs::path(absolute(path)).lexically_relative(root);
    if (relative.empty()) {
        return true;
    }
    auto first = *relative.begin();
    return first == "..";
}

std::optional<std::string> AssetPolicy::resolve(const std::string& path) const {
    if (path.empty()) {
        ASSET_LOG_ERROR("AssetPolicy: empty image path");
        return std::nullopt;
    }

    if (!m_settings.allowExternalPaths && isExternal(path)) {
        ASSET_LOG_ERROR("AssetPolicy: '{}' is outside the asset root '{}' and external paths are disabled",
                        path, m_settings.root);
        return std::nullopt;
    }

    return absolute(path);
}

} // namespace neta
