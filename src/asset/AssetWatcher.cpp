#include "asset/AssetWatcher.hpp"
#include "engine/Log.hpp"

namespace fs = std::filesystem;

namespace neta {

void AssetWatcher::watchFile(const std::string& path) {
    if (m_files.count(path)) return;

    FileState state = stat(path);
    if (!state.exists) {
        ASSET_LOG_WARN("AssetWatcher: '{}' does not exist, watching for it anyway", path);
    }
    m_files.emplace(path, state);
    ASSET_LOG_DEBUG("AssetWatcher: watching '{}'", path);
}

void AssetWatcher::unwatchFile(const std::string& path) {
    m_files.erase(path);
}

void AssetWatcher::unwatchAll() {
    m_files.clear();
}

size_t AssetWatcher::retainOnly(const std::unordered_set<std::string>& paths) {
    size_t dropped = 0;
    for (auto it = m_files.begin(); it != m_files.end();) {
        if (paths.count(it->first) == 0) {
            it = m_files.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

void AssetWatcher::watchAll(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        watchFile(path);
    }
}

std::vector<std::string> AssetWatcher::poll(float dt) {
    m_sinceLastPoll += dt;
    if (m_sinceLastPoll < m_pollIntervalSeconds) {
        return {};
    }
    m_sinceLastPoll = 0.0f;
    return scan();
}

std::vector<std::string> AssetWatcher::scan() {
    std::vector<std::string> changed;

    for (auto& [path, state] : m_files) {
        FileState current = stat(path);
        if (current != state) {
            changed.push_back(path);
            state = current;
        }
    }

    if (!changed.empty()) {
        ASSET_LOG_INFO("AssetWatcher: {} file(s) changed", changed.size());
        for (const auto& file : changed) {
            ASSET_LOG_DEBUG("AssetWatcher:   changed: {}", file);
        }
        if (m_callback) {
            m_callback(changed);
        }
    }

    return changed;
}

AssetWatcher::FileState AssetWatcher::stat(const std::string& path) {
    FileState state;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return state;
    }

    auto time = fs::last_write_time(path, ec);
    if (ec) {
        ASSET_LOG_WARN("AssetWatcher: cannot read '{}': {}", path, ec.message());
        return state;
    }

    state.exists = true;
    state.writeTime = time;
    return state;
}

} // namespace neta
