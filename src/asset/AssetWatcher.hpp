#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <functional>
#include <filesystem>

namespace neta {

/// Tracks modifications of loaded image files so they can be reloaded while
/// the board is open.  Uses polling (portable across platforms, no
/// inotify/FSEvents dependency).
class AssetWatcher {
public:
    using ChangeCallback = std::function<void(const std::vector<std::string>& changedFiles)>;

    AssetWatcher() = default;

    /// Start watching a file.  Watching a file twice is a no-op.
    void watchFile(const std::string& path);

    void unwatchFile(const std::string& path);
    void unwatchAll();

    /// Stop watching every file not in `paths`.  Returns how many were dropped.
    size_t retainOnly(const std::unordered_set<std::string>& paths);

    /// Watch every path in `paths` that is not watched yet
    void watchAll(const std::vector<std::string>& paths);

    /// Set the callback for when changes are detected.
    void setCallback(ChangeCallback callback) { m_callback = std::move(callback); }

    /// Advance the poll timer by `dt` seconds and scan once the interval has
    /// passed.  Returns the changed files (modified, created or deleted).
    std::vector<std::string> poll(float dt);

    /// Scan immediately, ignoring the interval.
    std::vector<std::string> scan();

    /// Set polling interval (minimum time between scans).
    void setPollInterval(float seconds) { m_pollIntervalSeconds = seconds; }
    float getPollInterval() const { return m_pollIntervalSeconds; }

    bool isWatching(const std::string& path) const { return m_files.count(path) > 0; }
    size_t watchedFileCount() const { return m_files.size(); }

private:
    using FileTime = std::filesystem::file_time_type;

    /// Last write time; `exists` is false for a missing file
    struct FileState {
        bool exists = false;
        FileTime writeTime{};

        bool operator!=(const FileState& other) const {
            return exists != other.exists || (exists && writeTime != other.writeTime);
        }
    };

    static FileState stat(const std::string& path);

    std::unordered_map<std::string, FileState> m_files;
    ChangeCallback m_callback;
    float m_pollIntervalSeconds = 1.0f;
    float m_sinceLastPoll = 0.0f;
};

} // namespace neta
