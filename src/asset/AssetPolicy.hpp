#pragma once

#include <optional>
#include <string>
#include <utility>

namespace neta {

/// Settings from the `assets.*` config section
struct AssetSettings {
    std::string root = "assets";
    /// Accept images outside the asset root (dropped or picked files)
    bool allowExternalPaths = true;
    /// Seconds between file watcher scans
    float watchInterval = 1.0f;
};

/// Decides which image paths may be loaded and how they resolve.
/// Relative paths resolve against the asset root.
class AssetPolicy {
public:
    AssetPolicy() = default;
    explicit AssetPolicy(AssetSettings settings) : m_settings(std::move(settings)) {}

    const AssetSettings& getSettings() const { return m_settings; }

    /// Path to hand to the texture loader, or nullopt if the path is rejected
    /// (logged as an error).
    std::optional<std::string> resolve(const std::string& path) const;

    /// True when the resolved path lies outside the asset root
    bool isExternal(const std::string& path) const;

private:
    std::string absolute(const std::string& path) const;

    AssetSettings m_settings;
};

} // namespace neta
