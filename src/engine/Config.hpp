#pragma once

#include "rendering/IRenderer.hpp"

#include <string>
#include <set>
#include <vector>
#include <nlohmann/json.hpp>

namespace neta {

/// JSON-backed settings addressed with dot-separated key paths
/// ("canvas.zoom_step").  Readers pass a default that is returned when the
/// key is missing or holds the wrong type.
class Config {
public:
    /// Load configuration from a JSON file.  Returns false (and logs) if the
    /// file cannot be read or parsed; the current data is kept in that case.
    bool loadFromFile(const std::string& path);

    /// Load configuration from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge another JSON file on top of the current configuration.
    /// Keys present in the overlay win; other keys are preserved.
    /// Returns false if the file cannot be read or parsed.
    bool mergeFromFile(const std::string& path);

    /// Save the keys modified at runtime (via setters) into `path`, merged
    /// over what the file already holds.  Returns false if nothing was
    /// modified or the file cannot be written.
    bool saveOverridesToFile(const std::string& path) const;

    // --- Getters ---

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// Read a color stored as [r, g, b] or [r, g, b, a] with channels in [0, 1].
    Color getColor(const std::string& key, const Color& defaultVal) const;

    // --- Setters ---

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setFloat(const std::string& key, float value);
    void setBool(const std::string& key, bool value);

    bool hasKey(const std::string& key) const;

    /// Keys modified at runtime via setters
    const std::set<std::string>& dirtyKeys() const { return m_dirtyKeys; }

    const nlohmann::json& raw() const { return m_data; }

private:
    static std::vector<std::string> splitKey(const std::string& key);

    const nlohmann::json* resolve(const std::string& key) const;

    /// Walk the key path for writing, creating intermediate objects
    nlohmann::json& resolveOrCreate(const std::string& key);

    void set(const std::string& key, nlohmann::json value);

    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
    std::set<std::string> m_dirtyKeys;
};

} // namespace neta
