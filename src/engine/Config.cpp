#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <fstream>
#include <sstream>

namespace neta {

namespace {

bool parseStream(std::istream& in, nlohmann::json& out, const std::string& origin) {
    try {
        out = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config: parse error in '{}': {}", origin, e.what());
        return false;
    }
    return true;
}

} // namespace

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json data;
    if (!parseStream(file, data, path)) {
        return false;
    }
    m_data = std::move(data);
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    std::istringstream stream(jsonStr);
    nlohmann::json data;
    if (!parseStream(stream, data, "<string>")) {
        return false;
    }
    m_data = std::move(data);
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json overlay;
    if (!parseStream(file, overlay, path)) {
        return false;
    }

    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data = std::move(merged);
    return true;
}

bool Config::saveOverridesToFile(const std::string& path) const {
    if (m_dirtyKeys.empty()) {
        return false;
    }

    nlohmann::json overrides = nlohmann::json::object();
    for (const auto& key : m_dirtyKeys) {
        const nlohmann::json* val = resolve(key);
        if (!val) continue;

        nlohmann::json* cur = &overrides;
        auto segments = splitKey(key);
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            nlohmann::json& next = (*cur)[segments[i]];
            if (!next.is_object()) next = nlohmann::json::object();
            cur = &next;
        }
        (*cur)[segments.back()] = *val;
    }

    // Keep what the file already holds
    nlohmann::json merged = nlohmann::json::object();
    {
        std::ifstream existing(path);
        if (existing.is_open()) {
            nlohmann::json current = nlohmann::json::parse(existing, nullptr, false);
            if (current.is_object()) {
                merged = std::move(current);
            } else {
                LOG_WARN("Config: '{}' is not a JSON object, replacing it", path);
            }
        }
    }
    mergeJson(merged, overrides);

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config: cannot write overrides to '{}'", path);
        return false;
    }

    file << merged.dump(4) << '\n';
    return file.good();
}

// ---------------------------------------------------------------------------
// Key resolution
// ---------------------------------------------------------------------------

std::vector<std::string> Config::splitKey(const std::string& key) {
    std::vector<std::string> segments;
    std::istringstream stream(key);
    std::string segment;
    while (std::getline(stream, segment, '.')) {
        segments.push_back(segment);
    }
    if (segments.empty()) {
        segments.emplace_back();
    }
    return segments;
}

const nlohmann::json* Config::resolve(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& segment : splitKey(key)) {
        if (!current->is_object() || !current->contains(segment)) {
            return nullptr;
        }
        current = &(*current)[segment];
    }
    return current;
}

nlohmann::json& Config::resolveOrCreate(const std::string& key) {
    nlohmann::json* current = &m_data;
    for (const auto& segment : splitKey(key)) {
        if (!current->is_object()) {
            if (!current->is_null()) {
                LOG_WARN("Config: overwriting non-object value while setting '{}'", key);
            }
            *current = nlohmann::json::object();
        }
        current = &(*current)[segment];
    }
    return *current;
}

// ---------------------------------------------------------------------------
// Getters
// ---------------------------------------------------------------------------

bool Config::hasKey(const std::string& key) const {
    return resolve(key) != nullptr;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_string()) {
        return val->get<std::string>();
    }
    return defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_number_integer()) {
        return val->get<int>();
    }
    return defaultVal;
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_number()) {
        return val->get<float>();
    }
    return defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* val = resolve(key);
    if (val && val->is_boolean()) {
        return val->get<bool>();
    }
    return defaultVal;
}

Color Config::getColor(const std::string& key, const Color& defaultVal) const {
    const auto* val = resolve(key);
    if (!val || !val->is_array() || val->size() < 3 || val->size() > 4) {
        return defaultVal;
    }
    for (const auto& channel : *val) {
        if (!channel.is_number()) {
            LOG_WARN("Config: '{}' is not a numeric color", key);
            return defaultVal;
        }
    }
    float alpha = val->size() == 4 ? (*val)[3].get<float>() : 1.0f;
    return Color::fromFloat((*val)[0].get<float>(), (*val)[1].get<float>(),
                            (*val)[2].get<float>(), alpha);
}

// ---------------------------------------------------------------------------
// Setters
// ---------------------------------------------------------------------------

void Config::set(const std::string& key, nlohmann::json value) {
    resolveOrCreate(key) = std::move(value);
    m_dirtyKeys.insert(key);
}

void Config::setString(const std::string& key, const std::string& value) {
    set(key, value);
}

void Config::setInt(const std::string& key, int value) {
    set(key, value);
}

void Config::setFloat(const std::string& key, float value) {
    set(key, value);
}

void Config::setBool(const std::string& key, bool value) {
    set(key, value);
}

// ---------------------------------------------------------------------------
// JSON merge
// ---------------------------------------------------------------------------

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object()) {
        base = overlay;
        return;
    }
    if (!base.is_object()) {
        base = nlohmann::json::object();
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (it->is_object() && base.contains(it.key()) && base[it.key()].is_object()) {
            mergeJson(base[it.key()], *it);
        } else {
            base[it.key()] = *it;
        }
    }
}

} // namespace neta
