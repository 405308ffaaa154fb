// ═══════════════════════════════════════════════════════════════════
//  src/config.cpp — Configuration parsing and validation
// ═══════════════════════════════════════════════════════════════════

#include "pqcache/config.h"
#include "pqcache/error.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

namespace pqcache::config {

namespace {

std::string readFileSync(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open '" + path + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

nlohmann::json parseFile(const std::string& path) {
    auto text = readFileSync(path);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("'" + path + "' is not valid JSON: " + e.what());
    }
}

const nlohmann::json* member(const nlohmann::json& json, const char* name) {
    auto it = json.find(name);
    return it == json.end() ? nullptr : &*it;
}

// Integers out of int64 range are clamped to its maximum so range checks
// reject them instead of seeing a wrapped negative value.
std::optional<std::int64_t> integerValue(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(u);
    }
    if (value.is_number_integer()) return value.get<std::int64_t>();
    return std::nullopt;
}

} // namespace

PersistedQueryMap parsePersistedQueryMap(const nlohmann::json& manifest) {
    if (!manifest.is_object()) {
        throw ConfigurationError("persisted query map must be a JSON object");
    }

    PersistedQueryMap map;
    for (const auto& [id, query] : manifest.items()) {
        if (!query.is_string() || query.get_ref<const std::string&>().empty()) {
            throw ConfigurationError("persisted query '" + id + "' must be a non-empty string");
        }
        map.emplace(id, query.get<std::string>());
    }
    return map;
}

PersistedQueryMap loadPersistedQueryMap(const std::string& path) {
    return parsePersistedQueryMap(parseFile(path));
}

PersistCacheConfig fromJson(const nlohmann::json& json, const std::string& baseDir) {
    if (!json.is_object()) {
        throw ConfigurationError("persistCache configuration must be a JSON object");
    }

    PersistCacheConfig config;

    if (auto* path = member(json, "path")) {
        if (!path->is_string()) throw ConfigurationError("'path' must be a string");
        config.path = path->get<std::string>();
    }

    if (auto* header = member(json, "cacheHeader")) {
        if (!header->is_boolean()) throw ConfigurationError("'cacheHeader' must be a boolean");
        config.cacheHeader = header->get<bool>();
    }

    if (auto* cache = member(json, "cache")) {
        if (!cache->is_object()) throw ConfigurationError("'cache' must be an object");

        if (auto* max = member(*cache, "maxEntries")) {
            auto value = integerValue(*max);
            if (!value || *value <= 0) {
                throw ConfigurationError("'cache.maxEntries' must be a positive integer");
            }
            config.cache.maxEntries = static_cast<std::size_t>(*value);
        }
        if (auto* ttl = member(*cache, "ttlMs")) {
            auto value = integerValue(*ttl);
            if (!value
                || *value > std::numeric_limits<int>::max()
                || *value < std::numeric_limits<int>::min()) {
                throw ConfigurationError("'cache.ttlMs' must be an integer number of milliseconds");
            }
            config.cache.ttlMs = static_cast<int>(*value);
        }
    }

    if (auto* file = member(json, "mapFile")) {
        if (!file->is_string()) throw ConfigurationError("'mapFile' must be a string");
        std::filesystem::path mapPath = file->get<std::string>();
        if (mapPath.is_relative() && !baseDir.empty()) {
            mapPath = std::filesystem::path(baseDir) / mapPath;
        }
        config.map = loadPersistedQueryMap(mapPath.string());
    }

    if (auto* map = member(json, "map")) {
        for (auto& [id, query] : parsePersistedQueryMap(*map)) {
            config.map[id] = std::move(query);
        }
    }

    return config;
}

PersistCacheConfig loadFile(const std::string& path) {
    auto baseDir = std::filesystem::path(path).parent_path().string();
    return fromJson(parseFile(path), baseDir);
}

} // namespace pqcache::config
