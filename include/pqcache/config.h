#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/config.h — Loading PersistCacheConfig from JSON
// ═══════════════════════════════════════════════════════════════════
//
//  {
//    "path": "/graphql",
//    "cacheHeader": true,
//    "cache": { "maxEntries": 100, "ttlMs": 3600000 },
//    "map": { "abc123": "{ hello }" },
//    "mapFile": "persisted_queries.json"
//  }
//
//  Every member is optional. `mapFile` is resolved against the
//  directory of the configuration file; inline `map` entries win over
//  entries with the same id from the file. All failures throw
//  ConfigurationError.
//
// ═══════════════════════════════════════════════════════════════════

#include "persist_cache.h"
#include <nlohmann/json.hpp>
#include <string>

namespace pqcache::config {

PersistedQueryMap parsePersistedQueryMap(const nlohmann::json& manifest);
PersistedQueryMap loadPersistedQueryMap(const std::string& path);

PersistCacheConfig fromJson(const nlohmann::json& json, const std::string& baseDir = "");
PersistCacheConfig loadFile(const std::string& path);

} // namespace pqcache::config
