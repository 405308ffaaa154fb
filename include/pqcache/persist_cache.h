#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/persist_cache.h — Persisted-query resolution + response cache
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    PersistCacheConfig config;
//    config.map = {{"abc123", "{ hello }"}};
//    app.use(persistCache(config));
//    app.post("/graphql", graphql::executionHandler(executor));
//
//  Per request on the configured path:
//
//    normalize ─► fingerprint ─► cache hit ─► send cached body
//                                  │
//                                  └─ miss ─► inject query text
//                                             ─► next()  (execution)
//                                             ─► store 2xx JSON result
//
//  Requests without an `id` are passed to next() and never cached.
//  Concurrent misses on the same fingerprint are not coalesced: each
//  one executes and writes, and the last write wins.
//
// ═══════════════════════════════════════════════════════════════════

#include "cache.h"
#include "http.h"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace pqcache {

// hash id → GraphQL source text
using PersistedQueryMap = std::unordered_map<std::string, std::string>;

inline constexpr const char* kDefaultGraphQLPath = "/graphql";

struct PersistCacheConfig {
    std::string         path = kDefaultGraphQLPath;
    PersistedQueryMap   map;
    bool                cacheHeader = true;     // X-Cache: HIT / MISS
    cache::CacheOptions cache;                  // used when no store is supplied
};

// ─────────────────────────────────────────────
//  class PersistCache
//  Immutable after construction; the store is the only shared state.
// ─────────────────────────────────────────────
class PersistCache {
public:
    // Throws ConfigurationError.
    PersistCache(PersistCacheConfig config, std::shared_ptr<cache::ResponseCache> store);

    // Throws HttpQueryError; exceptions from next() propagate untouched.
    void handle(http::Request& req, http::Response& res, const http::NextFunction& next) const;

    const PersistCacheConfig& config() const { return config_; }

private:
    PersistCacheConfig config_;
    std::shared_ptr<cache::ResponseCache> store_;

    std::optional<cache::CachedResponse> lookup(const std::string& key) const;
    void populate(const std::string& key, cache::CachedResponse entry) const;
};

// ── Middleware factories ──
http::MiddlewareFunction persistCache(PersistCacheConfig config,
                                      std::shared_ptr<cache::ResponseCache> store);

// Builds an LRUCache from config.cache.
http::MiddlewareFunction persistCache(PersistCacheConfig config);

namespace detail {

// application/json, application/graphql-response+json and
// application/graphql+json, parameters ignored.
bool isCacheableContentType(const std::string& contentType);

// Only 2xx responses are written through.
bool isSuccessStatus(int statusCode);

} // namespace detail

} // namespace pqcache
