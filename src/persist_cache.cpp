// ═══════════════════════════════════════════════════════════════════
//  src/persist_cache.cpp — Route gate, lookup, execute, write-through
// ═══════════════════════════════════════════════════════════════════

#include "pqcache/persist_cache.h"
#include "pqcache/console.h"
#include "pqcache/error.h"
#include "pqcache/fingerprint.h"
#include "pqcache/normalizer.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace pqcache {

namespace detail {

bool isCacheableContentType(const std::string& contentType) {
    auto mediaType = contentType.substr(0, contentType.find(';'));

    auto first = mediaType.find_first_not_of(" \t");
    if (first == std::string::npos) return false;
    auto last = mediaType.find_last_not_of(" \t");
    mediaType = mediaType.substr(first, last - first + 1);

    std::transform(mediaType.begin(), mediaType.end(), mediaType.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return mediaType == "application/json"
        || mediaType == "application/graphql-response+json"
        || mediaType == "application/graphql+json";
}

bool isSuccessStatus(int statusCode) {
    return statusCode >= 200 && statusCode < 300;
}

} // namespace detail

namespace {

constexpr const char* kCachedContentType = "application/json; charset=utf-8";

std::string shortKey(const std::string& key) {
    return key.substr(0, 12);
}

void validate(const PersistCacheConfig& config, const cache::ResponseCache* store) {
    if (config.path.empty() || config.path.front() != '/') {
        throw ConfigurationError("persistCache: path must start with '/', got '" + config.path + "'");
    }
    if (store == nullptr) {
        throw ConfigurationError("persistCache: a response cache instance is required");
    }
}

// Execution reads `query` from wherever the payload came from.
void injectQuery(http::Request& req, const std::string& queryText) {
    if (req.method == "GET") {
        req.query["query"] = queryText;
    } else {
        req.body.set("query", queryText);
    }
}

} // namespace

PersistCache::PersistCache(PersistCacheConfig config, std::shared_ptr<cache::ResponseCache> store)
    : config_(std::move(config))
    , store_(std::move(store))
{
    validate(config_, store_.get());
}

void PersistCache::handle(http::Request& req, http::Response& res,
                          const http::NextFunction& next) const {
    if (req.path != config_.path) {
        next();
        return;
    }

    auto request = normalize(req);

    if (!request.persistHash) {
        next();
        return;
    }
    const auto& persistHash = *request.persistHash;

    std::string key;
    try {
        key = fingerprint(persistHash, request.variables);
    } catch (const SerializationError& e) {
        throw HttpQueryError(400, e.what());
    }

    if (auto hit = lookup(key)) {
        console::debug("persistCache HIT", persistHash, shortKey(key));
        if (config_.cacheHeader) res.set("X-Cache", "HIT");
        res.status(hit->status);
        res.type(hit->contentType.empty() ? kCachedContentType : hit->contentType);
        res.send(hit->body);
        return;
    }

    auto resolved = config_.map.find(persistHash);
    if (resolved == config_.map.end()) {
        throw HttpQueryError(404,
            graphqlErrorBody("PersistedQueryNotFound", "PERSISTED_QUERY_NOT_FOUND"), true);
    }

    console::debug("persistCache MISS", persistHash, shortKey(key));
    injectQuery(req, resolved->second);
    if (config_.cacheHeader) res.set("X-Cache", "MISS");

    next();

    // Error documents (a router 404, an executor's 500) are never stored.
    if (res.headersSent() && detail::isSuccessStatus(res.getStatusCode())
        && detail::isCacheableContentType(res.contentType())) {
        populate(key, {res.getBody(), res.contentType(), res.getStatusCode()});
    }
}

// A failing store must never fail the request: a read error is a miss
// and a write error leaves the entry uncached.
std::optional<cache::CachedResponse> PersistCache::lookup(const std::string& key) const {
    try {
        return store_->get(key);
    } catch (const std::exception& e) {
        console::warn("persistCache: cache read failed, executing instead:", e.what());
        return std::nullopt;
    }
}

void PersistCache::populate(const std::string& key, cache::CachedResponse entry) const {
    try {
        if (!store_->set(key, entry)) {
            console::warn("persistCache: cache rejected entry", shortKey(key));
        }
    } catch (const std::exception& e) {
        console::warn("persistCache: cache write failed:", e.what());
    }
}

http::MiddlewareFunction persistCache(PersistCacheConfig config,
                                      std::shared_ptr<cache::ResponseCache> store) {
    auto pipeline = std::make_shared<const PersistCache>(std::move(config), std::move(store));
    return [pipeline](http::Request& req, http::Response& res, http::NextFunction next) {
        pipeline->handle(req, res, next);
    };
}

http::MiddlewareFunction persistCache(PersistCacheConfig config) {
    if (config.cache.maxEntries == 0) {
        throw ConfigurationError("persistCache: cache.maxEntries must be greater than zero");
    }
    auto store = std::make_shared<cache::LRUCache<cache::CachedResponse>>(config.cache);
    return persistCache(std::move(config), std::move(store));
}

} // namespace pqcache
