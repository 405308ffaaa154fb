#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/pqcache.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "pqcache/pqcache.h"
//  using namespace pqcache;
//
//    • persistCache(), PersistCacheConfig, PersistedQueryMap
//    • fingerprint(), normalize(), GraphQLRequest
//    • cache::LRUCache, cache::KeyValueCache
//    • config::loadFile(), config::fromJson()
//    • http::Server, middleware::bodyParser(), requestLogger()
//    • graphql::executionHandler()
//    • console::log(), info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "error.h"

// Persisted-query cache
#include "cache.h"
#include "fingerprint.h"
#include "normalizer.h"
#include "persist_cache.h"
#include "config.h"

// Host
#include "http.h"
#include "middleware.h"
#include "graphql.h"
