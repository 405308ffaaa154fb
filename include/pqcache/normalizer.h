#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/normalizer.h — Inbound request → GraphQLRequest
// ═══════════════════════════════════════════════════════════════════
//
//    POST  payload is req.body (must already be parsed by bodyParser)
//    GET   payload is req.query (the parsed query string)
//
//  Any shape problem is reported as an HttpQueryError carrying the
//  status the HTTP layer should answer with.
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pqcache {

struct GraphQLRequest {
    std::optional<std::string>    query;
    std::optional<std::string>    operationName;
    std::optional<nlohmann::json> variables;
    std::optional<nlohmann::json> extensions;
    std::optional<std::string>    persistHash;     // from the payload's `id`
};

// Throws HttpQueryError.
GraphQLRequest normalize(const http::Request& req);

} // namespace pqcache
