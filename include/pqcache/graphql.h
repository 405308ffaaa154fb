#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/graphql.h — Adapter from a GraphQL executor to a route
// ═══════════════════════════════════════════════════════════════════
//
//  GraphQL execution itself lives outside this library. Any callable
//  that turns a normalized request into a response document can be
//  mounted behind persistCache():
//
//    app.post("/graphql", graphql::executionHandler(
//        [&](const GraphQLRequest& r) { return engine.run(*r.query, r.variables); }));
//
// ═══════════════════════════════════════════════════════════════════

#include "error.h"
#include "http.h"
#include "normalizer.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace pqcache::graphql {

using Executor = std::function<nlohmann::json(const GraphQLRequest&)>;

// Responds with the executor's document as application/json.
// HttpQueryError propagates to the server's error boundary.
inline http::RouteHandler executionHandler(Executor executor) {
    return [executor = std::move(executor)](http::Request& req, http::Response& res) {
        auto request = normalize(req);

        if (!request.query || request.query->empty()) {
            throw HttpQueryError(400, "Must provide query string.");
        }

        res.json(executor(request));
    };
}

} // namespace pqcache::graphql
