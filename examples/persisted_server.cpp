// ═══════════════════════════════════════════════════════════════════
//  persisted_server.cpp — Persisted queries with a response cache
// ═══════════════════════════════════════════════════════════════════
//
//  This example demonstrates:
//    • Loading the persisted-query map and cache settings from JSON
//    • Mounting persistCache() in front of a GraphQL executor
//    • Serving repeated requests from the cache (X-Cache: HIT)
//
//  Run:   ./persisted_server examples/server_config.json
//  Try:   curl -s -D - -X POST http://localhost:4000/graphql \
//           -H 'Content-Type: application/json' -d '{"id":"abc123"}'
//
// ═══════════════════════════════════════════════════════════════════

#include "pqcache/pqcache.h"

#include <atomic>
#include <exception>

using namespace pqcache;

int main(int argc, char** argv) {
    PersistCacheConfig options;
    try {
        if (argc > 1) {
            options = config::loadFile(argv[1]);
        } else {
            options.map = {{"abc123", "{ hello }"}};
        }
    } catch (const ConfigurationError& e) {
        console::error("configuration:", e.what());
        return 1;
    }

    console::setLevel(console::Level::Debug);
    console::info("loaded", options.map.size(), "persisted queries for", options.path);

    // Stand-in execution layer: counts executions and echoes the request.
    std::atomic<int> executions{0};
    graphql::Executor executor = [&executions](const GraphQLRequest& request) {
        nlohmann::json echo = {
            {"query", *request.query},
            {"variables", request.variables.value_or(nlohmann::json::object())},
            {"execution", ++executions}
        };
        if (request.operationName) echo["operationName"] = *request.operationName;
        return nlohmann::json{{"data", {{"echo", echo}}}};
    };

    http::Server app;
    try {
        app.use(middleware::requestLogger());
        app.use(middleware::bodyParser());
        app.use(persistCache(options));
    } catch (const ConfigurationError& e) {
        console::error("configuration:", e.what());
        return 1;
    }

    app.post(options.path, graphql::executionHandler(executor));
    app.get(options.path, graphql::executionHandler(executor));

    try {
        app.listen(4000, [&options] {
            console::success("GraphQL endpoint on http://localhost:4000" + options.path);
        });
    } catch (const std::exception& e) {
        console::error("server:", e.what());
        return 1;
    }
}
