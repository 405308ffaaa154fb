#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/middleware.h — Host middleware the cache pipeline relies on
// ═══════════════════════════════════════════════════════════════════
//
//    • bodyParser()     — parse JSON / application/graphql bodies
//                         into req.body (required before persistCache
//                         for POST requests)
//    • requestLogger()  — one log line per request with status, cache
//                         outcome and latency
//
// ═══════════════════════════════════════════════════════════════════

#include "console.h"
#include "error.h"
#include "http.h"
#include <chrono>
#include <exception>
#include <string>

namespace pqcache::middleware {

// ═══════════════════════════════════════════
//  bodyParser
// ═══════════════════════════════════════════
//  application/json     → req.body = parsed document
//  application/graphql  → req.body = {"query": rawBody}
//  Invalid JSON ends the chain with a 400.
//
inline http::MiddlewareFunction bodyParser() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        if (req.rawBody.empty()) {
            next();
            return;
        }

        if (req.is("application/json")) {
            try {
                req.body = JsonValue(nlohmann::json::parse(req.rawBody));
            } catch (const nlohmann::json::parse_error& e) {
                res.status(400).json(nlohmann::json{
                    {"error", "Bad Request"},
                    {"message", std::string("Invalid JSON: ") + e.what()}
                });
                return;
            }
        } else if (req.is("application/graphql")) {
            req.body = JsonValue(nlohmann::json{{"query", req.rawBody}});
        }

        next();
    };
}

// ═══════════════════════════════════════════
//  requestLogger
// ═══════════════════════════════════════════
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();

        auto logLine = [&](int status) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;

            auto cacheIt = res.getHeaders().find("X-Cache");
            std::string cacheState = cacheIt != res.getHeaders().end() ? cacheIt->second : "-";

            if (status >= 400) {
                console::error(req.method, req.path, status, cacheState, std::to_string(ms) + "ms");
            } else {
                console::success(req.method, req.path, status, cacheState, std::to_string(ms) + "ms");
            }
        };

        // Errors thrown further down are answered by the server's error
        // boundary; log the status they will become and rethrow.
        try {
            next();
        } catch (const HttpQueryError& e) {
            logLine(e.statusCode());
            throw;
        } catch (const std::exception&) {
            logLine(500);
            throw;
        }

        logLine(res.getStatusCode());
    };
}

} // namespace pqcache::middleware
