#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/error.h — Error taxonomy and HTTP translation
// ═══════════════════════════════════════════════════════════════════
//
//    ConfigurationError  — bad pipeline configuration, thrown before
//                          any request is accepted
//    HttpQueryError      — per-request failure with an HTTP status
//    SerializationError  — variables could not be canonicalized
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace pqcache {

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& message)
        : std::runtime_error(message) {}
};

// ─────────────────────────────────────────────
//  HttpQueryError
//  When isGraphQLError is set, what() is already a serialized GraphQL
//  response document ({"errors": [...]}) rather than plain text.
// ─────────────────────────────────────────────
class HttpQueryError : public std::runtime_error {
public:
    HttpQueryError(int statusCode,
                   const std::string& message,
                   bool isGraphQLError = false,
                   http::Headers headers = {})
        : std::runtime_error(message)
        , statusCode_(statusCode)
        , isGraphQLError_(isGraphQLError)
        , headers_(std::move(headers)) {}

    int statusCode() const noexcept { return statusCode_; }
    bool isGraphQLError() const noexcept { return isGraphQLError_; }
    const http::Headers& headers() const noexcept { return headers_; }

private:
    int statusCode_;
    bool isGraphQLError_;
    http::Headers headers_;
};

// ── Build the message for a GraphQL-shaped error ──
inline std::string graphqlErrorBody(const std::string& message, const std::string& code = "") {
    nlohmann::json error = {{"message", message}};
    if (!code.empty()) {
        error["extensions"] = {{"code", code}};
    }
    return nlohmann::json{{"errors", nlohmann::json::array({error})}}.dump();
}

// ─────────────────────────────────────────────
//  sendHttpQueryError — write an HttpQueryError to a response
// ─────────────────────────────────────────────
inline void sendHttpQueryError(http::Response& res, const HttpQueryError& err) {
    if (res.headersSent()) return;

    for (const auto& [key, value] : err.headers()) {
        res.set(key, value);
    }
    res.status(err.statusCode());

    if (err.isGraphQLError()) {
        res.type("application/json; charset=utf-8");
    } else {
        res.type("text/plain; charset=utf-8");
    }
    res.send(err.what());
}

} // namespace pqcache
