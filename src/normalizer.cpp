// ═══════════════════════════════════════════════════════════════════
//  src/normalizer.cpp — Request shape validation per HTTP method
// ═══════════════════════════════════════════════════════════════════

#include "pqcache/normalizer.h"
#include "pqcache/error.h"

#include <string>

namespace pqcache {

namespace {

nlohmann::json payloadFor(const http::Request& req) {
    if (req.method == "POST") {
        if (req.body.empty()) {
            throw HttpQueryError(500,
                "POST body missing. Did you forget to register the bodyParser middleware?");
        }
        if (!req.body.isObject()) {
            throw HttpQueryError(400, "POST body must be a single JSON object.");
        }
        return req.body.raw();
    }

    if (req.method == "GET") {
        if (req.query.empty()) {
            throw HttpQueryError(400, "GET query missing.");
        }
        nlohmann::json payload = nlohmann::json::object();
        for (const auto& [key, value] : req.query) {
            payload[key] = value;
        }
        return payload;
    }

    throw HttpQueryError(405, "GraphQL only supports GET and POST requests.", false,
                         {{"Allow", "GET, POST"}});
}

std::optional<std::string> extractQuery(const nlohmann::json& payload) {
    auto it = payload.find("query");
    if (it == payload.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();

    if (it->is_object() && it->contains("kind") && it->at("kind") == "Document") {
        throw HttpQueryError(400,
            "GraphQL queries must be strings. The request carries an already parsed "
            "query document (kind: \"Document\"); print it back to GraphQL source text "
            "before sending it.");
    }
    throw HttpQueryError(400, "GraphQL queries must be strings.");
}

// String members hold JSON text (always the case for GET); anything
// else is taken as already decoded.
std::optional<nlohmann::json> extractJsonField(const nlohmann::json& payload,
                                               const char* field,
                                               const char* invalidMessage) {
    auto it = payload.find(field);
    if (it == payload.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) return *it;

    try {
        return nlohmann::json::parse(it->get<std::string>());
    } catch (const nlohmann::json::parse_error&) {
        throw HttpQueryError(400, invalidMessage);
    }
}

std::optional<std::string> extractPersistHash(const nlohmann::json& payload) {
    auto it = payload.find("id");
    if (it == payload.end() || it->is_null()) return std::nullopt;

    if (it->is_string()) {
        auto id = it->get<std::string>();
        if (id.empty()) return std::nullopt;
        return id;
    }
    if (it->is_number_integer()) {
        return it->dump();
    }
    throw HttpQueryError(400, "Persisted query id must be a string.");
}

} // namespace

GraphQLRequest normalize(const http::Request& req) {
    auto payload = payloadFor(req);

    GraphQLRequest request;
    request.query = extractQuery(payload);
    request.extensions = extractJsonField(payload, "extensions", "Extensions are invalid JSON.");
    request.variables = extractJsonField(payload, "variables", "Variables are invalid JSON.");

    auto op = payload.find("operationName");
    if (op != payload.end() && op->is_string()) {
        request.operationName = op->get<std::string>();
    }

    request.persistHash = extractPersistHash(payload);
    return request;
}

} // namespace pqcache
