#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/testing.h — In-process client for middleware tests
// ═══════════════════════════════════════════════════════════════════
//
//  Drives Server::handleRequest() without sockets:
//
//    TestClient client(app);
//    auto r = client.post("/graphql").send({{"id", "abc123"}}).expect(200);
//    EXPECT_EQ(r.header("X-Cache"), "MISS");
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include <stdexcept>
#include <string>

namespace pqcache::testing {

// Request as a transport would hand it over: unparsed body, lowercase
// header names.
inline http::Request createRequest(const std::string& method,
                                   const std::string& path,
                                   std::string body = "",
                                   const std::string& contentType = "") {
    http::Request req;
    req.method = method;
    req.path = path;
    req.url = path;
    req.ip = "127.0.0.1";
    req.rawBody = std::move(body);
    if (!contentType.empty()) req.headers["content-type"] = contentType;
    return req;
}

// Keeps everything it would have sent; read it back with getBody() etc.
inline http::Response createResponse() {
    return http::Response([](int, const http::Headers&, const std::string&) {});
}

struct TestResult {
    int status = 0;
    std::string body;
    http::Headers headers;

    nlohmann::json json() const { return nlohmann::json::parse(body); }

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : "";
    }
};

class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, const std::string& method, const std::string& path)
            : app_(app), req_(createRequest(method, path)) {}

        RequestBuilder& send(const nlohmann::json& body) {
            return sendRaw(body.dump(), "application/json");
        }

        RequestBuilder& sendRaw(const std::string& body, const std::string& contentType) {
            req_.rawBody = body;
            req_.headers["content-type"] = contentType;
            return *this;
        }

        RequestBuilder& query(const std::string& key, const std::string& value) {
            req_.query[key] = value;
            return *this;
        }

        // Body parsing is left to the app's own middleware.
        TestResult exec() {
            auto res = createResponse();
            app_.handleRequest(req_, res);
            return {res.getStatusCode(), res.getBody(), res.getHeaders()};
        }

        TestResult expect(int status) {
            auto result = exec();
            if (result.status != status) {
                throw std::runtime_error("expected " + std::to_string(status) + ", got " +
                                         std::to_string(result.status) + ": " + result.body);
            }
            return result;
        }

    private:
        http::Server& app_;
        http::Request req_;
    };

    RequestBuilder get(const std::string& path) { return {app_, "GET", path}; }
    RequestBuilder post(const std::string& path) { return {app_, "POST", path}; }
    RequestBuilder put(const std::string& path) { return {app_, "PUT", path}; }
    RequestBuilder del(const std::string& path) { return {app_, "DELETE", path}; }

private:
    http::Server& app_;
};

} // namespace pqcache::testing
