#pragma once
// ═══════════════════════════════════════════════════════════════════
//  pqcache/http.h — Transport-neutral Request/Response and a small
//                   middleware server used to host the cache pipeline
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    http::Server app;
//    app.use(middleware::bodyParser());
//    app.use(persistCache(config, cache));
//    app.post("/graphql", graphql::executionHandler(executor));
//    app.listen(4000);
//
//  Request and Response know nothing about sockets. Any host adapter
//  that fills a Request and drains a Response through its SendCallback
//  can drive the middleware in this library.
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace pqcache::http {

class Request;
class Response;

using Headers            = std::unordered_map<std::string, std::string>;
using QueryParams        = std::unordered_map<std::string, std::string>;
using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  `body` is filled by the bodyParser middleware, `query` by the
//  transport from the URL query string.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // Full target including query string
    std::string path;           // Target without query string
    std::string rawBody;
    std::string ip;

    Headers     headers;        // Lowercase keys
    QueryParams query;

    JsonValue body;

    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }

    // ── Check Content-Type ──
    bool is(const std::string& type) const {
        return header("content-type").find(type) != std::string::npos;
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  A response is sent at most once; the body that went out stays
//  readable afterwards so downstream-aware middleware can inspect it.
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using SendCallback = std::function<void(
        int statusCode,
        const Headers& headers,
        const std::string& body
    )>;

    explicit Response(SendCallback cb)
        : sendCallback_(std::move(cb)) {}

    Response() : sendCallback_(nullptr) {}

    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    void send(const std::string& body) {
        if (sent_) return;
        sent_ = true;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "text/plain; charset=utf-8";
        }
        body_ = body;
        if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body_);
        }
    }

    void send(const char* body) {
        send(std::string(body));
    }

    template <typename T>
    void json(const T& data) {
        nlohmann::json j;
        if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
            j = data;
        } else if constexpr (std::is_same_v<std::decay_t<T>, JsonValue>) {
            j = data.raw();
        } else {
            j = nlohmann::json(data);
        }
        set("Content-Type", "application/json; charset=utf-8");
        send(j.dump());
    }

    void json(nlohmann::json::initializer_list_t init) {
        json(nlohmann::json(init));
    }

    void end() {
        if (!sent_) send("");
    }

    bool headersSent() const { return sent_; }

    // ── Readable state ──
    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const Headers& getHeaders() const { return headers_; }

    std::string contentType() const {
        auto it = headers_.find("Content-Type");
        return it != headers_.end() ? it->second : "";
    }

private:
    int statusCode_ = 200;
    Headers headers_;
    bool sent_ = false;
    SendCallback sendCallback_;
    std::string body_;
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Middleware chain followed by exact-path routes. Uses pimpl to hide
//  the Boost.Beast transport.
//
//  handleRequest() is also the framework's error boundary: an
//  HttpQueryError escaping the chain becomes a response with its
//  status and headers, any other exception a 500.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    Server();
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    Server& use(MiddlewareFunction middleware);

    Server& get(const std::string& path, RouteHandler handler) {
        return route("GET", path, std::move(handler));
    }

    Server& post(const std::string& path, RouteHandler handler) {
        return route("POST", path, std::move(handler));
    }

    // Matches every method on `path`.
    Server& all(const std::string& path, RouteHandler handler) {
        return route("*", path, std::move(handler));
    }

    Server& route(const std::string& method, const std::string& path, RouteHandler handler);

    // Blocks on the event loop until close().
    void listen(const std::string& host, int port, std::function<void()> callback = nullptr);
    void listen(int port, std::function<void()> callback = nullptr);

    void close();

    void handleRequest(Request& req, Response& res);

    struct Impl;

private:
    std::unique_ptr<Impl> impl_;
};

} // namespace pqcache::http
