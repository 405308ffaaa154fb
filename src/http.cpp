// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Middleware dispatch and Boost.Beast transport
// ═══════════════════════════════════════════════════════════════════

#include "pqcache/http.h"
#include "pqcache/console.h"
#include "pqcache/error.h"

#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace pqcache::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

namespace detail {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

inline std::string urlDecode(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()
            && hexValue(str[i + 1]) >= 0 && hexValue(str[i + 2]) >= 0) {
            result += static_cast<char>(hexValue(str[i + 1]) * 16 + hexValue(str[i + 2]));
            i += 2;
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

inline std::pair<std::string, std::string> splitUrl(const std::string& url) {
    auto pos = url.find('?');
    if (pos == std::string::npos) return {url, ""};
    return {url.substr(0, pos), url.substr(pos + 1)};
}

inline QueryParams parseQueryString(const std::string& qs) {
    QueryParams result;
    if (qs.empty()) return result;

    std::istringstream stream(qs);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
        } else {
            result[urlDecode(pair)] = "";
        }
    }
    return result;
}

} // namespace detail

struct Route {
    std::string  method;        // "*" matches any
    std::string  path;
    RouteHandler handler;
};

// ═══════════════════════════════════════════
//  Server::Impl
// ═══════════════════════════════════════════
struct Server::Impl {
    std::vector<MiddlewareFunction>  middlewares;
    std::vector<Route>               routes;
    std::unique_ptr<net::io_context> ioc;
    bool running = false;

    void runChain(Request& req, Response& res, std::size_t index) {
        if (res.headersSent()) return;
        if (index >= middlewares.size()) {
            route(req, res);
            return;
        }
        middlewares[index](req, res, [this, &req, &res, index]() {
            runChain(req, res, index + 1);
        });
    }

    void route(Request& req, Response& res) {
        if (res.headersSent()) return;

        for (auto& r : routes) {
            if ((r.method == req.method || r.method == "*") && r.path == req.path) {
                r.handler(req, res);
                return;
            }
        }

        res.status(404).json(nlohmann::json{
            {"error", "Not Found"},
            {"message", "Cannot " + req.method + " " + req.path}
        });
    }

    // Framework error boundary.
    void dispatch(Request& req, Response& res) {
        try {
            runChain(req, res, 0);
        } catch (const HttpQueryError& e) {
            if (e.statusCode() >= 500) {
                console::error(req.method, req.path, e.statusCode(), e.what());
            }
            sendHttpQueryError(res, e);
        } catch (const std::exception& e) {
            console::error("Unhandled error on", req.method, req.path + ":", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{
                    {"error", "Internal Server Error"},
                    {"message", e.what()}
                });
            }
        }
    }
};

// ═══════════════════════════════════════════
//  HttpSession — one connection, keep-alive aware
// ═══════════════════════════════════════════
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, Server::Impl& server)
        : socket_(std::move(socket))
        , server_(server)
    {}

    void run() {
        readRequest();
    }

private:
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::string_body> beastRequest_;
    Server::Impl& server_;

    void readRequest() {
        auto self = shared_from_this();
        bhttp::async_read(
            socket_, buffer_, beastRequest_,
            [self](beast::error_code ec, std::size_t) {
                if (ec == bhttp::error::end_of_stream) {
                    self->shutdown();
                } else if (!ec) {
                    self->processRequest();
                }
            }
        );
    }

    void shutdown() {
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_send, ec);
    }

    Request buildRequest() {
        Request req;
        req.method = std::string(beastRequest_.method_string());
        req.url    = std::string(beastRequest_.target());

        auto [path, queryString] = detail::splitUrl(req.url);
        req.path    = path;
        req.query   = detail::parseQueryString(queryString);
        req.rawBody = beastRequest_.body();

        beast::error_code ec;
        auto endpoint = socket_.remote_endpoint(ec);
        req.ip = ec ? "unknown" : endpoint.address().to_string();

        for (auto& field : beastRequest_) {
            req.headers[detail::toLower(std::string(field.name_string()))]
                = std::string(field.value());
        }
        return req;
    }

    void write(int statusCode, const Headers& headers, const std::string& body) {
        auto self = shared_from_this();
        auto beastRes = std::make_shared<bhttp::response<bhttp::string_body>>();
        beastRes->result(static_cast<bhttp::status>(statusCode));
        beastRes->version(beastRequest_.version());

        for (auto& [key, value] : headers) {
            if (!value.empty()) beastRes->set(key, value);
        }
        beastRes->body() = body;
        beastRes->keep_alive(beastRequest_.keep_alive());
        beastRes->prepare_payload();

        bhttp::async_write(
            socket_, *beastRes,
            [self, beastRes](beast::error_code ec, std::size_t) {
                if (!ec && self->beastRequest_.keep_alive()) {
                    self->buffer_.consume(self->buffer_.size());
                    self->beastRequest_ = {};
                    self->readRequest();
                } else {
                    self->shutdown();
                }
            }
        );
    }

    void processRequest() {
        auto self = shared_from_this();
        auto req = buildRequest();

        Response res([self](int statusCode, const Headers& headers, const std::string& body) {
            self->write(statusCode, headers, body);
        });

        server_.dispatch(req, res);

        if (!res.headersSent()) {
            res.status(404).json(nlohmann::json{
                {"error", "Not Found"},
                {"message", "No response sent by handler"}
            });
        }
    }
};

// ═══════════════════════════════════════════
//  HttpListener — accept loop
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, tcp::endpoint endpoint, Server::Impl& server)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) throw std::runtime_error("Failed to open acceptor: " + ec.message());

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) throw std::runtime_error("Failed to set reuse_address: " + ec.message());

        acceptor_.bind(endpoint, ec);
        if (ec) throw std::runtime_error("Failed to bind to port: " + ec.message());

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) throw std::runtime_error("Failed to listen: " + ec.message());
    }

    void run() {
        doAccept();
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    Server::Impl&    server_;

    void doAccept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::onAccept, shared_from_this())
        );
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            console::warn("accept failed:", ec.message());
        } else {
            std::make_shared<HttpSession>(std::move(socket), server_)->run();
        }
        doAccept();
    }
};

// ═══════════════════════════════════════════
//  Server
// ═══════════════════════════════════════════

Server::Server()
    : impl_(std::make_unique<Impl>())
{}

Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

Server& Server::route(const std::string& method, const std::string& path, RouteHandler handler) {
    impl_->routes.push_back({method, path, std::move(handler)});
    return *this;
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->dispatch(req, res);
}

void Server::listen(int port, std::function<void()> callback) {
    listen("0.0.0.0", port, std::move(callback));
}

void Server::listen(const std::string& host, int port, std::function<void()> callback) {
    impl_->ioc = std::make_unique<net::io_context>(1);

    auto endpoint = tcp::endpoint(net::ip::make_address(host),
                                  static_cast<unsigned short>(port));

    std::make_shared<HttpListener>(*impl_->ioc, endpoint, *impl_)->run();
    impl_->running = true;

    if (callback) {
        callback();
    }

    impl_->ioc->run();
}

void Server::close() {
    if (impl_->ioc && impl_->running) {
        impl_->running = false;
        impl_->ioc->stop();
    }
}

} // namespace pqcache::http
