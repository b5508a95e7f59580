// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Boost.Beast-powered HTTP(S) server implementation
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/http.h"
#include "quickshare/console.h"
#include "quickshare/tls.h"

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <chrono>
#include <csignal>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace quickshare::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace ssl    = boost::asio::ssl;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

// ═══════════════════════════════════════════
//  FileStream
// ═══════════════════════════════════════════

FileStream::~FileStream() {
    if (fd_ >= 0) ::close(fd_);
}

FileStream::FileStream(FileStream&& other) noexcept
    : fd_(other.fd_), size_(other.size_) {
    other.fd_ = -1;
    other.size_ = 0;
}

FileStream& FileStream::operator=(FileStream&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = other.fd_;
        size_ = other.size_;
        other.fd_ = -1;
        other.size_ = 0;
    }
    return *this;
}

int FileStream::release() noexcept {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

std::size_t FileStream::readAt(std::uint64_t offset, char* out, std::size_t n) const {
    for (;;) {
        auto got = ::pread(fd_, out, n, static_cast<off_t>(offset));
        if (got >= 0) return static_cast<std::size_t>(got);
        if (errno != EINTR) {
            throw std::runtime_error(std::string("Failed to read file body: ") + std::strerror(errno));
        }
    }
}

std::string FileStream::readAll() const {
    std::string data(static_cast<std::size_t>(size_), '\0');
    std::size_t done = 0;
    while (done < data.size()) {
        auto n = readAt(done, data.data() + done, data.size() - done);
        if (n == 0) break;
        done += n;
    }
    data.resize(done);
    return data;
}

// ═══════════════════════════════════════════
//  Response::sendFile
// ═══════════════════════════════════════════

void Response::sendFile(FileStream file) {
    if (sent_) return;
    sent_ = true;
    if (headers_.find("Content-Type") == headers_.end()) {
        headers_["Content-Type"] = "application/octet-stream";
    }
    if (streamCallback_) {
        streamCallback_(statusCode_, headers_, std::move(file));
        return;
    }
    body_ = file.readAll();
    if (sendCallback_) {
        sendCallback_(statusCode_, headers_, body_);
    }
}

// ═══════════════════════════════════════════
//  Internal: Compiled route with regex
// ═══════════════════════════════════════════
struct CompiledRoute {
    std::string method;
    std::string pattern;
    std::regex  regex;
    std::vector<std::string> paramNames;
    RouteHandler handler;
    RouteOptions options;
};

namespace detail {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

inline std::string urlDecode(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hex = 0;
            std::istringstream iss(str.substr(i + 1, 2));
            if (iss >> std::hex >> hex) {
                result += static_cast<char>(hex);
                i += 2;
            } else {
                result += str[i];
            }
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

inline std::string pathOf(const std::string& url) {
    return url.substr(0, url.find('?'));
}

inline CompiledRoute compileRoute(const std::string& method,
                                  const std::string& pattern,
                                  RouteHandler handler,
                                  RouteOptions options) {
    CompiledRoute route;
    route.method  = method;
    route.pattern = pattern;
    route.handler = std::move(handler);
    route.options = std::move(options);

    std::string regexStr;
    std::size_t pos = 0;

    while (pos < pattern.size()) {
        char c = pattern[pos];
        if (c == ':') {
            // Route parameter — :paramName
            pos++;
            std::string paramName;
            while (pos < pattern.size() && pattern[pos] != '/') {
                paramName += pattern[pos++];
            }
            route.paramNames.push_back(paramName);
            regexStr += "([^/]+)";
        } else {
            if (c == '.' || c == '(' || c == ')' ||
                c == '[' || c == ']' || c == '{' ||
                c == '}' || c == '+' || c == '?' ||
                c == '^' || c == '$' || c == '|' || c == '*') {
                regexStr += '\\';
            }
            regexStr += c;
            pos++;
        }
    }

    route.regex = std::regex("^" + regexStr + "$");
    return route;
}

// Path-only match; the caller decides what a method mismatch means.
inline bool matchPath(const CompiledRoute& route,
                      const std::string& path,
                      std::unordered_map<std::string, std::string>& params) {
    std::smatch match;
    if (!std::regex_match(path, match, route.regex)) return false;
    for (std::size_t i = 0; i < route.paramNames.size(); ++i) {
        params[route.paramNames[i]] = urlDecode(match[i + 1].str());
    }
    return true;
}

} // namespace detail

// ═══════════════════════════════════════════
//  Server::Impl — Hidden implementation
// ═══════════════════════════════════════════
struct Server::Impl {
    ServerOptions                     options;
    std::vector<MiddlewareFunction>   middlewares;
    std::vector<CompiledRoute>        routes;
    std::unique_ptr<net::io_context>  ioc;
    std::unique_ptr<net::thread_pool> workers;
    std::function<void(int)>          signalCallback;
    std::atomic<bool>                 running{false};
    std::atomic<int>                  port{0};

    // Options of the route that will handle method + path, if any
    const RouteOptions* findRouteOptions(const std::string& method,
                                         const std::string& path) const {
        for (auto& route : routes) {
            if (route.method != method) continue;
            std::unordered_map<std::string, std::string> params;
            if (detail::matchPath(route, path, params)) return &route.options;
        }
        return nullptr;
    }

    void executeMiddlewareChain(Request& req, Response& res,
                                std::size_t index,
                                std::function<void()> done) {
        if (res.headersSent()) return;
        if (index >= middlewares.size()) {
            done();
            return;
        }

        auto& mw = middlewares[index];
        mw(req, res, [this, &req, &res, index, done = std::move(done)]() {
            executeMiddlewareChain(req, res, index + 1, std::move(done));
        });
    }

    // ── Request handler: middleware chain → route matching ──
    void handleRequest(Request& req, Response& res) {
        executeMiddlewareChain(req, res, 0, [this, &req, &res]() {
            if (res.headersSent()) return;

            std::vector<std::string> allowed;
            for (auto& route : routes) {
                std::unordered_map<std::string, std::string> params;
                if (!detail::matchPath(route, req.path, params)) continue;

                if (route.method == req.method) {
                    req.params = std::move(params);
                    route.handler(req, res);
                    return;
                }
                if (std::find(allowed.begin(), allowed.end(), route.method) == allowed.end()) {
                    allowed.push_back(route.method);
                }
            }

            if (!allowed.empty()) {
                std::string allow;
                for (auto& m : allowed) {
                    if (!allow.empty()) allow += ", ";
                    allow += m;
                }
                res.status(405).set("Allow", allow).json(nlohmann::json{
                    {"error", "method_not_allowed"},
                    {"message", req.method + " is not supported on " + req.path}
                });
                return;
            }

            res.status(404).json(nlohmann::json{
                {"error", "not_found"},
                {"message", "Cannot " + req.method + " " + req.path}
            });
        });
    }
};

// ═══════════════════════════════════════════
//  HttpSession — one connection, plain or TLS
//  CRTP: Derived supplies stream(), run() and doEof().
//
//  Headers are read with an empty_body parser, so the route's body
//  limit, spooling and inspection are settled before any body byte
//  is read. The body then arrives in fixed-size chunks. Handlers run
//  on the worker pool; responses are written back on the
//  connection's strand.
// ═══════════════════════════════════════════
template <class Derived>
class HttpSession {
public:
    explicit HttpSession(Server::Impl& server) : server_(server) {}

protected:
    beast::flat_buffer buffer_;
    Server::Impl& server_;

    void readHeader() {
        headerParser_.emplace();
        // Checked per route in onHeader
        headerParser_->body_limit(boost::none);

        beast::get_lowest_layer(derived().stream()).expires_after(
            std::chrono::seconds(server_.options.headerTimeoutSeconds));
        bhttp::async_read_header(
            derived().stream(), buffer_, *headerParser_,
            beast::bind_front_handler(&HttpSession::onHeader, derived().shared_from_this()));
    }

private:
    static constexpr std::size_t kChunkBytes = 64 * 1024;

    struct Exchange {
        Request  req;
        Response res;
    };

    std::optional<bhttp::request_parser<bhttp::empty_body>>  headerParser_;
    std::optional<bhttp::request_parser<bhttp::buffer_body>> bodyParser_;
    std::vector<char>              chunk_;
    Request                        request_;
    std::uint64_t                  spooled_ = 0;
    std::uint64_t                  bodyLimit_ = 0;
    std::unique_ptr<BodyInspector> inspector_;
    unsigned                       version_ = 11;
    bool                           keepAlive_ = true;

    Derived& derived() { return static_cast<Derived&>(*this); }

    void onHeader(beast::error_code ec, std::size_t) {
        if (ec == bhttp::error::end_of_stream) {
            derived().doEof();
            return;
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                console::debug("Header read failed:", ec.message());
            }
            return;
        }

        auto& header = headerParser_->get();
        version_   = header.version();
        keepAlive_ = header.keep_alive();
        request_   = buildRequest(header);

        const RouteOptions* route = server_.findRouteOptions(request_.method, request_.path);
        bodyLimit_ = route && route->bodyLimit > 0 ? route->bodyLimit : server_.options.bodyLimit;

        auto declared = headerParser_->content_length();
        if (declared && *declared > bodyLimit_) {
            rejectTooLarge();
            return;
        }

        spooled_ = 0;
        inspector_.reset();
        try {
            if (route && !route->spoolDir.empty()) {
                request_.bodyFile = openSpool(route->spoolDir);
            }
            if (route && route->inspector) {
                inspector_ = route->inspector(request_);
            }
        } catch (const std::exception& e) {
            console::error("Cannot take request body for", request_.path, ":", e.what());
            reject({500, "internal_error", "The server could not accept the request body"});
            return;
        }

        bodyParser_.emplace(std::move(*headerParser_));
        bodyParser_->body_limit(bodyLimit_);
        headerParser_.reset();

        beast::get_lowest_layer(derived().stream()).expires_after(
            std::chrono::seconds(server_.options.bodyTimeoutSeconds));

        if (beast::iequals(bodyParser_->get()[bhttp::field::expect], "100-continue")) {
            auto cont = std::make_shared<bhttp::response<bhttp::empty_body>>(
                bhttp::status::continue_, version_);
            bhttp::async_write(
                derived().stream(), *cont,
                [self = derived().shared_from_this(), cont](beast::error_code wec, std::size_t) {
                    if (!wec) self->readChunk();
                });
            return;
        }
        readChunk();
    }

    Request buildRequest(const bhttp::request_parser<bhttp::empty_body>::value_type& header) {
        Request req;
        req.method = std::string(header.method_string());
        req.url    = std::string(header.target());
        req.path   = detail::pathOf(req.url);

        beast::error_code epEc;
        auto endpoint = beast::get_lowest_layer(derived().stream()).socket().remote_endpoint(epEc);
        req.ip = epEc ? "unknown" : endpoint.address().to_string();

        for (auto& field : header) {
            req.headers[detail::toLower(std::string(field.name_string()))]
                = std::string(field.value());
        }
        return req;
    }

    // Unlinked at once: nothing is left behind if the connection drops.
    static FileStream openSpool(const std::filesystem::path& dir) {
        std::string path = (dir / "body.XXXXXX").string();
        int fd = ::mkostemp(path.data(), O_CLOEXEC);
        if (fd < 0) {
            throw std::runtime_error("Failed to create spool file in " + dir.string() + ": " +
                                     std::strerror(errno));
        }
        ::unlink(path.c_str());
        return FileStream(fd, 0);
    }

    void readChunk() {
        if (bodyParser_->is_done()) {
            dispatch();
            return;
        }
        if (chunk_.empty()) chunk_.resize(kChunkBytes);

        auto& body = bodyParser_->get().body();
        body.data = chunk_.data();
        body.size = chunk_.size();
        bhttp::async_read(
            derived().stream(), buffer_, *bodyParser_,
            beast::bind_front_handler(&HttpSession::onChunk, derived().shared_from_this()));
    }

    void onChunk(beast::error_code ec, std::size_t) {
        if (ec == bhttp::error::need_buffer) ec = {};
        if (ec == bhttp::error::body_limit) {
            rejectTooLarge();
            return;
        }
        if (ec) {
            // Client went away mid-body: the handler never runs, nothing is stored.
            if (ec != net::error::operation_aborted) {
                console::debug("Request read failed:", ec.message());
            }
            return;
        }

        std::string_view data(chunk_.data(), chunk_.size() - bodyParser_->get().body().size);
        if (!data.empty()) {
            if (auto rejection = consume(data)) {
                reject(*rejection);
                return;
            }
        }
        readChunk();
    }

    std::optional<BodyRejection> consume(std::string_view data) {
        if (request_.bodyFile.isOpen()) {
            std::string_view rest = data;
            while (!rest.empty()) {
                auto n = ::write(request_.bodyFile.fd(), rest.data(), rest.size());
                if (n < 0) {
                    if (errno == EINTR) continue;
                    console::error("Failed to spool request body:", std::strerror(errno));
                    return BodyRejection{500, "internal_error",
                                         "The server could not accept the request body"};
                }
                rest.remove_prefix(static_cast<std::size_t>(n));
                spooled_ += static_cast<std::uint64_t>(n);
            }
        } else {
            request_.rawBody.append(data.data(), data.size());
        }
        if (inspector_) return inspector_->inspect(data);
        return std::nullopt;
    }

    void rejectTooLarge() {
        reject({413, "payload_too_large",
                "Request body exceeds " + std::to_string(bodyLimit_) + " bytes"});
    }

    void reject(const BodyRejection& rejection) {
        auto res = std::make_shared<bhttp::response<bhttp::string_body>>(
            static_cast<bhttp::status>(rejection.status), version_);
        res->set(bhttp::field::content_type, "application/json; charset=utf-8");
        res->set(bhttp::field::access_control_allow_origin, "*");
        res->body() = nlohmann::json{
            {"error", rejection.error},
            {"message", rejection.message}
        }.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        res->keep_alive(false);
        res->prepare_payload();

        headerParser_.reset();
        bodyParser_.reset();
        inspector_.reset();
        request_ = Request{};
        write(std::move(res));
    }

    // ── Hand the complete request to the worker pool ──
    void dispatch() {
        bodyParser_.reset();
        inspector_.reset();
        if (request_.bodyFile.isOpen()) {
            request_.bodyFile = FileStream(request_.bodyFile.release(), spooled_);
        }

        auto exchange = std::make_shared<Exchange>();
        exchange->req = std::move(request_);
        exchange->res = makeResponse();
        request_ = Request{};

        net::post(*server_.workers, [self = derived().shared_from_this(), exchange] {
            self->runHandler(exchange->req, exchange->res);
        });
    }

    // Runs on a worker thread.
    void runHandler(Request& req, Response& res) {
        try {
            server_.handleRequest(req, res);
        } catch (const std::exception& e) {
            console::error("Unhandled error on", req.method, req.path, ":", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{
                    {"error", "internal_error"},
                    {"message", "Internal server error"}
                });
            }
        }

        if (!res.headersSent()) {
            res.status(404).json(nlohmann::json{
                {"error", "not_found"},
                {"message", "No response sent by handler"}
            });
        }
    }

    // ── Build Response with Beast write callbacks ──
    //    The callbacks fire on a worker thread and post the write back
    //    to the connection's executor.
    Response makeResponse() {
        auto self = derived().shared_from_this();
        const unsigned version = version_;
        const bool keepAlive = keepAlive_;

        Response res([self, version, keepAlive](int statusCode,
                                                const Headers& headers,
                                                const std::string& body) {
            auto beastRes = std::make_shared<bhttp::response<bhttp::string_body>>();
            beastRes->result(static_cast<bhttp::status>(statusCode));
            beastRes->version(version);
            for (auto& [key, value] : headers) {
                if (!value.empty()) beastRes->set(key, value);
            }
            beastRes->body() = body;
            beastRes->keep_alive(keepAlive);
            beastRes->prepare_payload();
            self->deliver(std::move(beastRes));
        });

        res.onStream([self, version, keepAlive](int statusCode,
                                                const Headers& headers,
                                                FileStream file) {
            beast::file body;
            body.native_handle(file.release());

            auto beastRes = std::make_shared<bhttp::response<bhttp::file_body>>();
            beastRes->result(static_cast<bhttp::status>(statusCode));
            beastRes->version(version);
            for (auto& [key, value] : headers) {
                if (!value.empty()) beastRes->set(key, value);
            }

            beast::error_code ec;
            beastRes->body().reset(std::move(body), ec);
            if (ec) {
                console::error("Failed to prepare file body:", ec.message());
                auto err = std::make_shared<bhttp::response<bhttp::string_body>>(
                    bhttp::status::internal_server_error, version);
                err->set(bhttp::field::content_type, "application/json; charset=utf-8");
                err->body() = R"({"error":"storage_error","message":"Failed to read payload"})";
                err->keep_alive(false);
                err->prepare_payload();
                self->deliver(std::move(err));
                return;
            }
            beastRes->keep_alive(keepAlive);
            beastRes->prepare_payload();
            self->deliver(std::move(beastRes));
        });
        return res;
    }

    template <class Body>
    void deliver(std::shared_ptr<bhttp::response<Body>> res) {
        net::post(derived().stream().get_executor(),
                  [self = derived().shared_from_this(), res = std::move(res)]() mutable {
                      self->write(std::move(res));
                  });
    }

    template <class Body>
    void write(std::shared_ptr<bhttp::response<Body>> res) {
        auto self = derived().shared_from_this();
        const bool close = res->need_eof();
        beast::get_lowest_layer(derived().stream()).expires_after(
            std::chrono::seconds(server_.options.bodyTimeoutSeconds));
        bhttp::async_write(
            derived().stream(), *res,
            [self, res, close](beast::error_code ec, std::size_t) {
                if (ec) return;
                if (close) {
                    self->doEof();
                    return;
                }
                self->readHeader();
            });
    }
};

// ═══════════════════════════════════════════
//  PlainHttpSession
// ═══════════════════════════════════════════
class PlainHttpSession
    : public HttpSession<PlainHttpSession>
    , public std::enable_shared_from_this<PlainHttpSession> {
public:
    PlainHttpSession(tcp::socket&& socket, Server::Impl& server)
        : HttpSession<PlainHttpSession>(server)
        , stream_(std::move(socket)) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&PlainHttpSession::start, shared_from_this()));
    }

    beast::tcp_stream& stream() { return stream_; }

    void doEof() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

private:
    beast::tcp_stream stream_;

    void start() { readHeader(); }
};

// ═══════════════════════════════════════════
//  SslHttpSession
// ═══════════════════════════════════════════
class SslHttpSession
    : public HttpSession<SslHttpSession>
    , public std::enable_shared_from_this<SslHttpSession> {
public:
    SslHttpSession(tcp::socket&& socket, ssl::context& ctx, Server::Impl& server)
        : HttpSession<SslHttpSession>(server)
        , stream_(std::move(socket), ctx) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&SslHttpSession::start, shared_from_this()));
    }

    beast::ssl_stream<beast::tcp_stream>& stream() { return stream_; }

    void doEof() {
        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(30));
        stream_.async_shutdown(
            [self = shared_from_this()](beast::error_code) {});
    }

private:
    beast::ssl_stream<beast::tcp_stream> stream_;

    void start() {
        beast::get_lowest_layer(stream_).expires_after(
            std::chrono::seconds(server_.options.headerTimeoutSeconds));
        stream_.async_handshake(
            ssl::stream_base::server,
            beast::bind_front_handler(&SslHttpSession::onHandshake, shared_from_this()));
    }

    void onHandshake(beast::error_code ec) {
        if (ec) {
            console::debug("TLS handshake failed:", ec.message());
            return;
        }
        readHeader();
    }
};

// ═══════════════════════════════════════════
//  Listener — Accepts incoming TCP connections
// ═══════════════════════════════════════════
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc, tcp::endpoint endpoint, Server::Impl& server,
                 ssl::context* sslContext)
        : ioc_(ioc)
        , acceptor_(net::make_strand(ioc))
        , server_(server)
        , sslContext_(sslContext)
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

    int port() const {
        beast::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    Server::Impl&    server_;
    ssl::context*    sslContext_;

    void doAccept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            beast::bind_front_handler(&HttpListener::onAccept, shared_from_this()));
    }

    void onAccept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) return;
        if (!ec) {
            if (sslContext_) {
                std::make_shared<SslHttpSession>(std::move(socket), *sslContext_, server_)->run();
            } else {
                std::make_shared<PlainHttpSession>(std::move(socket), server_)->run();
            }
        } else {
            console::warn("Accept failed:", ec.message());
        }
        doAccept();
    }
};

// ═══════════════════════════════════════════
//  Server — Public API implementation
// ═══════════════════════════════════════════

Server::Server(ServerOptions options)
    : impl_(std::make_unique<Impl>())
{
    impl_->options = options;
}

Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::use(MiddlewareFunction middleware) {
    impl_->middlewares.push_back(std::move(middleware));
    return *this;
}

void Server::addRoute(const std::string& method,
                      const std::string& pattern,
                      RouteHandler handler,
                      RouteOptions options) {
    impl_->routes.push_back(
        detail::compileRoute(method, pattern, std::move(handler), std::move(options)));
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handleRequest(req, res);
}

const ServerOptions& Server::options() const {
    return impl_->options;
}

int Server::port() const {
    return impl_->port;
}

void Server::handleSignals(std::function<void(int)> callback) {
    impl_->signalCallback = std::move(callback);
}

void Server::listen(const std::string& host, int port,
                    const tls::Context* tlsContext,
                    std::function<void()> callback) {
    const int threads = std::max(1, impl_->options.threads);
    impl_->ioc = std::make_unique<net::io_context>(threads);
    impl_->workers = std::make_unique<net::thread_pool>(
        static_cast<std::size_t>(std::max(1, impl_->options.workerThreads)));

    auto address  = net::ip::make_address(host);
    auto endpoint = tcp::endpoint(address, static_cast<unsigned short>(port));

    ssl::context* sslContext =
        (tlsContext && tlsContext->enabled()) ? &tlsContext->native() : nullptr;

    auto listener = std::make_shared<HttpListener>(*impl_->ioc, endpoint, *impl_, sslContext);
    listener->run();
    impl_->port = listener->port();

    std::optional<net::signal_set> signals;
    if (impl_->signalCallback) {
        signals.emplace(*impl_->ioc, SIGINT, SIGTERM);
        signals->async_wait([this](const beast::error_code& ec, int sig) {
            if (ec) return;
            impl_->signalCallback(sig);
            close();
        });
    }

    impl_->running = true;

    if (callback) {
        callback();
    }

    std::vector<std::thread> pool;
    pool.reserve(static_cast<std::size_t>(threads - 1));
    for (int i = 1; i < threads; ++i) {
        pool.emplace_back([ioc = impl_->ioc.get()] { ioc->run(); });
    }
    impl_->ioc->run();

    for (auto& t : pool) t.join();
    // Handlers still running finish; their responses have nowhere to go
    impl_->workers->join();
    impl_->running = false;
    impl_->port = 0;
}

void Server::close() {
    if (impl_->ioc && impl_->running.exchange(false)) {
        impl_->ioc->stop();
    }
}

} // namespace quickshare::http
