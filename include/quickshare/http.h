#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/http.h — HTTP Server, Request, Response and routing
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto app = http::createServer({.bodyLimit = 64 * 1024 * 1024});
//    app.get("/download/:id", [](auto& req, auto& res) {
//        res.sendFile(openPayload(req.params["id"]));
//    });
//    app.post("/notes", saveNote, {.bodyLimit = 1024 * 1024});
//    app.listen("0.0.0.0", 8000, nullptr, []{ console::info("up"); });
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace quickshare::tls {
class Context;
}

namespace quickshare::http {

// ── Forward declarations ──
class Request;
class Response;
class Server;

// ── Type aliases ──
using Headers            = std::unordered_map<std::string, std::string>;
using NextFunction       = std::function<void()>;
using MiddlewareFunction = std::function<void(Request&, Response&, NextFunction)>;
using RouteHandler       = std::function<void(Request&, Response&)>;

// ═══════════════════════════════════════════════════════════════════
//  class FileStream
//  Owning handle on an open, readable file descriptor. Lets a handler
//  open a payload while it holds a lock and hand the descriptor to the
//  transport, which streams it after the lock is gone.
// ═══════════════════════════════════════════════════════════════════
class FileStream {
public:
    FileStream() = default;
    FileStream(int fd, std::uint64_t size) noexcept : fd_(fd), size_(size) {}
    ~FileStream();

    FileStream(FileStream&& other) noexcept;
    FileStream& operator=(FileStream&& other) noexcept;
    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;

    bool isOpen() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    std::uint64_t size() const { return size_; }

    // Give up ownership of the descriptor without closing it.
    int release() noexcept;

    // Read up to n bytes at offset without moving the file position;
    // returns 0 at end of file.
    std::size_t readAt(std::uint64_t offset, char* out, std::size_t n) const;

    // Read the whole file from offset 0 without moving the file position.
    std::string readAll() const;

private:
    int fd_ = -1;
    std::uint64_t size_ = 0;
};

// ═══════════════════════════════════════════════════════════════════
//  class Request
//  Represents an incoming HTTP request. The body is fully received
//  before any handler runs: in rawBody, or in bodyFile for routes
//  that spool their body to disk.
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // Full URL including query string
    std::string path;           // URL path without query string
    std::string rawBody;
    FileStream  bodyFile;       // spooled body; unlinked, gone once closed
    std::string ip;

    Headers headers;                                        // lowercase keys
    std::unordered_map<std::string, std::string> params;    // :id -> params["id"]

    // ── Get a header value (case-insensitive) ──
    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }

    // ── Check Content-Type ──
    bool is(const std::string& type) const {
        auto ct = header("content-type");
        return ct.find(type) != std::string::npos;
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  The HTTP response to send back. A SendCallback decouples it from
//  the transport; an optional StreamCallback receives file bodies.
//  Without a StreamCallback, sendFile() reads the file into memory
//  and goes through the SendCallback (this is what tests see).
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using SendCallback = std::function<void(
        int statusCode,
        const Headers& headers,
        const std::string& body
    )>;
    using StreamCallback = std::function<void(
        int statusCode,
        const Headers& headers,
        FileStream file
    )>;

    explicit Response(SendCallback cb)
        : sendCallback_(std::move(cb)) {}

    // Default constructor for testing
    Response() : sendCallback_(nullptr) {}

    // ── Transport hook for streamed file bodies ──
    void onStream(StreamCallback cb) { streamCallback_ = std::move(cb); }

    // ── Set status code (chainable) ──
    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    // ── Set a response header (chainable) ──
    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    Response& type(const std::string& contentType) {
        return set("Content-Type", contentType);
    }

    // ── Send a string body ──
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

    // ── Send any JSON-serializable type ──
    //    Invalid UTF-8 in strings is replaced with U+FFFD instead of throwing.
    template <typename T>
    void json(const T& data) {
        nlohmann::json j;
        if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
            j = data;
        } else {
            j = nlohmann::json(data);
        }
        set("Content-Type", "application/json; charset=utf-8");
        send(dumpJson(j));
    }

    // ── Send JSON with initializer list ──
    //    Supports: res.json({{"key", "value"}, {"count", 5}})
    void json(nlohmann::json::initializer_list_t init) {
        nlohmann::json j(init);
        set("Content-Type", "application/json; charset=utf-8");
        send(dumpJson(j));
    }

    // ── Stream an open file as the body ──
    void sendFile(FileStream file);

    // ── End without body ──
    void end() {
        if (!sent_) {
            send("");
        }
    }

    bool headersSent() const { return sent_; }

    // ── Access the sent response (for testing) ──
    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const Headers& getHeaders() const { return headers_; }

private:
    static std::string dumpJson(const nlohmann::json& j) {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    int statusCode_ = 200;
    Headers headers_;
    bool sent_ = false;
    SendCallback sendCallback_;
    StreamCallback streamCallback_;
    std::string body_;
};

// ═══════════════════════════════════════════════════════════════════
//  Body inspection
//  An inspector sees a request body chunk by chunk while it arrives.
//  A rejection is answered at once and the rest of the body is never
//  read.
// ═══════════════════════════════════════════════════════════════════
struct BodyRejection {
    int         status = 413;
    std::string error;          // {"error": ...}
    std::string message;
};

class BodyInspector {
public:
    virtual ~BodyInspector() = default;
    virtual std::optional<BodyRejection> inspect(std::string_view chunk) = 0;
};

// Called once the headers are in; nullptr means no inspection.
using InspectorFactory = std::function<std::unique_ptr<BodyInspector>(const Request&)>;

// ═══════════════════════════════════════════════════════════════════
//  struct RouteOptions
// ═══════════════════════════════════════════════════════════════════
struct RouteOptions {
    std::uint64_t         bodyLimit = 0;  // 0: ServerOptions::bodyLimit
    std::filesystem::path spoolDir;       // set: body goes to an unlinked file here
    InspectorFactory      inspector;
};

// ═══════════════════════════════════════════════════════════════════
//  struct ServerOptions
// ═══════════════════════════════════════════════════════════════════
struct ServerOptions {
    std::uint64_t bodyLimit   = 8 * 1024 * 1024;  // larger bodies get 413
    int           threads     = 2;                // I/O threads running the loop
    int           workerThreads = 4;              // handlers run here, never on I/O threads
    int           headerTimeoutSeconds = 30;
    int           bodyTimeoutSeconds   = 3600;    // whole-body read deadline
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  HTTP(S) server with routing and middleware.
//  Uses pimpl to hide the Boost.Beast implementation.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    explicit Server(ServerOptions options = {});
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ── Middleware Registration ──
    Server& use(MiddlewareFunction middleware);

    // ── Route Registration ──
    template <typename Handler>
    Server& get(const std::string& path, Handler&& handler, RouteOptions options = {}) {
        addRoute("GET", path, wrapHandler(std::forward<Handler>(handler)), std::move(options));
        return *this;
    }

    template <typename Handler>
    Server& post(const std::string& path, Handler&& handler, RouteOptions options = {}) {
        addRoute("POST", path, wrapHandler(std::forward<Handler>(handler)), std::move(options));
        return *this;
    }

    template <typename Handler>
    Server& del(const std::string& path, Handler&& handler, RouteOptions options = {}) {
        addRoute("DELETE", path, wrapHandler(std::forward<Handler>(handler)), std::move(options));
        return *this;
    }

    // ── Start Listening ──
    //    Blocks until close(). A non-null, enabled TLS context wraps
    //    every accepted connection in TLS.
    void listen(const std::string& host, int port,
                const tls::Context* tlsContext = nullptr,
                std::function<void()> callback = nullptr);

    // ── Stop the server (safe from any thread) ──
    void close();

    // Port actually bound by listen(); useful after listening on port 0.
    // 0 until the listener is up.
    int port() const;

    // ── Run callback on SIGINT/SIGTERM from inside the event loop ──
    void handleSignals(std::function<void(int)> callback);

    const ServerOptions& options() const;

    // ── Process a request (used internally and for testing) ──
    void handleRequest(Request& req, Response& res);

private:
    template <class Derived> friend class HttpSession;
    friend class PlainHttpSession;
    friend class SslHttpSession;
    friend class HttpListener;

    struct Impl;
    std::unique_ptr<Impl> impl_;

    void addRoute(const std::string& method, const std::string& pattern, RouteHandler handler,
                  RouteOptions options);

    template <typename Handler>
    static RouteHandler wrapHandler(Handler&& handler) {
        return [h = std::forward<Handler>(handler)](Request& req, Response& res) mutable {
            h(req, res);
        };
    }
};

inline Server createServer(ServerOptions options = {}) {
    return Server(options);
}

} // namespace quickshare::http
