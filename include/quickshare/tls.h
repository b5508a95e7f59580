#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/tls.h — TLS/HTTPS server configuration
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    auto ctx = tls::Context::load({.certFile = "cert.pem",
//                                   .keyFile  = "key.pem"});
//    app.listen("0.0.0.0", 8443, &ctx);
//
//  load() validates the material with OpenSSL and throws
//  errors::ConfigError, so a bad pair stops the process before any
//  socket is opened. Certificates are never generated here.
// ═══════════════════════════════════════════════════════════════════

#include <memory>
#include <string>

#include <boost/asio/ssl/context.hpp>

namespace quickshare::tls {

// ── TLS Options ──
struct Options {
    std::string certFile;               // PEM certificate (chain)
    std::string keyFile;                // PEM private key
    std::string passphrase;             // Key passphrase (optional)

    bool enabled() const { return !certFile.empty() || !keyFile.empty(); }
};

// ── TLS Context (server side, shared by all connections) ──
class Context {
public:
    Context() = default;

    static Context load(const Options& opts);

    bool enabled() const { return ctx_ != nullptr; }
    boost::asio::ssl::context& native() const { return *ctx_; }

private:
    std::shared_ptr<boost::asio::ssl::context> ctx_;
};

} // namespace quickshare::tls
