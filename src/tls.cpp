// ═══════════════════════════════════════════════════════════════════
//  src/tls.cpp — Loading and validating certificate/key material
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/tls.h"
#include "quickshare/errors.h"

#include <filesystem>

#include <openssl/ssl.h>

namespace quickshare::tls {

namespace ssl = boost::asio::ssl;

Context Context::load(const Options& opts) {
    if (opts.certFile.empty() || opts.keyFile.empty()) {
        throw errors::ConfigError("Both an SSL certificate and an SSL key are required for HTTPS");
    }
    if (!std::filesystem::is_regular_file(opts.certFile)) {
        throw errors::ConfigError("SSL certificate file not found: " + opts.certFile);
    }
    if (!std::filesystem::is_regular_file(opts.keyFile)) {
        throw errors::ConfigError("SSL key file not found: " + opts.keyFile);
    }

    auto ctx = std::make_shared<ssl::context>(ssl::context::tls_server);
    ctx->set_options(ssl::context::default_workarounds |
                     ssl::context::no_sslv2 |
                     ssl::context::no_sslv3 |
                     ssl::context::no_tlsv1 |
                     ssl::context::no_tlsv1_1 |
                     ssl::context::single_dh_use);

    if (!opts.passphrase.empty()) {
        auto passphrase = opts.passphrase;
        ctx->set_password_callback(
            [passphrase](std::size_t, ssl::context::password_purpose) { return passphrase; });
    }

    boost::system::error_code ec;
    ctx->use_certificate_chain_file(opts.certFile, ec);
    if (ec) {
        throw errors::ConfigError("Invalid SSL certificate '" + opts.certFile + "': " + ec.message());
    }
    ctx->use_private_key_file(opts.keyFile, ssl::context::pem, ec);
    if (ec) {
        throw errors::ConfigError("Invalid SSL key '" + opts.keyFile + "': " + ec.message());
    }
    if (SSL_CTX_check_private_key(ctx->native_handle()) != 1) {
        throw errors::ConfigError("SSL key does not match certificate " + opts.certFile);
    }

    Context result;
    result.ctx_ = std::move(ctx);
    return result;
}

} // namespace quickshare::tls
