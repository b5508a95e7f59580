#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/middleware.h — Router middleware
// ═══════════════════════════════════════════════════════════════════
//
//  Included middleware:
//    • cors()             — Cross-Origin Resource Sharing
//    • requestLogger()    — Request logging (like Morgan)
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "console.h"
#include <chrono>
#include <string>

namespace quickshare::middleware {

// ── CORS Configuration ──
struct CorsOptions {
    std::string origin       = "*";
    std::string methods      = "GET, POST, DELETE, OPTIONS";
    std::string allowHeaders = "Content-Type, X-Requested-With";
    std::string exposeHeaders = "Content-Disposition, X-QuickShare-Result";
    int         maxAge       = 86400; // seconds
};

// ═══════════════════════════════════════════
//  cors — Cross-Origin Resource Sharing
// ═══════════════════════════════════════════
inline http::MiddlewareFunction cors(CorsOptions options = {}) {
    return [options](http::Request& req, http::Response& res, http::NextFunction next) {
        res.set("Access-Control-Allow-Origin", options.origin);
        res.set("Access-Control-Allow-Methods", options.methods);
        res.set("Access-Control-Allow-Headers", options.allowHeaders);

        if (!options.exposeHeaders.empty()) {
            res.set("Access-Control-Expose-Headers", options.exposeHeaders);
        }

        // Preflight
        if (req.method == "OPTIONS") {
            res.set("Access-Control-Max-Age", std::to_string(options.maxAge));
            res.status(204).end();
            return;
        }

        next();
    };
}

// ═══════════════════════════════════════════
//  requestLogger — Morgan-style request logging
// ═══════════════════════════════════════════
inline http::MiddlewareFunction requestLogger() {
    return [](http::Request& req, http::Response& res, http::NextFunction next) {
        auto start = std::chrono::steady_clock::now();
        console::debug(req.method, req.path, "from", req.ip);

        next();

        auto elapsed = std::chrono::steady_clock::now() - start;
        auto ms = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;

        int status = res.getStatusCode();
        std::string statusStr = std::to_string(status);

        if (status >= 500) {
            console::error(req.method, req.path, statusStr, req.ip,
                           std::to_string(ms) + "ms");
        } else if (status >= 400) {
            console::warn(req.method, req.path, statusStr, req.ip,
                          std::to_string(ms) + "ms");
        } else {
            console::success(req.method, req.path, statusStr, req.ip,
                             std::to_string(ms) + "ms");
        }
    };
}

} // namespace quickshare::middleware
