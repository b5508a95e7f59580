#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/routes.h — HTTP surface of the share engine
// ═══════════════════════════════════════════════════════════════════
//
//    POST   /upload               multipart files      → 201
//    GET    /download/:id         attachment           → 200 | 404
//    POST   /share-text           raw text body        → 201
//    GET    /text/:id             raw text             → 200 | 400 | 404
//    GET    /list                 entries + usage      → 200
//    DELETE /item/:id             idempotent delete    → 204
//    GET    /stats                usage summary        → 200
//    POST   /cleanup              sweep now            → 200
//
//  plus the /api/... aliases used by the browser client. Errors are
//  {"error": <reason>, "message": <text>}.
// ═══════════════════════════════════════════════════════════════════

#include "errors.h"
#include "http.h"
#include "share_service.h"

#include <exception>

namespace quickshare::routes {

// ── Translate an engine error into an HTTP response ──
void sendError(http::Response& res, const errors::ValidationError& e);
void sendError(http::Response& res, const errors::NotFound& e);
void sendError(http::Response& res, const errors::StorageError& e);

// ── Wrap a handler so engine errors become HTTP errors ──
template <typename Handler>
http::RouteHandler guarded(Handler handler) {
    return [handler = std::move(handler)](http::Request& req, http::Response& res) mutable {
        try {
            handler(req, res);
        } catch (const errors::ValidationError& e) {
            sendError(res, e);
        } catch (const errors::NotFound& e) {
            sendError(res, e);
        } catch (const errors::StorageError& e) {
            sendError(res, e);
        }
    };
}

// Largest /upload body the engine can accept.
std::uint64_t uploadBodyLimit(const ShareService& service);

void registerRoutes(http::Server& app, ShareService& service);

// Server with CORS, request logging and every route registered.
http::Server createApp(ShareService& service, http::ServerOptions options = {});

} // namespace quickshare::routes
