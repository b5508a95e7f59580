// ═══════════════════════════════════════════════════════════════════
//  routes.cpp — Request handlers
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/routes.h"
#include "quickshare/config.h"
#include "quickshare/console.h"
#include "quickshare/crypto.h"
#include "quickshare/middleware.h"
#include "quickshare/multipart.h"
#include "quickshare/sendfile.h"

#include <cmath>
#include <memory>
#include <optional>
#include <string_view>

namespace quickshare::routes {

namespace {

using nlohmann::json;

double roundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

double retentionHours(const ShareService& service) {
    return std::chrono::duration<double, std::ratio<3600>>(service.options().retention).count();
}

double maxSizeMb(const ShareService& service) {
    return static_cast<double>(service.options().maxSizeBytes) / 1e6;
}

// Ids that could never have been issued are simply unknown.
const std::string& requireId(const http::Request& req) {
    auto it = req.params.find("id");
    if (it == req.params.end() || !crypto::isHexToken(it->second, kIdBytes)) {
        throw errors::NotFound(it == req.params.end() ? "" : it->second);
    }
    return it->second;
}

json failuresJson(const std::vector<UploadFailure>& failures) {
    json arr = json::array();
    for (auto& f : failures) {
        arr.push_back({{"display_name", f.displayName}, {"error", f.reason}, {"message", f.message}});
    }
    return arr;
}

int statusFor(const errors::ValidationError& e) {
    return e.reason() == errors::reason::PayloadTooLarge ? 413 : 400;
}

std::string partLabel(const std::string& filename) {
    return "'" + (filename.empty() ? std::string("file") : filename) + "'";
}

// ── Watches an /upload body as it arrives ──
//    Stops the read as soon as a part passes the size limit or the
//    body holds too many files.
class UploadGuard : public http::BodyInspector {
public:
    UploadGuard(const ShareService& service, const std::string& boundary)
        : service_(service)
        , parser_(boundary, service.options().maxSizeBytes) {}

    std::optional<http::BodyRejection> inspect(std::string_view chunk) override {
        parser_.feed(chunk);
        try {
            service_.checkFileCount(parser_.filesSeen());
            if (auto& part = parser_.oversized()) {
                service_.checkSize(part->size, partLabel(part->filename));
            }
        } catch (const errors::ValidationError& e) {
            return http::BodyRejection{statusFor(e), e.reason(), e.what()};
        }
        return std::nullopt;
    }

private:
    const ShareService&   service_;
    multipart::StreamParser parser_;
};

http::InspectorFactory uploadGuard(const ShareService& service) {
    return [&service](const http::Request& req) -> std::unique_ptr<http::BodyInspector> {
        if (!req.is("multipart/form-data")) return nullptr;
        auto boundary = multipart::extractBoundary(req.header("content-type"));
        if (boundary.empty()) return nullptr;
        return std::make_unique<UploadGuard>(service, boundary);
    };
}

// Parts of a body spooled to disk, as ranges of the spool file.
std::vector<UploadPart> spooledParts(const http::FileStream& body, const std::string& boundary) {
    multipart::StreamParser parser(boundary);
    std::vector<char> chunk(64 * 1024);
    std::uint64_t offset = 0;
    while (offset < body.size()) {
        auto n = body.readAt(offset, chunk.data(), chunk.size());
        if (n == 0) break;
        parser.feed(std::string_view(chunk.data(), n));
        offset += n;
    }
    if (!parser.valid() || parser.failed()) {
        throw errors::ValidationError(errors::reason::InvalidContentType,
                                      "Malformed multipart body");
    }

    std::vector<UploadPart> parts;
    parts.reserve(parser.files().size());
    for (auto& file : parser.files()) {
        UploadPart part{file.filename, file.contentType, {}, {}};
        part.spooled = FileRange{body.fd(), file.offset, file.size};
        parts.push_back(std::move(part));
    }
    return parts;
}

std::vector<UploadPart> bufferedParts(const std::string& body, const std::string& contentType) {
    auto form = multipart::parse(body, contentType);
    if (!form.valid) {
        throw errors::ValidationError(errors::reason::InvalidContentType,
                                      "Malformed multipart body");
    }

    std::vector<UploadPart> parts;
    parts.reserve(form.files.size());
    for (auto& file : form.files) {
        parts.push_back({file.filename, file.contentType, std::move(file.data), {}});
    }
    return parts;
}

// ── POST /upload ──
void handleUpload(ShareService& service, http::Request& req, http::Response& res) {
    const auto bodySize = req.bodyFile.isOpen() ? req.bodyFile.size() : req.rawBody.size();
    if (bodySize > uploadBodyLimit(service)) {
        throw errors::ValidationError(errors::reason::PayloadTooLarge,
                                      "Upload exceeds " + std::to_string(uploadBodyLimit(service)) +
                                      " bytes");
    }

    if (!req.is("multipart/form-data")) {
        throw errors::ValidationError(errors::reason::InvalidContentType,
                                      "Expected multipart/form-data");
    }
    auto contentType = req.header("content-type");
    auto boundary = multipart::extractBoundary(contentType);
    if (boundary.empty()) {
        throw errors::ValidationError(errors::reason::InvalidContentType,
                                      "Multipart body has no boundary");
    }

    auto parts = req.bodyFile.isOpen() ? spooledParts(req.bodyFile, boundary)
                                       : bufferedParts(req.rawBody, contentType);
    auto result = service.upload(std::move(parts));

    if (result.stored.empty()) {
        if (result.allStorageFailures()) {
            res.status(500).json(json{
                {"error", errors::reason::StorageFailure},
                {"message", "Could not store any file"},
                {"failed", failuresJson(result.failed)}
            });
            return;
        }
        res.status(400).json(json{
            {"error", result.failed.front().reason},
            {"message", "No file was stored"},
            {"failed", failuresJson(result.failed)}
        });
        return;
    }

    console::info("Uploaded", result.stored.size(), "file(s) from", req.ip);
    res.status(201).json(json{
        {"uploaded", result.stored.size()},
        {"files", result.stored},
        {"failed", failuresJson(result.failed)}
    });
}

// ── GET /download/:id ──
void handleDownload(ShareService& service, http::Request& req, http::Response& res) {
    auto download = service.openDownload(requireId(req));
    const auto& entry = download.entry;
    res.set("Content-Length", std::to_string(download.file.size()));
    res.set("Cache-Control", "no-store");
    sendfile::download(res, std::move(download.file), entry.displayName,
                       entry.kind == Kind::Text ? "text/plain; charset=utf-8" : entry.contentType);
}

// ── POST /share-text ──
void handleShareText(ShareService& service, http::Request& req, http::Response& res) {
    auto entry = service.shareText(req.rawBody);
    console::info("Shared text", entry.id, "from", req.ip);
    res.status(201).json(entry);
}

// ── GET /text/:id ──
void handleFetchText(ShareService& service, http::Request& req, http::Response& res) {
    auto text = service.fetchText(requireId(req));
    res.set("Cache-Control", "no-store");
    res.type("text/plain; charset=utf-8").send(text);
}

// ── GET /list ──
void handleList(ShareService& service, http::Request&, http::Response& res) {
    auto listing = service.list();

    json entries = json::array();
    for (auto& listed : listing.entries) {
        json item = listed.entry;
        item["expires_at"] = formatIsoUtc(listed.expiresAt);
        item["expires_in"] = listed.expiresIn.count();
        entries.push_back(std::move(item));
    }

    res.json(json{
        {"entries", entries},
        {"usage", {
            {"total_entries", listing.usage.totalEntries},
            {"total_bytes", listing.usage.totalBytes},
            {"total_size_mb", roundTo2(static_cast<double>(listing.usage.totalBytes) / 1e6)}
        }},
        {"cleanup_hours", retentionHours(service)},
        {"max_size_mb", maxSizeMb(service)}
    });
}

// ── DELETE /item/:id ──
void handleDelete(ShareService& service, http::Request& req, http::Response& res) {
    auto it = req.params.find("id");
    auto outcome = RemoveOutcome::Absent;
    if (it != req.params.end() && crypto::isHexToken(it->second, kIdBytes)) {
        outcome = service.remove(it->second);
    }
    if (outcome == RemoveOutcome::Deleted) {
        console::info("Deleted", it->second, "on request from", req.ip);
    }
    res.status(204)
       .set("X-QuickShare-Result", outcome == RemoveOutcome::Deleted ? "deleted" : "absent")
       .end();
}

// ── GET /stats ──
void handleStats(ShareService& service, http::Request&, http::Response& res) {
    auto usage = service.stats();
    res.json(json{
        {"total_files", usage.totalEntries},
        {"total_size", usage.totalBytes},
        {"total_size_mb", roundTo2(static_cast<double>(usage.totalBytes) / 1e6)},
        {"cleanup_hours", retentionHours(service)},
        {"max_size_mb", maxSizeMb(service)}
    });
}

// ── POST /cleanup ──
void handleCleanup(ShareService& service, http::Request& req, http::Response& res) {
    auto report = service.sweepExpired();
    console::info("Manual cleanup from", req.ip, "removed", report.expired, "entr(ies)");
    res.json(json{
        {"success", report.failed == 0},
        {"removed", report.expired}
    });
}

template <typename Fn>
http::RouteHandler route(ShareService& service, Fn fn) {
    return guarded([&service, fn](http::Request& req, http::Response& res) {
        fn(service, req, res);
    });
}

} // namespace

// ═══════════════════════════════════════════
//  Error translation
// ═══════════════════════════════════════════

void sendError(http::Response& res, const errors::ValidationError& e) {
    res.status(statusFor(e)).json(json{{"error", e.reason()}, {"message", e.what()}});
}

void sendError(http::Response& res, const errors::NotFound& e) {
    res.status(404).json(json{{"error", errors::reason::NotFound}, {"message", e.what()}});
}

void sendError(http::Response& res, const errors::StorageError& e) {
    console::error("Storage failure:", e.what());
    res.status(500).json(json{
        {"error", errors::reason::StorageFailure},
        {"message", "The server could not complete the storage operation"}
    });
}

std::uint64_t uploadBodyLimit(const ShareService& service) {
    const auto& opts = service.options();
    return opts.maxSizeBytes * static_cast<std::uint64_t>(opts.maxFilesPerUpload)
           + config::kMultipartOverheadBytes;
}

// ═══════════════════════════════════════════
//  Registration
// ═══════════════════════════════════════════

void registerRoutes(http::Server& app, ShareService& service) {
    http::RouteOptions upload;
    upload.bodyLimit = uploadBodyLimit(service);
    upload.spoolDir  = service.storage().tempDir();
    upload.inspector = uploadGuard(service);

    http::RouteOptions text;
    text.bodyLimit = service.options().maxSizeBytes;

    app.post("/upload",        route(service, handleUpload), upload);
    app.get("/download/:id",   route(service, handleDownload));
    app.post("/share-text",    route(service, handleShareText), text);
    app.get("/text/:id",       route(service, handleFetchText));
    app.get("/list",           route(service, handleList));
    app.del("/item/:id",       route(service, handleDelete));
    app.get("/stats",          route(service, handleStats));
    app.post("/cleanup",       route(service, handleCleanup));

    // Browser client compatibility
    app.post("/api/upload",      route(service, handleUpload), upload);
    app.get("/api/files",        route(service, handleList));
    app.get("/api/stats",        route(service, handleStats));
    app.get("/api/text/:id",     route(service, handleFetchText));
    app.get("/api/download/:id", route(service, handleDownload));
    app.post("/upload-text",     route(service, handleShareText), text);
    app.post("/api/delete/:id",  route(service, handleDelete));
    app.del("/api/delete/:id",   route(service, handleDelete));
    app.post("/api/cleanup",     route(service, handleCleanup));
}

http::Server createApp(ShareService& service, http::ServerOptions options) {
    auto app = http::createServer(options);
    app.use(middleware::cors());
    app.use(middleware::requestLogger());
    registerRoutes(app, service);
    return app;
}

} // namespace quickshare::routes
