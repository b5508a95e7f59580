#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/testing.h — TestClient (supertest equivalent)
// ═══════════════════════════════════════════════════════════════════
//
//  Drives Server::handleRequest in-process:
//
//    testing::TestClient client(app);
//    auto r = client.post("/upload")
//                   .attach("files", "a.txt", "hello")
//                   .exec();
//    EXPECT_EQ(r.status, 201);
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "json_utils.h"
#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace quickshare::testing {

// ── Create a mock Request ──
inline http::Request createRequest(
    const std::string& method = "GET",
    const std::string& path = "/",
    const std::string& body = "",
    const std::unordered_map<std::string, std::string>& headers = {}) {
    http::Request req;
    req.method = method;
    req.path = path;
    req.url = path;
    req.rawBody = body;
    req.ip = "127.0.0.1";
    for (auto& [k, v] : headers) {
        std::string lk = k;
        std::transform(lk.begin(), lk.end(), lk.begin(), ::tolower);
        req.headers[lk] = v;
    }
    return req;
}

// ── Test Result ──
struct TestResult {
    int status = 0;
    std::string body;
    std::unordered_map<std::string, std::string> headers;

    nlohmann::json json() const {
        return nlohmann::json::parse(body);
    }

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : "";
    }
};

// ═══════════════════════════════════════════
//  TestClient — supertest-style API
// ═══════════════════════════════════════════
class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    // ── Fluent request builder ──
    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, const std::string& method, const std::string& path)
            : app_(app), method_(method), path_(path) {}

        RequestBuilder& set(const std::string& key, const std::string& value) {
            headers_[key] = value;
            return *this;
        }

        RequestBuilder& send(const std::string& body,
                             const std::string& contentType = "text/plain; charset=utf-8") {
            body_ = body;
            if (headers_.find("Content-Type") == headers_.end()) {
                headers_["Content-Type"] = contentType;
            }
            return *this;
        }

        RequestBuilder& send(const char* body,
                             const std::string& contentType = "text/plain; charset=utf-8") {
            return send(std::string(body), contentType);
        }

        RequestBuilder& send(const nlohmann::json& j) {
            body_ = j.dump();
            headers_["Content-Type"] = "application/json";
            return *this;
        }

        // ── Add a multipart file part ──
        RequestBuilder& attach(const std::string& field, const std::string& filename,
                               const std::string& data,
                               const std::string& contentType = "application/octet-stream") {
            parts_.push_back({field, filename, data, contentType, true});
            return *this;
        }

        // ── Add a multipart text field ──
        RequestBuilder& field(const std::string& name, const std::string& value) {
            parts_.push_back({name, "", value, "", false});
            return *this;
        }

        TestResult exec() {
            if (!parts_.empty()) buildMultipart();

            auto req = createRequest(method_, path_, body_, headers_);

            TestResult result;
            http::Response res([&result](int status,
                                        const http::Headers& headers,
                                        const std::string& body) {
                result.status = status;
                result.body = body;
                result.headers = headers;
            });

            app_.handleRequest(req, res);
            if (!res.headersSent()) {
                result.status = res.getStatusCode();
                result.body = res.getBody();
                result.headers = res.getHeaders();
            }
            return result;
        }

    private:
        struct Part {
            std::string name;
            std::string filename;
            std::string data;
            std::string contentType;
            bool isFile;
        };

        http::Server& app_;
        std::string method_;
        std::string path_;
        std::string body_;
        std::unordered_map<std::string, std::string> headers_;
        std::vector<Part> parts_;

        void buildMultipart() {
            const std::string boundary = "----QuickShareTestBoundary7MA4YWxk";
            std::string body;
            for (auto& part : parts_) {
                body += "--" + boundary + "\r\n";
                body += "Content-Disposition: form-data; name=\"" + part.name + "\"";
                if (part.isFile) {
                    body += "; filename=\"" + part.filename + "\"\r\n";
                    body += "Content-Type: " + part.contentType + "\r\n";
                } else {
                    body += "\r\n";
                }
                body += "\r\n" + part.data + "\r\n";
            }
            body += "--" + boundary + "--\r\n";
            body_ = std::move(body);
            headers_["Content-Type"] = "multipart/form-data; boundary=" + boundary;
        }
    };

    RequestBuilder get(const std::string& path) { return {app_, "GET", path}; }
    RequestBuilder post(const std::string& path) { return {app_, "POST", path}; }
    RequestBuilder del(const std::string& path) { return {app_, "DELETE", path}; }
    RequestBuilder options(const std::string& path) { return {app_, "OPTIONS", path}; }

private:
    http::Server& app_;
};

} // namespace quickshare::testing
