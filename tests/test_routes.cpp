// ═══════════════════════════════════════════════════════════════════
//  test_routes.cpp — HTTP surface tests through TestClient
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <quickshare/console.h>
#include <quickshare/crypto.h>
#include <quickshare/routes.h>
#include <quickshare/testing.h>

#include <filesystem>
#include <memory>

using namespace quickshare;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class RoutesTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() / ("quickshare_routes_" + crypto::randomHex(4));
    TimePoint clock = fromEpochMillis(1700000000000);
    std::unique_ptr<ShareService> service;
    std::unique_ptr<http::Server> app;

    void SetUp() override {
        console::setLevel(console::Level::Off);
        ServiceOptions options;
        options.storageDir = root;
        options.maxSizeBytes = 2000;
        options.retention = 24h;
        options.maxFilesPerUpload = 3;
        options.clock = [this] { return clock; };
        service = std::make_unique<ShareService>(std::move(options));
        app = std::make_unique<http::Server>(routes::createApp(*service));
    }

    void TearDown() override {
        app.reset();
        service.reset();
        fs::remove_all(root);
        console::setLevel(console::Level::Info);
    }

    quickshare::testing::TestClient client() { return quickshare::testing::TestClient(*app); }

    std::string uploadOne(const std::string& name, const std::string& data) {
        auto r = client().post("/upload").attach("files", name, data, "text/plain").exec();
        EXPECT_EQ(r.status, 201);
        return r.json()["files"][0]["id"];
    }

    std::string shareText(const std::string& text) {
        auto r = client().post("/share-text").send(text).exec();
        EXPECT_EQ(r.status, 201);
        return r.json()["id"];
    }
};

// ── Upload ──

TEST_F(RoutesTest, UploadReturnsCreatedEntries) {
    auto r = client().post("/upload")
                 .attach("files", "a.txt", "alpha", "text/plain")
                 .attach("files", "b.bin", "beta")
                 .exec();

    ASSERT_EQ(r.status, 201);
    auto body = r.json();
    EXPECT_EQ(body["uploaded"], 2);
    ASSERT_EQ(body["files"].size(), 2u);
    EXPECT_EQ(body["files"][0]["display_name"], "a.txt");
    EXPECT_EQ(body["files"][0]["kind"], "file");
    EXPECT_EQ(body["files"][0]["size_bytes"], 5);
    EXPECT_EQ(body["files"][0]["created_at"], "2023-11-14T22:13:20Z");
    EXPECT_EQ(body["files"][1]["content_type"], "application/octet-stream");
    EXPECT_FALSE(body["files"][0].contains("stored_path"));
    EXPECT_TRUE(body["failed"].empty());
}

TEST_F(RoutesTest, UploadWithSomeEmptyFilesReportsFailures) {
    auto r = client().post("/upload")
                 .attach("files", "empty.txt", "")
                 .attach("files", "ok.txt", "ok")
                 .exec();
    ASSERT_EQ(r.status, 201);
    EXPECT_EQ(r.json()["uploaded"], 1);
    ASSERT_EQ(r.json()["failed"].size(), 1u);
    EXPECT_EQ(r.json()["failed"][0]["error"], "empty_upload");
}

TEST_F(RoutesTest, UploadOfOnlyEmptyFilesIs400) {
    auto r = client().post("/upload").attach("files", "empty.txt", "").exec();
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.json()["error"], "empty_upload");
}

TEST_F(RoutesTest, UploadWithoutFilesIs400) {
    auto r = client().post("/upload").field("note", "no files here").exec();
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.json()["error"], "no_files");
}

TEST_F(RoutesTest, UploadWithTooManyFilesIs400) {
    auto builder = client().post("/upload");
    for (int i = 0; i < 4; i++) builder.attach("files", "f.txt", "x");
    auto r = builder.exec();
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.json()["error"], "too_many_files");
}

TEST_F(RoutesTest, UploadWithWrongContentTypeIs400) {
    auto r = client().post("/upload").send("{}", "application/json").exec();
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.json()["error"], "invalid_content_type");

    r = client().post("/upload").send("garbage", "multipart/form-data; boundary=zzz").exec();
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.json()["error"], "invalid_content_type");
}

TEST_F(RoutesTest, OversizedFileIs413AndStoresNothing) {
    auto r = client().post("/upload")
                 .attach("files", "ok.txt", "fine")
                 .attach("files", "big.bin", std::string(2049, 'x'))
                 .exec();
    EXPECT_EQ(r.status, 413);
    EXPECT_EQ(r.json()["error"], "payload_too_large");
    EXPECT_EQ(client().get("/list").exec().json()["entries"].size(), 0u);
}

TEST_F(RoutesTest, OversizedBodyIs413) {
    std::string body(routes::uploadBodyLimit(*service) + 1, 'x');
    auto r = client().post("/upload").send(body, "multipart/form-data; boundary=b").exec();
    EXPECT_EQ(r.status, 413);
}

TEST_F(RoutesTest, UploadWithInvalidUtf8FilenameIsRejected) {
    auto r = client().post("/upload").attach("files", "bad\xff.txt", "data").exec();
    ASSERT_EQ(r.status, 400);
    EXPECT_EQ(r.json()["error"], "invalid_filename");
    EXPECT_EQ(r.json()["failed"][0]["display_name"], "bad\xef\xbf\xbd.txt");

    auto list = client().get("/list").exec();
    EXPECT_EQ(list.status, 200);
    EXPECT_EQ(list.json()["entries"].size(), 0u);
}

TEST_F(RoutesTest, PercentEncodedInvalidFilenameIsRejectedPerPart) {
    auto r = client().post("/upload")
                 .attach("files", "bad%FF.txt", "data")
                 .attach("files", "good.txt", "data")
                 .exec();
    ASSERT_EQ(r.status, 201);
    EXPECT_EQ(r.json()["uploaded"], 1);
    EXPECT_EQ(r.json()["failed"][0]["error"], "invalid_filename");
    EXPECT_EQ(client().get("/list").exec().status, 200);
    EXPECT_EQ(service->storage().listPayloads().size(), 1u);
}

TEST_F(RoutesTest, ListStillWorksWithStoredInvalidName) {
    Entry entry;
    entry.kind        = Kind::File;
    entry.displayName = "old\xfe.bin";
    entry.storedPath  = "uploads/legacy.bin";
    entry.sizeBytes   = 3;
    entry.createdAt   = clock;
    entry.contentType = "application/octet-stream";
    service->metadata().create(entry);

    auto list = client().get("/list").exec();
    ASSERT_EQ(list.status, 200);
    ASSERT_EQ(list.json()["entries"].size(), 1u);
    EXPECT_EQ(list.json()["entries"][0]["display_name"], "old\xef\xbf\xbd.bin");
    EXPECT_EQ(client().get("/api/files").exec().status, 200);
}

// ── Download ──

TEST_F(RoutesTest, DownloadFallbackNameHasNoDirectories) {
    auto id = uploadOne("../../etc/passwd", "root:x:0:0");
    auto r = client().get("/download/" + id).exec();
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.header("Content-Disposition"),
              "attachment; filename=\"passwd\"; filename*=UTF-8''..%2F..%2Fetc%2Fpasswd");
}

TEST_F(RoutesTest, DownloadStreamsStoredBytes) {
    auto id = uploadOne("report final.txt", "contents");
    auto r = client().get("/download/" + id).exec();

    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "contents");
    EXPECT_EQ(r.header("Content-Type"), "text/plain");
    EXPECT_EQ(r.header("Content-Length"), "8");
    EXPECT_EQ(r.header("Cache-Control"), "no-store");
    EXPECT_EQ(r.header("Content-Disposition"),
              "attachment; filename=\"report final.txt\"; filename*=UTF-8''report%20final.txt");
}

TEST_F(RoutesTest, DownloadOfTextEntry) {
    auto id = shareText("snippet");
    auto r = client().get("/download/" + id).exec();
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "snippet");
    EXPECT_EQ(r.header("Content-Type"), "text/plain; charset=utf-8");
}

TEST_F(RoutesTest, DownloadUnknownOrMalformedIdIs404) {
    EXPECT_EQ(client().get("/download/" + std::string(32, 'a')).exec().status, 404);
    auto r = client().get("/download/..%2F..%2Fetc%2Fpasswd").exec();
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.json()["error"], "not_found");
}

// ── Text ──

TEST_F(RoutesTest, ShareAndFetchText) {
    auto r = client().post("/share-text").send("hello \xe2\x9c\x93").exec();
    ASSERT_EQ(r.status, 201);
    EXPECT_EQ(r.json()["kind"], "text");
    EXPECT_EQ(r.json()["display_name"], "text_20231114_221320.txt");
    EXPECT_FALSE(r.json().contains("content_type"));

    auto fetched = client().get("/text/" + r.json()["id"].get<std::string>()).exec();
    EXPECT_EQ(fetched.status, 200);
    EXPECT_EQ(fetched.body, "hello \xe2\x9c\x93");
    EXPECT_EQ(fetched.header("Content-Type"), "text/plain; charset=utf-8");
}

TEST_F(RoutesTest, ShareTextValidation) {
    auto empty = client().post("/share-text").send("").exec();
    EXPECT_EQ(empty.status, 400);
    EXPECT_EQ(empty.json()["error"], "empty_text");

    auto invalid = client().post("/share-text").send("\xff\xfe").exec();
    EXPECT_EQ(invalid.status, 400);
    EXPECT_EQ(invalid.json()["error"], "invalid_text");

    auto large = client().post("/share-text").send(std::string(2001, 'a')).exec();
    EXPECT_EQ(large.status, 413);
    EXPECT_EQ(large.json()["error"], "payload_too_large");
}

TEST_F(RoutesTest, FetchTextOfFileIs400) {
    auto id = uploadOne("a.txt", "abc");
    auto r = client().get("/text/" + id).exec();
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.json()["error"], "not_text");
}

// ── List and stats ──

TEST_F(RoutesTest, ListShape) {
    auto fileId = uploadOne("a.txt", "abc");
    clock += 1h;
    auto textId = shareText("hi");

    auto r = client().get("/list").exec();
    ASSERT_EQ(r.status, 200);
    auto body = r.json();
    ASSERT_EQ(body["entries"].size(), 2u);
    EXPECT_EQ(body["entries"][0]["id"], fileId);
    EXPECT_EQ(body["entries"][1]["id"], textId);
    EXPECT_EQ(body["entries"][0]["expires_in"], 23 * 3600);
    EXPECT_EQ(body["entries"][0]["expires_at"], "2023-11-15T22:13:20Z");
    EXPECT_EQ(body["usage"]["total_entries"], 2);
    EXPECT_EQ(body["usage"]["total_bytes"], 5);
    EXPECT_DOUBLE_EQ(body["cleanup_hours"].get<double>(), 24.0);
    EXPECT_DOUBLE_EQ(body["max_size_mb"].get<double>(), 0.002);
}

TEST_F(RoutesTest, StatsShape) {
    uploadOne("a.txt", "abc");
    auto body = client().get("/stats").exec().json();
    EXPECT_EQ(body["total_files"], 1);
    EXPECT_EQ(body["total_size"], 3);
    EXPECT_DOUBLE_EQ(body["total_size_mb"].get<double>(), 0.0);
}

// ── Delete ──

TEST_F(RoutesTest, DeleteIsIdempotent) {
    auto id = uploadOne("a.txt", "abc");

    auto first = client().del("/item/" + id).exec();
    EXPECT_EQ(first.status, 204);
    EXPECT_EQ(first.header("X-QuickShare-Result"), "deleted");
    EXPECT_TRUE(first.body.empty());

    auto second = client().del("/item/" + id).exec();
    EXPECT_EQ(second.status, 204);
    EXPECT_EQ(second.header("X-QuickShare-Result"), "absent");

    EXPECT_EQ(client().get("/download/" + id).exec().status, 404);
}

TEST_F(RoutesTest, DeleteMalformedIdIsAbsent) {
    auto r = client().del("/item/not-an-id").exec();
    EXPECT_EQ(r.status, 204);
    EXPECT_EQ(r.header("X-QuickShare-Result"), "absent");
}

// ── Cleanup ──

TEST_F(RoutesTest, CleanupRemovesExpired) {
    uploadOne("old.txt", "old");
    clock += 25h;
    shareText("new");

    auto r = client().post("/cleanup").exec();
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.json()["success"], true);
    EXPECT_EQ(r.json()["removed"], 1);
    EXPECT_EQ(client().get("/list").exec().json()["entries"].size(), 1u);
}

// ── Aliases, methods, CORS ──

TEST_F(RoutesTest, ApiAliases) {
    auto r = client().post("/api/upload").attach("files", "x.txt", "xyz").exec();
    ASSERT_EQ(r.status, 201);
    std::string id = r.json()["files"][0]["id"];

    EXPECT_EQ(client().get("/api/files").exec().json()["entries"].size(), 1u);
    EXPECT_EQ(client().get("/api/stats").exec().json()["total_files"], 1);
    EXPECT_EQ(client().get("/api/download/" + id).exec().body, "xyz");

    auto text = client().post("/upload-text").send("t").exec();
    ASSERT_EQ(text.status, 201);
    EXPECT_EQ(client().get("/api/text/" + text.json()["id"].get<std::string>()).exec().body, "t");

    EXPECT_EQ(client().post("/api/delete/" + id).exec().header("X-QuickShare-Result"), "deleted");
    EXPECT_EQ(client().del("/api/delete/" + id).exec().header("X-QuickShare-Result"), "absent");
    EXPECT_EQ(client().post("/api/cleanup").exec().status, 200);
}

TEST_F(RoutesTest, WrongMethodIs405) {
    auto r = client().get("/upload").exec();
    EXPECT_EQ(r.status, 405);
    EXPECT_EQ(r.header("Allow"), "POST");

    r = client().post("/item/" + std::string(32, 'a')).exec();
    EXPECT_EQ(r.status, 405);
    EXPECT_EQ(r.header("Allow"), "DELETE");
}

TEST_F(RoutesTest, CorsOnEveryResponse) {
    EXPECT_EQ(client().get("/list").exec().header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(client().get("/nope").exec().header("Access-Control-Allow-Origin"), "*");

    auto preflight = client().options("/upload").exec();
    EXPECT_EQ(preflight.status, 204);
    EXPECT_NE(preflight.header("Access-Control-Expose-Headers").find("X-QuickShare-Result"),
              std::string::npos);
}
