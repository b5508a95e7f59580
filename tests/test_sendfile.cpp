// ═══════════════════════════════════════════════════════════════════
//  test_sendfile.cpp — Tests for MIME lookup and attachment headers
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <quickshare/sendfile.h>

#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

using namespace quickshare;
using namespace quickshare::sendfile;

TEST(SendFileTest, MimeTypeDetection) {
    EXPECT_EQ(getMimeType("index.html"), "text/html");
    EXPECT_EQ(getMimeType("notes.txt"), "text/plain");
    EXPECT_EQ(getMimeType("photo.JPG"), "image/jpeg");
    EXPECT_EQ(getMimeType("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(getMimeType("report.pdf"), "application/pdf");
}

TEST(SendFileTest, UnknownOrMissingExtensionFallsBack) {
    EXPECT_EQ(getMimeType("data.xyz"), "application/octet-stream");
    EXPECT_EQ(getMimeType("Makefile"), "application/octet-stream");
    EXPECT_EQ(getMimeType(""), "application/octet-stream");
}

TEST(SendFileTest, DispositionForAsciiName) {
    EXPECT_EQ(contentDisposition("report.pdf"),
              "attachment; filename=\"report.pdf\"; filename*=UTF-8''report.pdf");
}

TEST(SendFileTest, DispositionEscapesQuotesAndSpaces) {
    auto value = contentDisposition("my \"best\" file.txt");
    EXPECT_NE(value.find("filename=\"my _best_ file.txt\""), std::string::npos);
    EXPECT_NE(value.find("filename*=UTF-8''my%20%22best%22%20file.txt"), std::string::npos);
}

TEST(SendFileTest, DispositionEncodesUtf8) {
    // "é.txt"
    auto value = contentDisposition("\xc3\xa9.txt");
    EXPECT_NE(value.find("filename=\"__.txt\""), std::string::npos);
    EXPECT_NE(value.find("filename*=UTF-8''%C3%A9.txt"), std::string::npos);
}

TEST(SendFileTest, DispositionFallbackDropsDirectories) {
    auto value = contentDisposition("../../etc/passwd");
    EXPECT_NE(value.find("filename=\"passwd\""), std::string::npos);
    EXPECT_EQ(value.find("filename=\"../"), std::string::npos);
    EXPECT_NE(value.find("filename*=UTF-8''..%2F..%2Fetc%2Fpasswd"), std::string::npos);

    EXPECT_EQ(detail::asciiFallback("C:\\Users\\me\\notes.txt"), "notes.txt");
    EXPECT_EQ(detail::asciiFallback("dir/"), "download");
    EXPECT_EQ(detail::asciiFallback(".."), "download");
}

TEST(SendFileTest, DownloadSetsHeadersAndBody) {
    auto path = std::filesystem::temp_directory_path() / "quickshare_sendfile_test.bin";
    {
        std::ofstream f(path, std::ios::binary);
        f << "payload";
    }
    int fd = ::open(path.c_str(), O_RDONLY);
    ASSERT_GE(fd, 0);
    http::FileStream file(fd, std::filesystem::file_size(path));

    http::Headers sentHeaders;
    std::string sentBody;
    http::Response res([&](int, const auto& h, const auto& b) {
        sentHeaders = h;
        sentBody = b;
    });

    download(res, std::move(file), "hello.txt", "");
    std::filesystem::remove(path);

    EXPECT_EQ(sentBody, "payload");
    EXPECT_EQ(sentHeaders["Content-Type"], "text/plain");
    EXPECT_EQ(sentHeaders["Content-Disposition"],
              "attachment; filename=\"hello.txt\"; filename*=UTF-8''hello.txt");
}
