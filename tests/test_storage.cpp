// ═══════════════════════════════════════════════════════════════════
//  test_storage.cpp — Tests for payload files and name sanitizing
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <quickshare/console.h>
#include <quickshare/crypto.h>
#include <quickshare/errors.h>
#include <quickshare/storage.h>

#include <filesystem>
#include <fstream>

using namespace quickshare;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    fs::path root = fs::temp_directory_path() / ("quickshare_storage_" + crypto::randomHex(4));
    std::unique_ptr<Storage> storage;

    void SetUp() override {
        console::setLevel(console::Level::Off);
        storage = std::make_unique<Storage>(root);
    }

    void TearDown() override {
        storage.reset();
        fs::remove_all(root);
        console::setLevel(console::Level::Info);
    }

    static std::string newId() { return crypto::randomHex(kIdBytes); }
};

// ── Name sanitizing ──

TEST(SanitizeNameTest, StripsDirectories) {
    EXPECT_EQ(Storage::sanitizeName("../../etc/passwd"), "passwd");
    EXPECT_EQ(Storage::sanitizeName("C:\\Users\\me\\report.doc"), "report.doc");
    EXPECT_EQ(Storage::sanitizeName("dir/"), "file");
}

TEST(SanitizeNameTest, ReplacesUnsafeCharacters) {
    EXPECT_EQ(Storage::sanitizeName("my file (1).txt"), "my_file__1_.txt");
    EXPECT_EQ(Storage::sanitizeName("r\xc3\xa9sum\xc3\xa9.pdf"), "r__sum__.pdf");
}

TEST(SanitizeNameTest, NoHiddenOrEmptyNames) {
    EXPECT_EQ(Storage::sanitizeName(".bashrc"), "bashrc");
    EXPECT_EQ(Storage::sanitizeName(".."), "file");
    EXPECT_EQ(Storage::sanitizeName(""), "file");
    EXPECT_EQ(Storage::sanitizeName("???"), "file");
    EXPECT_EQ(Storage::sanitizeName(std::string("a\0b", 3)), "file");
}

TEST(SanitizeNameTest, LongNamesKeepExtension) {
    auto name = Storage::sanitizeName(std::string(300, 'x') + ".tar");
    EXPECT_EQ(name.size(), Storage::kMaxNameLength);
    EXPECT_EQ(fs::path(name).extension(), ".tar");
}

TEST(SanitizeNameTest, IdFromFileName) {
    std::string id(32, 'a');
    EXPECT_EQ(Storage::idFromFileName(id + "_photo.png"), id);
    EXPECT_EQ(Storage::idFromFileName(id + ".txt"), id);
    EXPECT_FALSE(Storage::idFromFileName("photo.png"));
    EXPECT_FALSE(Storage::idFromFileName("abc_photo.png"));
    EXPECT_FALSE(Storage::idFromFileName(id));
}

// ── Layout and I/O ──

TEST_F(StorageTest, CreatesLayout) {
    EXPECT_TRUE(fs::is_directory(root / "uploads"));
    EXPECT_TRUE(fs::is_directory(root / "text_shares"));
    EXPECT_TRUE(fs::is_directory(storage->tempDir()));
    EXPECT_EQ(storage->root(), fs::canonical(root));
}

TEST_F(StorageTest, PutFileAndOpen) {
    auto id = newId();
    auto stored = storage->put(std::string("a\0b", 3), "../x/notes.txt", id, Kind::File);

    EXPECT_EQ(stored, "uploads/" + id + "_notes.txt");
    EXPECT_TRUE(storage->exists(stored));
    auto file = storage->open(stored);
    EXPECT_EQ(file.size(), 3u);
    EXPECT_EQ(file.readAll(), std::string("a\0b", 3));
}

TEST_F(StorageTest, PutTextUsesIdName) {
    auto id = newId();
    auto stored = storage->put("hello", "ignored.md", id, Kind::Text);
    EXPECT_EQ(stored, "text_shares/" + id + ".txt");
}

TEST_F(StorageTest, SameDisplayNameNeverCollides) {
    auto a = storage->put("one", "same.txt", newId(), Kind::File);
    auto b = storage->put("two", "same.txt", newId(), Kind::File);
    EXPECT_NE(a, b);
    EXPECT_EQ(storage->open(a).readAll(), "one");
    EXPECT_EQ(storage->open(b).readAll(), "two");
}

TEST_F(StorageTest, NoTemporariesLeftAfterPut) {
    storage->put("data", "a.bin", newId(), Kind::File);
    EXPECT_TRUE(fs::is_empty(storage->tempDir()));
}

TEST_F(StorageTest, OpenRejectsEscapes) {
    std::ofstream(root.parent_path() / "quickshare_outside.txt") << "secret";
    EXPECT_THROW(storage->open("../quickshare_outside.txt"), errors::NotFound);
    EXPECT_THROW(storage->open("/etc/passwd"), errors::NotFound);
    EXPECT_THROW(storage->open("uploads/../../quickshare_outside.txt"), errors::NotFound);
    EXPECT_FALSE(storage->exists("../quickshare_outside.txt"));
    EXPECT_FALSE(storage->remove("../quickshare_outside.txt"));
    EXPECT_TRUE(fs::exists(root.parent_path() / "quickshare_outside.txt"));
    fs::remove(root.parent_path() / "quickshare_outside.txt");
}

TEST_F(StorageTest, OpenMissingOrDirectoryIsNotFound) {
    EXPECT_THROW(storage->open("uploads/missing"), errors::NotFound);
    EXPECT_THROW(storage->open("uploads"), errors::NotFound);
}

TEST_F(StorageTest, RemoveIsIdempotent) {
    auto stored = storage->put("x", "x.txt", newId(), Kind::File);
    EXPECT_TRUE(storage->remove(stored));
    EXPECT_FALSE(storage->remove(stored));
    EXPECT_FALSE(storage->exists(stored));
}

TEST_F(StorageTest, ListPayloadsAndUsage) {
    auto fileId = newId();
    auto textId = newId();
    storage->put("12345", "a.bin", fileId, Kind::File);
    storage->put("abc", "", textId, Kind::Text);
    std::ofstream(root / "uploads" / "stray.bin") << "zz";

    auto payloads = storage->listPayloads();
    ASSERT_EQ(payloads.size(), 3u);
    std::size_t withId = 0;
    for (auto& p : payloads) {
        if (p.id == fileId) EXPECT_EQ(p.sizeBytes, 5u);
        if (p.id == textId) EXPECT_EQ(p.sizeBytes, 3u);
        if (!p.id.empty()) ++withId;
    }
    EXPECT_EQ(withId, 2u);
}

TEST_F(StorageTest, PurgeTemporaries) {
    std::ofstream(storage->tempDir() / "abc.part") << "partial";
    std::ofstream(storage->tempDir() / "def.part") << "partial";
    EXPECT_EQ(storage->purgeTemporaries(), 2u);
    EXPECT_TRUE(fs::is_empty(storage->tempDir()));
}

TEST(StorageRootTest, UnusableRootIsConfigError) {
    auto file = fs::temp_directory_path() / ("quickshare_notadir_" + crypto::randomHex(4));
    std::ofstream(file) << "x";
    EXPECT_THROW(Storage{file}, errors::ConfigError);
    fs::remove(file);
}
