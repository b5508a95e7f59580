// ═══════════════════════════════════════════════════════════════════
//  storage.cpp — Payload files under the storage root
// ═══════════════════════════════════════════════════════════════════

#include "quickshare/storage.h"
#include "quickshare/console.h"
#include "quickshare/crypto.h"
#include "quickshare/errors.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace quickshare {

namespace {

constexpr const char* kUploadsDir = "uploads";
constexpr const char* kTextDir    = "text_shares";
constexpr const char* kTempSuffix = ".part";

std::string errnoText() {
    return std::strerror(errno);
}

constexpr std::size_t kCopyChunk = 64 * 1024;

void writeAll(int fd, std::string_view bytes, const fs::path& path) {
    std::size_t done = 0;
    while (done < bytes.size()) {
        auto n = ::write(fd, bytes.data() + done, bytes.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errors::StorageError("Failed to write " + path.string() + ": " + errnoText());
        }
        done += static_cast<std::size_t>(n);
    }
}

void copyRange(int fd, const FileRange& range, const fs::path& path) {
    std::vector<char> buf(kCopyChunk);
    std::uint64_t done = 0;
    while (done < range.size) {
        auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), range.size - done));
        auto n = ::pread(range.fd, buf.data(), want, static_cast<off_t>(range.offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errors::StorageError("Failed to read upload body: " + errnoText());
        }
        if (n == 0) {
            throw errors::StorageError("Upload body ended " + std::to_string(range.size - done) +
                                       " bytes early");
        }
        writeAll(fd, std::string_view(buf.data(), static_cast<std::size_t>(n)), path);
        done += static_cast<std::uint64_t>(n);
    }
}

bool isAllowed(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

std::vector<fs::path> regularFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return files;
    for (const auto& item : it) {
        std::error_code typeEc;
        if (item.is_regular_file(typeEc)) files.push_back(item.path());
    }
    return files;
}

} // namespace

Storage::Storage(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    for (const auto& dir : {root_, root_ / kUploadsDir, root_ / kTextDir,
                            metadataDir(), tempDir()}) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw errors::ConfigError("Cannot create storage directory " + dir.string() +
                                      ": " + ec.message());
        }
    }
    root_ = fs::canonical(root_, ec);
    if (ec) {
        throw errors::ConfigError("Cannot resolve storage root: " + ec.message());
    }
    if (::access(tempDir().c_str(), W_OK) != 0) {
        throw errors::ConfigError("Storage root is not writable: " + root_.string());
    }
}

std::string Storage::sanitizeName(const std::string& name) {
    if (name.find('\0') != std::string::npos) return "file";

    // Strip directory components from either separator style
    auto slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

    std::string out;
    out.reserve(base.size());
    for (unsigned char c : base) {
        out += isAllowed(c) ? static_cast<char>(c) : '_';
    }

    // No hidden files, no "." or ".."
    auto firstVisible = out.find_first_not_of('.');
    out = firstVisible == std::string::npos ? "" : out.substr(firstVisible);
    if (out.find_first_not_of("_.-") == std::string::npos) return "file";

    if (out.size() > kMaxNameLength) {
        auto ext = fs::path(out).extension().string();
        if (ext.size() > 16) ext.clear();
        out = out.substr(0, kMaxNameLength - ext.size()) + ext;
    }
    return out;
}

std::optional<std::string> Storage::idFromFileName(const std::string& fileName) {
    auto cut = fileName.find_first_of("_.");
    if (cut == std::string::npos) return std::nullopt;
    auto id = fileName.substr(0, cut);
    if (!crypto::isHexToken(id, kIdBytes)) return std::nullopt;
    return id;
}

std::optional<fs::path> Storage::resolve(const std::string& storedPath) const {
    if (storedPath.empty() || storedPath.find('\0') != std::string::npos) return std::nullopt;

    fs::path relative(storedPath);
    if (relative.is_absolute()) return std::nullopt;

    auto full = (root_ / relative).lexically_normal();
    auto rel = full.lexically_relative(root_);
    if (rel.empty() || *rel.begin() == "..") return std::nullopt;
    return full;
}

std::string Storage::put(const PayloadSource& payload, const std::string& suggestedName,
                         const std::string& id, Kind kind) {
    const std::string relative = kind == Kind::File
        ? std::string(kUploadsDir) + "/" + id + "_" + sanitizeName(suggestedName)
        : std::string(kTextDir) + "/" + id + ".txt";
    const fs::path target = root_ / relative;
    const fs::path temp = tempDir() / (id + "." + crypto::randomHex(4) + kTempSuffix);

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw errors::StorageError("Failed to create " + temp.string() + ": " + errnoText());
    }

    try {
        if (auto* bytes = std::get_if<std::string_view>(&payload)) {
            writeAll(fd, *bytes, temp);
        } else {
            copyRange(fd, std::get<FileRange>(payload), temp);
        }
        if (::fsync(fd) != 0) {
            throw errors::StorageError("Failed to flush " + temp.string() + ": " + errnoText());
        }
        if (::close(fd) != 0) {
            fd = -1;
            throw errors::StorageError("Failed to close " + temp.string() + ": " + errnoText());
        }
        fd = -1;

        std::error_code ec;
        fs::rename(temp, target, ec);
        if (ec) {
            throw errors::StorageError("Failed to move payload into place: " + ec.message());
        }
    } catch (...) {
        if (fd >= 0) ::close(fd);
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw;
    }
    return relative;
}

http::FileStream Storage::open(const std::string& storedPath) const {
    auto full = resolve(storedPath);
    if (!full) throw errors::NotFound(storedPath);

    int fd = ::open(full->c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ENOTDIR) throw errors::NotFound(storedPath);
        throw errors::StorageError("Failed to open " + full->string() + ": " + errnoText());
    }

    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        auto err = errnoText();
        ::close(fd);
        throw errors::StorageError("Failed to stat " + full->string() + ": " + err);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        throw errors::NotFound(storedPath);
    }
    return http::FileStream(fd, static_cast<std::uint64_t>(st.st_size));
}

bool Storage::exists(const std::string& storedPath) const {
    auto full = resolve(storedPath);
    if (!full) return false;
    std::error_code ec;
    return fs::is_regular_file(*full, ec);
}

bool Storage::remove(const std::string& storedPath) {
    auto full = resolve(storedPath);
    if (!full) return false;
    std::error_code ec;
    bool removed = fs::remove(*full, ec);
    if (ec) {
        throw errors::StorageError("Failed to remove " + full->string() + ": " + ec.message());
    }
    return removed;
}

std::vector<Storage::Payload> Storage::listPayloads() const {
    std::vector<Payload> payloads;
    for (const char* dir : {kUploadsDir, kTextDir}) {
        for (const auto& path : regularFiles(root_ / dir)) {
            Payload payload;
            payload.storedPath = std::string(dir) + "/" + path.filename().string();
            payload.id = idFromFileName(path.filename().string()).value_or("");
            std::error_code ec;
            payload.sizeBytes = fs::file_size(path, ec);
            if (ec) payload.sizeBytes = 0;
            payloads.push_back(std::move(payload));
        }
    }
    return payloads;
}

std::size_t Storage::purgeTemporaries() {
    std::size_t purged = 0;
    for (const auto& path : regularFiles(tempDir())) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++purged;
        } else if (ec) {
            console::warn("Could not remove temporary file", path.string(), ":", ec.message());
        }
    }
    return purged;
}

} // namespace quickshare
