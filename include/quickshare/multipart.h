#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/multipart.h — multipart/form-data parser
// ═══════════════════════════════════════════════════════════════════
//
//  StreamParser takes a body in chunks of any size and records where
//  each file part's data sits in the stream, so a body spooled to disk
//  is never held in memory. A part that grows past the part limit
//  stops the parser as soon as the excess arrives.
//
//  Every part with a `filename` parameter is a file part, even when
//  its body is empty (the upload handler rejects those individually).
//  Parts without one are skipped. Filenames are percent-decoded
//  ("my%20notes.txt" -> "my notes.txt").
//
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace quickshare::multipart {

// ── Where a file part lies in the body ──
struct PartInfo {
    std::string   fieldName;
    std::string   filename;
    std::string   contentType;      // application/octet-stream when absent
    std::uint64_t offset = 0;       // first data byte, counted from the start of the body
    std::uint64_t size = 0;
};

// ── Uploaded file ──
struct UploadedFile {
    std::string fieldName;
    std::string filename;
    std::string contentType;
    std::string data;           // Raw binary content
    std::size_t size = 0;
};

// ── Parser result ──
struct ParseResult {
    std::vector<UploadedFile> files;
    bool valid = false;         // a boundary was found and at least one delimiter seen
};

namespace detail {

inline std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string getHeaderValue(const std::string& headers, const std::string& name) {
    const auto wanted = toLower(name);

    std::istringstream stream(headers);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (toLower(line.substr(0, colon)) == wanted) {
            auto val = line.substr(colon + 1);
            auto start = val.find_first_not_of(" \t");
            return start != std::string::npos ? val.substr(start) : "";
        }
    }
    return "";
}

// Parameters are matched at a ';' boundary, so asking for "name"
// never picks up the tail of "filename=".
inline bool extractParam(const std::string& header, const std::string& param,
                         std::string& out) {
    std::size_t pos = header.find(';');
    while (pos != std::string::npos) {
        auto keyStart = header.find_first_not_of(" \t", pos + 1);
        if (keyStart == std::string::npos) return false;
        auto eq = header.find('=', keyStart);
        if (eq == std::string::npos) return false;

        auto key = header.substr(keyStart, eq - keyStart);
        while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) key.pop_back();

        std::string value;
        std::size_t next;
        auto valueStart = eq + 1;
        if (valueStart < header.size() && header[valueStart] == '"') {
            auto close = valueStart + 1;
            while (close < header.size() && header[close] != '"') {
                if (header[close] == '\\' && close + 1 < header.size()) {
                    value += header[close + 1];
                    close += 2;
                    continue;
                }
                value += header[close++];
            }
            next = header.find(';', close);
        } else {
            next = header.find(';', valueStart);
            value = header.substr(valueStart,
                                  next == std::string::npos ? std::string::npos : next - valueStart);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.pop_back();
        }

        if (toLower(key) == toLower(param)) {
            out = value;
            return true;
        }
        pos = next;
    }
    return false;
}

inline std::string percentDecode(const std::string& str) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string result;
    result.reserve(str.size());
    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hexValue(str[i + 1]);
            int lo = hexValue(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        result += str[i];
    }
    return result;
}

} // namespace detail

// ── Boundary parameter of a multipart Content-Type, "" if none ──
inline std::string extractBoundary(const std::string& contentType) {
    auto pos = detail::toLower(contentType).find("boundary=");
    if (pos == std::string::npos) return "";
    auto boundary = contentType.substr(pos + 9);
    if (!boundary.empty() && boundary.front() == '"') {
        boundary = boundary.substr(1);
        auto close = boundary.find('"');
        return close != std::string::npos ? boundary.substr(0, close) : boundary;
    }
    auto end = boundary.find_first_of("; \t\r\n");
    if (end != std::string::npos) boundary = boundary.substr(0, end);
    return boundary;
}

// ═══════════════════════════════════════════
//  StreamParser
// ═══════════════════════════════════════════
class StreamParser {
public:
    // Longest part header block or delimiter line accepted
    static constexpr std::size_t kMaxHeaderBytes = 16 * 1024;

    explicit StreamParser(const std::string& boundary,
                          std::uint64_t maxPartBytes = std::numeric_limits<std::uint64_t>::max())
        : dashBoundary_("--" + boundary)
        , dataDelimiter_("\r\n--" + boundary)
        , maxPartBytes_(maxPartBytes) {}

    void feed(std::string_view chunk) {
        if (state_ == State::Done || state_ == State::Failed) return;
        buf_.append(chunk.data(), chunk.size());

        bool progress = true;
        while (progress) {
            switch (state_) {
            case State::Preamble:  progress = scanPreamble();  break;
            case State::Delimiter: progress = scanDelimiter(); break;
            case State::Headers:   progress = scanHeaders();   break;
            case State::Data:      progress = scanData();      break;
            case State::Done:
            case State::Failed:
                buf_.clear();
                progress = false;
                break;
            }
        }
    }

    bool valid() const { return sawDelimiter_; }
    bool complete() const { return state_ == State::Done; }
    bool failed() const { return state_ == State::Failed; }

    // The part that went over the limit, once one has
    const std::optional<PartInfo>& oversized() const { return oversized_; }

    // Completed file parts, in body order
    const std::vector<PartInfo>& files() const { return files_; }

    // File parts begun so far, including one still arriving
    std::size_t filesSeen() const {
        return files_.size() + (state_ == State::Data && currentIsFile_ ? 1 : 0);
    }

private:
    enum class State { Preamble, Delimiter, Headers, Data, Done, Failed };

    std::string   dashBoundary_;
    std::string   dataDelimiter_;
    std::uint64_t maxPartBytes_;

    State         state_ = State::Preamble;
    std::string   buf_;             // unconsumed bytes
    std::uint64_t base_ = 0;        // body offset of buf_[0]
    bool          sawDelimiter_ = false;

    PartInfo      current_;
    bool          currentIsFile_ = false;
    std::vector<PartInfo>   files_;
    std::optional<PartInfo> oversized_;

    void consume(std::size_t n) {
        buf_.erase(0, n);
        base_ += n;
    }

    // Keeps the last `keep` bytes, which may start a delimiter
    std::size_t consumeAllBut(std::size_t keep) {
        if (buf_.size() <= keep) return 0;
        auto n = buf_.size() - keep;
        consume(n);
        return n;
    }

    bool scanPreamble() {
        auto pos = buf_.find(dashBoundary_);
        if (pos == std::string::npos) {
            consumeAllBut(dashBoundary_.size() - 1);
            return false;
        }
        consume(pos + dashBoundary_.size());
        sawDelimiter_ = true;
        state_ = State::Delimiter;
        return true;
    }

    bool scanDelimiter() {
        if (buf_.size() < 2) return false;
        if (buf_.compare(0, 2, "--") == 0) {
            state_ = State::Done;
            return true;
        }
        auto eol = buf_.find('\n');
        if (eol == std::string::npos) {
            if (buf_.size() > kMaxHeaderBytes) state_ = State::Failed;
            return false;
        }
        consume(eol + 1);
        state_ = State::Headers;
        return true;
    }

    bool scanHeaders() {
        if (buf_.size() < 2) return false;

        std::size_t headerLength = 0;
        std::size_t skip = 2;
        if (buf_.compare(0, 2, "\r\n") != 0) {
            auto end = buf_.find("\r\n\r\n");
            if (end == std::string::npos) {
                if (buf_.size() > kMaxHeaderBytes) state_ = State::Failed;
                return false;
            }
            headerLength = end;
            skip = end + 4;
        }

        beginPart(buf_.substr(0, headerLength));
        consume(skip);
        current_.offset = base_;
        state_ = State::Data;
        return true;
    }

    bool scanData() {
        auto pos = buf_.find(dataDelimiter_);
        if (pos == std::string::npos) {
            current_.size += consumeAllBut(dataDelimiter_.size() - 1);
            checkPartSize();
            return false;
        }

        current_.size += pos;
        if (!checkPartSize()) return false;
        if (currentIsFile_) files_.push_back(current_);
        consume(pos + dataDelimiter_.size());
        state_ = State::Delimiter;
        return true;
    }

    bool checkPartSize() {
        if (current_.size <= maxPartBytes_) return true;
        oversized_ = current_;
        state_ = State::Failed;
        return false;
    }

    void beginPart(const std::string& headers) {
        auto disposition = detail::getHeaderValue(headers, "content-disposition");
        current_ = PartInfo{};
        detail::extractParam(disposition, "name", current_.fieldName);
        std::string filename;
        currentIsFile_ = detail::extractParam(disposition, "filename", filename);
        current_.filename = detail::percentDecode(filename);
        auto type = detail::getHeaderValue(headers, "content-type");
        current_.contentType = type.empty() ? "application/octet-stream" : type;
    }
};

// ── Parse a fully received multipart/form-data body ──
inline ParseResult parse(std::string_view body, const std::string& contentType) {
    ParseResult result;
    auto boundary = extractBoundary(contentType);
    if (boundary.empty()) return result;

    StreamParser parser(boundary);
    parser.feed(body);
    result.valid = parser.valid();

    for (const auto& part : parser.files()) {
        UploadedFile file;
        file.fieldName   = part.fieldName;
        file.filename    = part.filename;
        file.contentType = part.contentType;
        file.data        = std::string(body.substr(part.offset, part.size));
        file.size        = file.data.size();
        result.files.push_back(std::move(file));
    }
    return result;
}

} // namespace quickshare::multipart
