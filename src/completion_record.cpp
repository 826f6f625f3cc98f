#include "gator/completion_record.hpp"
#include "gator/error.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "gator/detail/http_headers.hpp"

namespace gator {

namespace {

constexpr const char* kMagic = "gator-resume 1";

// Splits "key value" at the first space; the value may itself contain spaces.
bool splitField(const std::string& line, std::string& key, std::string& value) {
    const auto space = line.find(' ');
    if (space == std::string::npos) {
        key = line;
        value.clear();
        return !key.empty();
    }
    key = line.substr(0, space);
    value = line.substr(space + 1);
    return true;
}

} // namespace

CompletionRecord::CompletionRecord(std::filesystem::path path) : path_(std::move(path)) {}

CompletionRecord::~CompletionRecord() { close(); }

std::filesystem::path CompletionRecord::pathFor(const std::filesystem::path& destination) {
    std::filesystem::path record = destination;
    record += ".gator";
    return record;
}

std::optional<CompletionRecord::Contents> CompletionRecord::load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(in, line) || line != kMagic) {
        spdlog::warn("Ignoring unreadable completion record {}", path.string());
        return std::nullopt;
    }

    Contents contents;
    bool has_url = false;
    bool has_size = false;
    bool has_segment_size = false;
    std::string key;
    std::string value;

    while (std::getline(in, line)) {
        // A line without its newline was cut short by a crash mid-append.
        if (in.eof()) {
            break;
        }
        if (!splitField(line, key, value)) {
            continue;
        }

        if (key == "url") {
            contents.fingerprint.url = value;
            has_url = true;
        } else if (key == "size") {
            const auto size = detail::parseUnsigned(value);
            if (!size) {
                return std::nullopt;
            }
            contents.fingerprint.total_size = *size;
            has_size = true;
        } else if (key == "segment-size") {
            const auto size = detail::parseUnsigned(value);
            if (!size) {
                return std::nullopt;
            }
            contents.fingerprint.segment_size = *size;
            has_segment_size = true;
        } else if (key == "segments") {
            const auto count = detail::parseUnsigned(value);
            if (!count || *count > std::numeric_limits<std::uint32_t>::max()) {
                return std::nullopt;
            }
            contents.fingerprint.segment_count = static_cast<std::uint32_t>(*count);
        } else if (key == "validator") {
            contents.fingerprint.validator = value;
        } else if (key == "done") {
            const auto id = detail::parseUnsigned(value);
            if (id && *id <= std::numeric_limits<std::uint32_t>::max()) {
                contents.done.insert(static_cast<std::uint32_t>(*id));
            }
        }
    }

    if (!has_url || !has_size || !has_segment_size) {
        spdlog::warn("Completion record {} has an incomplete header", path.string());
        return std::nullopt;
    }
    return contents;
}

void CompletionRecord::discard(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (std::filesystem::remove(path, ec)) {
        spdlog::debug("Removed completion record {}", path.string());
    } else if (ec) {
        spdlog::warn("Cannot remove completion record {}: {}", path.string(), ec.message());
    }
}

void CompletionRecord::create(const Fingerprint& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.reset(std::fopen(path_.c_str(), "wb"));
    if (!file_) {
        throw DownloadError(ErrorKind::disk,
                            fmt::format("Cannot create completion record {}: {}", path_.string(),
                                        std::strerror(errno)));
    }

    const std::string header = fmt::format("{}\nurl {}\nsize {}\nsegment-size {}\nsegments {}\nvalidator {}\n",
                                           kMagic,
                                           fingerprint.url,
                                           fingerprint.total_size,
                                           fingerprint.segment_size,
                                           fingerprint.segment_count,
                                           fingerprint.validator);
    if (std::fwrite(header.data(), 1, header.size(), file_.get()) != header.size() ||
        std::fflush(file_.get()) != 0) {
        file_.reset();
        throw DownloadError(ErrorKind::disk,
                            fmt::format("Cannot write completion record {}", path_.string()));
    }
}

void CompletionRecord::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.reset(std::fopen(path_.c_str(), "ab"));
    if (!file_) {
        throw DownloadError(ErrorKind::disk,
                            fmt::format("Cannot open completion record {}: {}", path_.string(),
                                        std::strerror(errno)));
    }
}

void CompletionRecord::markDone(std::uint32_t segment_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_) {
        throw DownloadError(ErrorKind::disk,
                            fmt::format("Completion record {} is not open", path_.string()));
    }

    const std::string line = fmt::format("done {}\n", segment_id);
    if (std::fwrite(line.data(), 1, line.size(), file_.get()) != line.size() ||
        std::fflush(file_.get()) != 0) {
        throw DownloadError(ErrorKind::disk,
                            fmt::format("Cannot append to completion record {}", path_.string()));
    }
}

void CompletionRecord::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.reset();
}

void CompletionRecord::remove() noexcept {
    close();
    discard(path_);
}

} // namespace gator
