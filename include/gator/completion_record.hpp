#pragma once

#include "download_job.hpp"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>

namespace gator {

// Sidecar journal of finished segments, stored next to the output file.
// The header carries the fingerprint; each completed segment appends one
// "done <id>" line that is flushed before markDone() returns.
class CompletionRecord {
public:
    struct Contents {
        Fingerprint fingerprint;
        std::set<std::uint32_t> done;
    };

    explicit CompletionRecord(std::filesystem::path path);
    ~CompletionRecord();

    CompletionRecord(const CompletionRecord&) = delete;
    CompletionRecord& operator=(const CompletionRecord&) = delete;

    [[nodiscard]] static std::filesystem::path pathFor(const std::filesystem::path& destination);

    // Empty when the record is missing or its header is unreadable.
    [[nodiscard]] static std::optional<Contents> load(const std::filesystem::path& path);

    static void discard(const std::filesystem::path& path) noexcept;

    // Truncates any previous record and writes a fresh header.
    void create(const Fingerprint& fingerprint);

    // Reopens an existing record for appending.
    void reopen();

    // Thread-safe.
    void markDone(std::uint32_t segment_id);

    void close() noexcept;
    void remove() noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    std::filesystem::path path_;
    std::mutex mutex_;
    std::unique_ptr<FILE, FileDeleter> file_{};
};

} // namespace gator
