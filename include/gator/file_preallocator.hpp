#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace gator {

class FilePreallocator {
public:
    // Creates the destination and sizes it to exactly total_size. A file that
    // already has that size is left untouched. With an unknown size the file
    // is truncated to zero. Throws DownloadError(disk).
    void preallocate(const std::filesystem::path& destination,
                     std::optional<std::uint64_t> total_size) const;
};

// Write-only descriptor owned by a single worker. writeAt() never moves a
// shared cursor, so several OutputFile instances on the same path can write
// disjoint regions concurrently.
class OutputFile {
public:
    explicit OutputFile(const std::filesystem::path& path);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    // Throws DownloadError(disk) on short or failed writes.
    void writeAt(std::uint64_t offset, const char* data, std::size_t size);

private:
    int fd_{-1};
    std::filesystem::path path_;
};

} // namespace gator
