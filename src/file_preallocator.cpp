#include "gator/file_preallocator.hpp"
#include "gator/error.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gator {

namespace {

[[noreturn]] void throwDiskError(const std::string& what, const std::filesystem::path& path, int error) {
    throw DownloadError(ErrorKind::disk,
                        fmt::format("{} {}: {}", what, path.string(), std::strerror(error)));
}

class Descriptor {
public:
    explicit Descriptor(int fd) noexcept : fd_(fd) {}
    ~Descriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    // Surfaces deferred write-back errors that close() may report.
    [[nodiscard]] int release() noexcept {
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

} // namespace

void FilePreallocator::preallocate(const std::filesystem::path& destination,
                                   std::optional<std::uint64_t> total_size) const {
    Descriptor fd{::open(destination.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644)};
    if (fd.get() < 0) {
        throwDiskError("Cannot create destination file", destination, errno);
    }

    struct stat info {};
    if (::fstat(fd.get(), &info) != 0) {
        throwDiskError("Cannot stat destination file", destination, errno);
    }
    if (!S_ISREG(info.st_mode)) {
        throw DownloadError(ErrorKind::disk,
                            fmt::format("Destination {} is not a regular file", destination.string()));
    }

    const auto target = static_cast<off_t>(total_size.value_or(0));
    if (info.st_size == target) {
        spdlog::debug("Destination {} already sized to {} bytes", destination.string(), target);
        return;
    }

    if (::ftruncate(fd.get(), target) != 0) {
        throwDiskError("Cannot resize destination file", destination, errno);
    }

    // Reserve the blocks now so a full disk fails here instead of midway
    // through the download. ftruncate alone leaves a sparse file, which is
    // all some filesystems can offer.
    if (target > 0 && ::fallocate(fd.get(), 0, 0, target) != 0) {
        const int error = errno;
        if (error != EOPNOTSUPP && error != ENOSYS) {
            throwDiskError("Cannot allocate space for destination file", destination, error);
        }
        spdlog::debug("fallocate unsupported for {}, keeping sparse file", destination.string());
    }

    if (fd.release() != 0) {
        throwDiskError("Cannot close destination file", destination, errno);
    }
    spdlog::debug("Preallocated {} bytes for {}", target, destination.string());
}

OutputFile::OutputFile(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throwDiskError("Cannot open destination file", path_, errno);
    }
}

OutputFile::~OutputFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void OutputFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throwDiskError("Cannot write destination file", path_, errno);
        }
        if (written == 0) {
            throw DownloadError(ErrorKind::disk,
                                fmt::format("Short write to destination file {}", path_.string()));
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

} // namespace gator
