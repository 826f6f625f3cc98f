#include <catch2/catch.hpp>

#include "gator/error.hpp"
#include "gator/file_preallocator.hpp"
#include "file_size_limit.hpp"
#include "test_helpers.hpp"

#include <sys/stat.h>

using gator::FilePreallocator;
using gator::OutputFile;

namespace {

gator::ErrorKind preallocateError(const std::filesystem::path& path, std::uint64_t size) {
    try {
        FilePreallocator{}.preallocate(path, size);
    } catch (const gator::DownloadError& ex) {
        return ex.kind();
    }
    FAIL("preallocate() should have thrown");
    return gator::ErrorKind::network;
}

} // namespace

TEST_CASE("Preallocation creates the file at its final size") {
    TempDir tmp;
    const auto path = tmp.path() / "out.bin";

    FilePreallocator{}.preallocate(path, std::uint64_t{3 * 1024 * 1024 + 17});

    REQUIRE(std::filesystem::file_size(path) == 3 * 1024 * 1024 + 17);
}

TEST_CASE("Preallocating a correctly sized file changes nothing") {
    TempDir tmp;
    const auto path = tmp.path() / "out.bin";
    const auto content = makeContent(4096);
    writeFile(path, content);

    struct stat before {};
    REQUIRE(::stat(path.c_str(), &before) == 0);

    FilePreallocator{}.preallocate(path, std::uint64_t{4096});
    FilePreallocator{}.preallocate(path, std::uint64_t{4096});

    struct stat after {};
    REQUIRE(::stat(path.c_str(), &after) == 0);
    REQUIRE(readFile(path) == content);
    REQUIRE(after.st_size == before.st_size);
    REQUIRE(after.st_mtim.tv_sec == before.st_mtim.tv_sec);
    REQUIRE(after.st_mtim.tv_nsec == before.st_mtim.tv_nsec);
}

TEST_CASE("Preallocation resizes a file of the wrong size") {
    TempDir tmp;
    const auto path = tmp.path() / "out.bin";

    SECTION("grow") {
        writeFile(path, "abc");
        FilePreallocator{}.preallocate(path, std::uint64_t{1000});
        REQUIRE(std::filesystem::file_size(path) == 1000);
        REQUIRE(readFile(path).substr(0, 3) == "abc");
    }

    SECTION("shrink") {
        writeFile(path, makeContent(5000));
        FilePreallocator{}.preallocate(path, std::uint64_t{1000});
        REQUIRE(std::filesystem::file_size(path) == 1000);
    }

    SECTION("unknown size truncates") {
        writeFile(path, makeContent(5000));
        FilePreallocator{}.preallocate(path, std::nullopt);
        REQUIRE(std::filesystem::file_size(path) == 0);
    }
}

TEST_CASE("Preallocation failures are disk errors") {
    TempDir tmp;

    SECTION("destination is a directory") {
        REQUIRE(preallocateError(tmp.path(), 100) == gator::ErrorKind::disk);
    }

    SECTION("parent directory is missing") {
        REQUIRE(preallocateError(tmp.path() / "missing" / "out.bin", 100) == gator::ErrorKind::disk);
    }

    SECTION("size exceeds what the filesystem accepts") {
        const auto path = tmp.path() / "out.bin";
        {
            FileSizeLimit limit(1024 * 1024);
            REQUIRE(preallocateError(path, 8 * 1024 * 1024) == gator::ErrorKind::disk);
        }
        REQUIRE(std::filesystem::file_size(path) == 0);
    }
}

TEST_CASE("Independent handles write disjoint regions") {
    TempDir tmp;
    const auto path = tmp.path() / "out.bin";
    FilePreallocator{}.preallocate(path, std::uint64_t{10});

    OutputFile first(path);
    OutputFile second(path);
    second.writeAt(5, "world", 5);
    first.writeAt(0, "hello", 5);

    REQUIRE(readFile(path) == "helloworld");
}
