#include <catch2/catch.hpp>

#include "gator/completion_record.hpp"
#include "gator/error.hpp"
#include "test_helpers.hpp"

using gator::CompletionRecord;
using gator::Fingerprint;

namespace {

Fingerprint sampleFingerprint() {
    return Fingerprint{"https://example.com/file.bin", 25 * 1024 * 1024, 1024 * 1024, "\"abc 123\"", 25};
}

} // namespace

TEST_CASE("Record sits beside the destination") {
    REQUIRE(CompletionRecord::pathFor("/tmp/out/file.iso") == std::filesystem::path("/tmp/out/file.iso.gator"));
}

TEST_CASE("Record round-trips fingerprint and completed ids") {
    TempDir tmp;
    const auto path = tmp.path() / "file.bin.gator";

    {
        CompletionRecord record(path);
        record.create(sampleFingerprint());
        record.markDone(3);
        record.markDone(0);
        record.markDone(24);
    }

    const auto contents = CompletionRecord::load(path);
    REQUIRE(contents);
    REQUIRE(contents->fingerprint == sampleFingerprint());
    REQUIRE(contents->fingerprint.segment_count == 25);
    REQUIRE(contents->done == std::set<std::uint32_t>{0, 3, 24});
}

TEST_CASE("Reopened record appends to the existing journal") {
    TempDir tmp;
    const auto path = tmp.path() / "file.bin.gator";

    {
        CompletionRecord record(path);
        record.create(sampleFingerprint());
        record.markDone(1);
    }
    {
        CompletionRecord record(path);
        record.reopen();
        record.markDone(2);
    }

    const auto contents = CompletionRecord::load(path);
    REQUIRE(contents);
    REQUIRE(contents->done == std::set<std::uint32_t>{1, 2});
}

TEST_CASE("Creating a record replaces an older one") {
    TempDir tmp;
    const auto path = tmp.path() / "file.bin.gator";

    {
        CompletionRecord record(path);
        record.create(sampleFingerprint());
        record.markDone(5);
    }
    {
        CompletionRecord record(path);
        record.create(sampleFingerprint());
    }

    const auto contents = CompletionRecord::load(path);
    REQUIRE(contents);
    REQUIRE(contents->done.empty());
}

TEST_CASE("A torn trailing line is ignored") {
    TempDir tmp;
    const auto path = tmp.path() / "file.bin.gator";
    writeFile(path,
              "gator-resume 1\nurl http://h/f\nsize 100\nsegment-size 10\nvalidator \ndone 1\ndone 2\ndo");

    const auto contents = CompletionRecord::load(path);
    REQUIRE(contents);
    REQUIRE(contents->fingerprint.validator.empty());
    REQUIRE(contents->done == std::set<std::uint32_t>{1, 2});
}

TEST_CASE("A header without a segment count never matches a real plan") {
    TempDir tmp;
    const auto path = tmp.path() / "file.bin.gator";
    writeFile(path, "gator-resume 1\nurl http://h/f\nsize 100\nsegment-size 10\nvalidator \ndone 0\n");

    const auto contents = CompletionRecord::load(path);
    REQUIRE(contents);
    REQUIRE(contents->fingerprint.segment_count == 0);
}

TEST_CASE("Unreadable records load as absent") {
    TempDir tmp;
    const auto path = tmp.path() / "file.bin.gator";

    SECTION("missing") {
        REQUIRE_FALSE(CompletionRecord::load(path));
    }

    SECTION("wrong magic") {
        writeFile(path, "something else\nurl x\n");
        REQUIRE_FALSE(CompletionRecord::load(path));
    }

    SECTION("header cut short") {
        writeFile(path, "gator-resume 1\nurl http://h/f\n");
        REQUIRE_FALSE(CompletionRecord::load(path));
    }

    SECTION("non-numeric segment count") {
        writeFile(path, "gator-resume 1\nurl http://h/f\nsize 100\nsegment-size 10\nsegments ten\nvalidator \n");
        REQUIRE_FALSE(CompletionRecord::load(path));
    }

    SECTION("non-numeric size") {
        writeFile(path, "gator-resume 1\nurl http://h/f\nsize lots\nsegment-size 10\nvalidator \n");
        REQUIRE_FALSE(CompletionRecord::load(path));
    }
}

TEST_CASE("Removing a record deletes the sidecar") {
    TempDir tmp;
    const auto path = tmp.path() / "file.bin.gator";

    CompletionRecord record(path);
    record.create(sampleFingerprint());
    REQUIRE(std::filesystem::exists(path));

    record.remove();
    REQUIRE_FALSE(std::filesystem::exists(path));
    REQUIRE_THROWS_AS(record.markDone(1), gator::DownloadError);
}

TEST_CASE("Creating a record in a missing directory is a disk error") {
    TempDir tmp;
    CompletionRecord record(tmp.path() / "missing" / "file.bin.gator");
    try {
        record.create(sampleFingerprint());
        FAIL("create() should have thrown");
    } catch (const gator::DownloadError& ex) {
        REQUIRE(ex.kind() == gator::ErrorKind::disk);
    }
}
