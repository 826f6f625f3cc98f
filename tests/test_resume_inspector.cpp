#include <catch2/catch.hpp>

#include <algorithm>

#include "gator/completion_record.hpp"
#include "gator/resume_inspector.hpp"
#include "gator/segment_planner.hpp"
#include "test_helpers.hpp"

using gator::CompletionRecord;
using gator::Fingerprint;
using gator::ResumeInspector;
using gator::SegmentPlanner;
using gator::SegmentState;

namespace {

constexpr std::uint64_t kTotal = 1000;
constexpr std::uint64_t kSegment = 100;

Fingerprint fingerprint(std::string validator = "\"v1\"") {
    return Fingerprint{"http://example.com/f", kTotal, kSegment, std::move(validator),
                       static_cast<std::uint32_t>(kTotal / kSegment)};
}

std::vector<gator::Segment> plan() { return SegmentPlanner(kSegment, 0).plan(kTotal, true); }

void writeRecord(const std::filesystem::path& destination, const Fingerprint& fp,
                 std::initializer_list<std::uint32_t> done) {
    CompletionRecord record(CompletionRecord::pathFor(destination));
    record.create(fp);
    for (const auto id : done) {
        record.markDone(id);
    }
}

} // namespace

TEST_CASE("Without an output file the job starts fresh") {
    TempDir tmp;
    const auto destination = tmp.path() / "f";
    writeRecord(destination, fingerprint(), {0, 1});

    const auto result = ResumeInspector{}.inspect(destination, plan(), fingerprint());

    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.pending.size() == 10);
    REQUIRE(result.segments.size() == 10);
    REQUIRE_FALSE(std::filesystem::exists(CompletionRecord::pathFor(destination)));
}

TEST_CASE("Matching record removes completed segments from the work list") {
    TempDir tmp;
    const auto destination = tmp.path() / "f";
    writeFile(destination, std::string(kTotal, '\0'));
    writeRecord(destination, fingerprint(), {0, 4, 9});

    const auto result = ResumeInspector{}.inspect(destination, plan(), fingerprint());

    REQUIRE(result.resumed);
    REQUIRE(result.resumed_bytes == 3 * kSegment);
    REQUIRE(result.pending.size() == 7);
    for (const auto& segment : result.pending) {
        REQUIRE(segment.id != 0);
        REQUIRE(segment.id != 4);
        REQUIRE(segment.id != 9);
        REQUIRE(segment.state == SegmentState::pending);
    }
    REQUIRE(result.segments[4].state == SegmentState::done);
    REQUIRE(result.segments[5].state == SegmentState::pending);
    REQUIRE(std::is_sorted(result.pending.begin(), result.pending.end(),
                           [](const auto& a, const auto& b) { return a.start < b.start; }));
}

TEST_CASE("Fingerprint mismatch discards the record") {
    TempDir tmp;
    const auto destination = tmp.path() / "f";
    writeFile(destination, std::string(kTotal, '\0'));
    writeRecord(destination, fingerprint("\"v1\""), {0, 1, 2});

    Fingerprint current = fingerprint();
    SECTION("validator changed") {
        current.validator = "\"v2\"";
    }
    SECTION("url changed") {
        current.url = "http://example.com/other";
    }
    SECTION("segment size changed") {
        current.segment_size = 50;
    }
    SECTION("segment count changed") {
        current.segment_count = 1;
    }

    const auto result = ResumeInspector{}.inspect(destination, plan(), current);

    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.pending.size() == 10);
    REQUIRE_FALSE(std::filesystem::exists(CompletionRecord::pathFor(destination)));
}

TEST_CASE("Output of a different size invalidates the record") {
    TempDir tmp;
    const auto destination = tmp.path() / "f";
    writeFile(destination, std::string(kTotal / 2, '\0'));
    writeRecord(destination, fingerprint(), {0});

    const auto result = ResumeInspector{}.inspect(destination, plan(), fingerprint());

    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.pending.size() == 10);
    REQUIRE_FALSE(std::filesystem::exists(CompletionRecord::pathFor(destination)));
}

TEST_CASE("Record ids outside the plan are treated as a mismatch") {
    TempDir tmp;
    const auto destination = tmp.path() / "f";
    writeFile(destination, std::string(kTotal, '\0'));
    writeRecord(destination, fingerprint(), {1, 42});

    const auto result = ResumeInspector{}.inspect(destination, plan(), fingerprint());

    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.pending.size() == 10);
}

TEST_CASE("A record for a larger plan does not cover a single whole-file segment") {
    TempDir tmp;
    const auto destination = tmp.path() / "f";
    writeFile(destination, std::string(kTotal, '\0'));
    writeRecord(destination, fingerprint(), {0});

    // Same resource, but the server no longer accepts ranges.
    auto single = SegmentPlanner(kSegment, 0).plan(kTotal, false);
    REQUIRE(single.size() == 1);
    Fingerprint current = fingerprint();
    current.segment_count = 1;

    const auto result = ResumeInspector{}.inspect(destination, std::move(single), current);

    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.pending.size() == 1);
    REQUIRE(result.segments[0].state == SegmentState::pending);
    REQUIRE_FALSE(std::filesystem::exists(CompletionRecord::pathFor(destination)));
}

TEST_CASE("Unknown length is never resumed") {
    TempDir tmp;
    const auto destination = tmp.path() / "f";
    writeFile(destination, std::string(kTotal, '\0'));
    writeRecord(destination, fingerprint(), {0});

    const auto result = ResumeInspector{}.inspect(destination, SegmentPlanner().plan(std::nullopt, true),
                                                  std::nullopt);

    REQUIRE_FALSE(result.resumed);
    REQUIRE(result.pending.size() == 1);
    REQUIRE_FALSE(std::filesystem::exists(CompletionRecord::pathFor(destination)));
}
