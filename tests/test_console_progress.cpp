#include <catch2/catch.hpp>

#include "gator/console_progress.hpp"

#include <chrono>
#include <sstream>

using gator::ConsoleProgress;

TEST_CASE("Sizes are shown in binary units") {
    REQUIRE(ConsoleProgress::formatSize(512) == "512 B");
    REQUIRE(ConsoleProgress::formatSize(1536) == "1.5 KB");
    REQUIRE(ConsoleProgress::formatSize(26214400) == "25.0 MB");
    REQUIRE(ConsoleProgress::formatSize(3ULL * 1024 * 1024 * 1024) == "3.0 GB");
}

TEST_CASE("Durations switch to hours past sixty minutes") {
    using std::chrono::seconds;
    REQUIRE(ConsoleProgress::formatDuration(seconds(0)) == "0:00");
    REQUIRE(ConsoleProgress::formatDuration(seconds(75)) == "1:15");
    REQUIRE(ConsoleProgress::formatDuration(seconds(3599)) == "59:59");
    REQUIRE(ConsoleProgress::formatDuration(seconds(3723)) == "1:02:03");
}

TEST_CASE("Progress line shows elapsed time and an estimate") {
    ConsoleProgress::Snapshot snapshot;
    snapshot.total_bytes = 10 * 1024 * 1024;
    snapshot.downloaded_bytes = 4 * 1024 * 1024;
    snapshot.bytes_per_second = 1024.0 * 1024.0;
    snapshot.elapsed = std::chrono::seconds(4);

    const auto line = ConsoleProgress::formatLine("file.bin", snapshot);

    REQUIRE(line.find("1.00 MB/s 0:04 ETA 0:06") != std::string::npos);

    snapshot.bytes_per_second = 0.0;
    REQUIRE(ConsoleProgress::formatLine("file.bin", snapshot).find("ETA --:--") != std::string::npos);
}

TEST_CASE("The plan summary lists segments and workers") {
    std::ostringstream out;
    ConsoleProgress progress("file.bin", out);

    SECTION("fresh") {
        progress.onPlanned(25, 25, 16);
        REQUIRE(out.str() == "Downloading in 25 segments\nSpawning 16 workers\n");
    }
    SECTION("resumed") {
        progress.onPlanned(25, 15, 15);
        REQUIRE(out.str().rfind("Resuming: 10 of 25 segments already complete\n", 0) == 0);
    }
}

TEST_CASE("Progress line shows percentage and totals") {
    ConsoleProgress::Snapshot snapshot;
    snapshot.total_bytes = 26214400;
    snapshot.downloaded_bytes = 13107200;

    const auto line = ConsoleProgress::formatLine("/downloads/archive.bin", snapshot);

    REQUIRE(line.rfind("archive.bin", 0) == 0);
    REQUIRE(line.find(" 50%") != std::string::npos);
    REQUIRE(line.find("(12.5 MB/25.0 MB)") != std::string::npos);
}

TEST_CASE("Unknown totals show only the running byte count") {
    ConsoleProgress::Snapshot snapshot;
    snapshot.downloaded_bytes = 2048;

    const auto line = ConsoleProgress::formatLine("stream", snapshot);

    REQUIRE(line.find("2.0 KB") != std::string::npos);
    REQUIRE(line.find('%') == std::string::npos);
}

TEST_CASE("Finished jobs render a final line") {
    std::ostringstream out;
    {
        ConsoleProgress progress("file.bin", out);
        progress.onJobStarted(std::uint64_t{1000}, 200);
        progress.publish(gator::ProgressEvent{800, 0, true});
        progress.onJobFinished(true);
    }

    const auto text = out.str();
    REQUIRE(text.find("100%") != std::string::npos);
    REQUIRE(text.find("Done") != std::string::npos);
}
