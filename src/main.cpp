#include "gator/console_progress.hpp"
#include "gator/curl_transport.hpp"
#include "gator/job_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <pthread.h>
#include <signal.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#ifndef GATOR_VERSION
#define GATOR_VERSION "0.0.0"
#endif

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " <url> [options]" << std::endl;
    std::cerr << "Options:\n"
              << "  -o, --output <file>       Write to <file> (default: last URL path component)\n"
              << "  -q, --quiet               Do not render progress\n"
              << "  -t, --threads <n>         Worker count (default: max(16, 4 x cores))\n"
              << "  -s, --segment-size <MiB>  Segment size in MiB (default: 1)\n"
              << "  -r, --retries <n>         Attempts per segment (default: 3)\n"
              << "      --timeout <seconds>   Per-attempt timeout (default: 60)\n"
              << "      --no-keep-partial     Delete the partial file when the download fails\n"
              << "  -v, --verbose             Log debug output\n"
              << "  -h, --help                Show this message\n"
              << "  -V, --version             Show version" << std::endl;
}

struct Options {
    std::string url;
    std::optional<std::string> output;
    bool quiet{false};
    bool verbose{false};
    gator::JobConfig config;
};

int parsePositive(const std::string& option, const char* value, int max) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
    if (parsed <= 0 || parsed > max) {
        throw std::runtime_error("Value for " + option + " is out of range: " + value);
    }
    return parsed;
}

std::string defaultFileName(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        path = path.substr(scheme + 3);
    }
    // A bare host has no path component to name the file after.
    if (path.find('/') == std::string::npos) {
        return "downloaded_file";
    }
    const std::string name = path.substr(path.find_last_of('/') + 1);
    return name.empty() ? "downloaded_file" : name;
}

// Blocks SIGINT/SIGTERM in every thread and turns them into a job
// cancellation from a dedicated thread.
class SignalWatcher {
public:
    explicit SignalWatcher(gator::JobCoordinator& coordinator) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::thread([this, &coordinator] {
            const timespec poll{0, 200 * 1000 * 1000};
            while (!done_.load()) {
                if (sigtimedwait(&signals_, nullptr, &poll) > 0) {
                    std::cerr << "\nInterrupted, stopping workers..." << std::endl;
                    coordinator.cancel();
                    return;
                }
            }
        });
    }

    ~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    sigset_t signals_{};
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

int main(int argc, char** argv) {
    try {
        Options options;
        int arg_index = 1;

        while (arg_index < argc) {
            const std::string option = argv[arg_index];
            const bool has_value = arg_index + 1 < argc;

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (option == "-V" || option == "--version") {
                std::cout << "gator " << GATOR_VERSION << std::endl;
                return 0;
            } else if (option == "-q" || option == "--quiet") {
                options.quiet = true;
                ++arg_index;
            } else if (option == "-v" || option == "--verbose") {
                options.verbose = true;
                ++arg_index;
            } else if (option == "--no-keep-partial") {
                options.config.keep_partial = false;
                ++arg_index;
            } else if (option == "-o" || option == "--output") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                options.output = argv[arg_index + 1];
                arg_index += 2;
            } else if (option == "-t" || option == "--threads") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                options.config.worker_count =
                    static_cast<std::size_t>(parsePositive(option, argv[arg_index + 1], 1024));
                arg_index += 2;
            } else if (option == "-s" || option == "--segment-size") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                options.config.segment_size =
                    static_cast<std::uint64_t>(parsePositive(option, argv[arg_index + 1], 4096)) * 1024 * 1024;
                arg_index += 2;
            } else if (option == "-r" || option == "--retries") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                options.config.max_attempts = parsePositive(option, argv[arg_index + 1], 100);
                arg_index += 2;
            } else if (option == "--timeout") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                options.config.attempt_timeout = std::chrono::seconds(parsePositive(option, argv[arg_index + 1], 86400));
                arg_index += 2;
            } else if (!option.empty() && option[0] == '-') {
                printUsage(argv[0]);
                return 1;
            } else if (options.url.empty()) {
                options.url = option;
                ++arg_index;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (options.url.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);

        const std::filesystem::path destination = options.output.value_or(defaultFileName(options.url));
        auto transport = std::make_shared<gator::CurlTransport>();

        fmt::print("Fetching {}...\n", options.url);
        const auto info = transport->probe(options.url);
        if (!options.quiet) {
            fmt::print("HTTP request sent... {}\n", info.status);
            if (info.total_size) {
                fmt::print("Length: {} bytes ({})\n", *info.total_size,
                           gator::ConsoleProgress::formatSize(*info.total_size));
            } else {
                fmt::print("Length: unknown\n");
            }
            fmt::print("Type: {}\n", info.content_type);
            fmt::print("Saving to: {}\n", destination.string());
        }

        std::shared_ptr<gator::ProgressSink> progress;
        if (options.quiet) {
            progress = std::make_shared<gator::NullProgressSink>();
        } else {
            progress = std::make_shared<gator::ConsoleProgress>(destination.string(), std::cout);
        }

        gator::JobCoordinator coordinator(transport, progress, options.config);
        SignalWatcher signal_watcher(coordinator);

        const auto job = gator::JobCoordinator::describe(options.url, destination, info, options.config);
        const auto outcome = coordinator.run(job);

        if (outcome) {
            fmt::print("Download complete!\n");
            return 0;
        }

        const auto kind = outcome.error.value_or(gator::ErrorKind::network);
        std::cerr << fmt::format("Download failed ({}): {}", gator::toString(kind), outcome.message) << std::endl;
        if (!outcome.incomplete_segments.empty()) {
            std::cerr << fmt::format("{} of {} segments incomplete; rerun the same command to resume",
                                     outcome.incomplete_segments.size(), coordinator.segments().size())
                      << std::endl;
        }
        return kind == gator::ErrorKind::cancelled ? 130 : 1;

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
