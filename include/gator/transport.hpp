#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace gator {

class Cancellation;

// Header names are stored lower-cased.
using Headers = std::map<std::string, std::string>;

struct ByteRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
};

struct ResourceInfo {
    long status{0};
    std::optional<std::uint64_t> total_size;
    bool supports_ranges{false};
    // Strong ETag when the server sends one, else Last-Modified, else empty.
    std::string validator;
    std::string content_type;
};

struct FetchRequest {
    std::string url;
    std::optional<ByteRange> range;
    std::chrono::milliseconds timeout{0};
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::seconds low_speed_time{0};
    const Cancellation* cancellation{nullptr};
};

// Receives one response. Returning false from either callback aborts the
// transfer; the transport then reports FetchCode::aborted.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    virtual bool onResponse(long status, const Headers& headers) = 0;
    virtual bool onBody(const char* data, std::size_t size) = 0;
};

enum class FetchCode {
    ok,
    network_error,
    timeout,
    aborted,
};

struct FetchResult {
    FetchCode code{FetchCode::ok};
    long http_status{0};
    std::string message;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Throws DownloadError when the resource cannot be probed.
    [[nodiscard]] virtual ResourceInfo probe(const std::string& url) = 0;

    // Safe to call concurrently from several threads.
    [[nodiscard]] virtual FetchResult fetch(const FetchRequest& request, ResponseHandler& handler) = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace gator
