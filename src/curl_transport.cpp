#include "gator/curl_transport.hpp"
#include "gator/cancellation.hpp"
#include "gator/detail/http_headers.hpp"
#include "gator/error.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gator {

namespace {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Each worker thread keeps one easy handle for its lifetime so that
// consecutive segments reuse the same connection.
CURL* threadHandle() {
    thread_local CurlHandle handle{nullptr, &curl_easy_cleanup};
    if (!handle) {
        handle.reset(curl_easy_init());
    }
    if (handle) {
        curl_easy_reset(handle.get());
    }
    return handle.get();
}

size_t collectHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<Headers*>(userdata);
    const size_t total = size * nitems;
    detail::parseHeaderLine(std::string_view{buffer, total}, *headers);
    return total;
}

struct TransferContext {
    CURL* curl{nullptr};
    ResponseHandler* handler{nullptr};
    const Cancellation* cancellation{nullptr};
    Headers headers;
    bool delivered{false};
    bool accepted{true};

    bool deliverResponse() {
        if (!delivered) {
            delivered = true;
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            accepted = handler->onResponse(status, headers);
        }
        return accepted;
    }
};

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx->deliverResponse()) {
        return 0;
    }
    if (total == 0) {
        return 0;
    }
    return ctx->handler->onBody(ptr, total) ? total : 0;
}

int checkCancelled(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const TransferContext*>(userdata);
    return (ctx->cancellation && ctx->cancellation->isCancelled()) ? 1 : 0;
}

} // namespace

class CurlTransport::Impl {
public:
    explicit Impl(std::string user_agent) : user_agent_(std::move(user_agent)) {}

    ResourceInfo probe(const std::string& url) const {
        ResourceInfo info = head(url);
        if (info.status == 405 || info.status == 501) {
            spdlog::debug("HEAD rejected with {}, probing {} with a ranged GET", info.status, url);
            info = rangedProbe(url);
        }

        if (info.status >= 400 || info.status == 0) {
            throw DownloadError(ErrorKind::http_status,
                                fmt::format("Server returned error: {}", info.status));
        }
        return info;
    }

    FetchResult fetch(const FetchRequest& request, ResponseHandler& handler) const {
        CURL* curl = threadHandle();
        if (!curl) {
            return {FetchCode::network_error, 0, "Failed to allocate curl handle"};
        }

        TransferContext ctx;
        ctx.curl = curl;
        ctx.handler = &handler;
        ctx.cancellation = request.cancellation;

        applyCommonOptions(curl, request.url);
        std::string range;
        if (request.range) {
            range = fmt::format("{}-{}", request.range->first, request.range->last);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &collectHeader);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx.headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &writeBody);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &checkCancelled);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
        if (request.timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        }
        if (request.connect_timeout.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));
        }
        if (request.low_speed_time.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(request.low_speed_time.count()));
        }

        const CURLcode res = curl_easy_perform(curl);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

        switch (res) {
        case CURLE_OK:
            // Bodiless responses never reach the write callback.
            if (!ctx.deliverResponse()) {
                return {FetchCode::aborted, status, "Response rejected"};
            }
            return {FetchCode::ok, status, {}};
        case CURLE_OPERATION_TIMEDOUT:
            return {FetchCode::timeout, status, curl_easy_strerror(res)};
        case CURLE_ABORTED_BY_CALLBACK:
        case CURLE_WRITE_ERROR:
            return {FetchCode::aborted, status, curl_easy_strerror(res)};
        default:
            return {FetchCode::network_error, status, std::string{"curl error: "} + curl_easy_strerror(res)};
        }
    }

private:
    void applyCommonOptions(CURL* curl, const std::string& url) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    }

    ResourceInfo head(const std::string& url) const {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw DownloadError(ErrorKind::network, "Failed to allocate curl handle");
        }

        Headers headers;
        applyCommonOptions(curl.get(), url);
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &collectHeader);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        perform(curl.get(), url);

        ResourceInfo info;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &info.status);
        info.supports_ranges = detail::acceptsByteRanges(headers);
        info.validator = detail::selectValidator(headers);
        info.content_type = contentType(headers);

        const auto length = headers.find("content-length");
        if (length != headers.end()) {
            info.total_size = detail::parseUnsigned(length->second);
        }
        if (!info.total_size) {
            curl_off_t reported = -1;
            curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &reported);
            // -1 when the server sent no length.
            if (reported >= 0) {
                info.total_size = static_cast<std::uint64_t>(reported);
            }
        }
        return info;
    }

    ResourceInfo rangedProbe(const std::string& url) const {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw DownloadError(ErrorKind::network, "Failed to allocate curl handle");
        }

        Headers headers;
        applyCommonOptions(curl.get(), url);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, "0-0");
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &collectHeader);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);
        // Stop after the first body byte; a server ignoring the range would
        // otherwise stream the whole resource.
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
            +[](char*, size_t size, size_t nmemb, void*) -> size_t {
                return (size * nmemb) > 1 ? 0 : size * nmemb;
            });

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK && res != CURLE_WRITE_ERROR) {
            throw DownloadError(ErrorKind::network,
                                fmt::format("Cannot reach {}: {}", url, curl_easy_strerror(res)));
        }

        ResourceInfo info;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &info.status);
        info.validator = detail::selectValidator(headers);
        info.content_type = contentType(headers);

        if (info.status == 206) {
            const auto range = headers.find("content-range");
            if (range != headers.end()) {
                const auto parsed = detail::parseContentRange(range->second);
                if (parsed && parsed->complete_length) {
                    info.total_size = parsed->complete_length;
                    info.supports_ranges = true;
                }
            }
            // Report the probe as the 200 a HEAD would have produced.
            info.status = 200;
        } else {
            const auto length = headers.find("content-length");
            if (length != headers.end()) {
                info.total_size = detail::parseUnsigned(length->second);
            }
        }
        return info;
    }

    static void perform(CURL* curl, const std::string& url) {
        const CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            throw DownloadError(ErrorKind::network,
                                fmt::format("Cannot reach {}: {}", url, curl_easy_strerror(res)));
        }
    }

    static std::string contentType(const Headers& headers) {
        const auto it = headers.find("content-type");
        return it != headers.end() ? it->second : "unknown";
    }

    std::string user_agent_;
};

CurlTransport::CurlTransport(std::string user_agent) {
    ensureCurlInitialized();
    impl_ = std::make_unique<Impl>(std::move(user_agent));
}

CurlTransport::~CurlTransport() = default;

ResourceInfo CurlTransport::probe(const std::string& url) { return impl_->probe(url); }

FetchResult CurlTransport::fetch(const FetchRequest& request, ResponseHandler& handler) {
    return impl_->fetch(request, handler);
}

} // namespace gator
