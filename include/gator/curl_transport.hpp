#pragma once

#include "transport.hpp"

#include <memory>
#include <string>

namespace gator {

class CurlTransport final : public Transport {
public:
    explicit CurlTransport(std::string user_agent = "gator");
    ~CurlTransport() override;

    [[nodiscard]] ResourceInfo probe(const std::string& url) override;
    [[nodiscard]] FetchResult fetch(const FetchRequest& request, ResponseHandler& handler) override;

private:
    // Keeps libcurl out of this header.
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gator
