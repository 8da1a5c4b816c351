#pragma once
#include <memory>
#include <optional>
#include <string>

#include "transport/RateLimiter.hpp"
#include "transport/Transport.hpp"
#include "utils/Config.hpp"

// libcurl implementation. One instance is shared by all workers: the pacing
// clock, DNS cache and connection cache are common to every exchange.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(ClientConfig config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    ResponseSnapshot exchange(const RequestRecord& request,
                              const HeaderList& headers,
                              const std::optional<std::string>& body) override;

private:
    struct Shared;

    std::string proxyFor(const std::string& url) const;

    ClientConfig config_;
    RateLimiter limiter_;
    std::unique_ptr<Shared> shared_;
};
