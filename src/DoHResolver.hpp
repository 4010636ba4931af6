#pragma once

#include "Logger.hpp"
#include "UpstreamResolver.hpp"
#include "types.hpp"
#include <chrono>
#include <string>

// A pool of DNS-over-HTTPS providers queried for A records.
class DohClient {
public:
    virtual ~DohClient() = default;

    // Addresses of the first provider that answers. Throws
    // std::runtime_error when the timeout expires or every provider failed.
    virtual AddressList query(const std::string& name, std::chrono::milliseconds timeout) = 0;
};

// Resolves over DoH; on any DoH failure retries with plain DNS against the
// given fallback upstreams.
class DoHResolver {
public:
    static constexpr std::chrono::milliseconds QUERY_TIMEOUT{10000};

    DoHResolver(DohClient& client, UpstreamResolver& fallback, const Logger& logger);
    virtual ~DoHResolver() = default;

    virtual AddressList resolve(const std::string& name, const UpstreamList& fallbackUpstreams);

private:
    DohClient& client_;
    UpstreamResolver& fallback_;
    const Logger& logger_;
};
