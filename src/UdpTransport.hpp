#pragma once

#include "UpstreamResolver.hpp"
#include <chrono>
#include <string>
#include <sys/socket.h>

// A resolved socket address, IPv4 or IPv6.
struct Endpoint {
    struct sockaddr_storage address;
    socklen_t length = 0;

    int family() const { return address.ss_family; }
    const struct sockaddr* get() const { return reinterpret_cast<const struct sockaddr*>(&address); }
};

// Resolves "host:port" or "[v6-address]:port". The host may be a name or a
// literal; an empty host means every IPv4 interface. Throws
// std::runtime_error on malformed input or when the host does not resolve.
Endpoint parseEndpoint(const std::string& endpoint);

// Numeric host of an address, for log lines.
std::string addressToString(const struct sockaddr_storage& address);

// Real UDP exchange with an upstream server. Each exchange waits at most
// the configured timeout for the reply.
class UdpTransport : public UdpExchanger {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{2000};
    static constexpr size_t MAX_MESSAGE_SIZE = 65535;

    explicit UdpTransport(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    DnsMessage exchange(const DnsMessage& query, const std::string& endpoint) override;

private:
    std::chrono::milliseconds timeout_;
};
