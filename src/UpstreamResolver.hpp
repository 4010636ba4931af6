#pragma once

#include "DnsPacket.hpp"
#include "Logger.hpp"
#include "types.hpp"
#include <string>

// One request/response round trip with a DNS server over UDP.
class UdpExchanger {
public:
    virtual ~UdpExchanger() = default;

    // Returns the decoded reply from endpoint ("host:port"). Throws
    // std::runtime_error if no well-formed reply arrives.
    virtual DnsMessage exchange(const DnsMessage& query, const std::string& endpoint) = 0;
};

// Plain DNS over an ordered upstream chain. Each endpoint is tried once, in
// order, until one of them replies.
class UpstreamResolver {
public:
    UpstreamResolver(UdpExchanger& exchanger, const Logger& logger);
    virtual ~UpstreamResolver() = default;

    // A records of the first reply, in answer order. Empty when every
    // upstream failed or the reply carried no A records.
    virtual AddressList resolve(const std::string& name, const UpstreamList& upstreams);

private:
    static AddressList addressesOf(const DnsMessage& reply);

    UdpExchanger& exchanger_;
    const Logger& logger_;
};
