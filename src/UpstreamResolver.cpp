#include "UpstreamResolver.hpp"
#include <optional>
#include <random>
#include <stdexcept>

namespace {

uint16_t randomQueryId() {
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> distribution(0, 0xFFFF);
    return static_cast<uint16_t>(distribution(generator));
}

} // namespace

UpstreamResolver::UpstreamResolver(UdpExchanger& exchanger, const Logger& logger)
    : exchanger_(exchanger), logger_(logger) {}

AddressList UpstreamResolver::resolve(const std::string& name, const UpstreamList& upstreams) {
    DnsMessage query = DnsMessage::queryFor(randomQueryId(), toFqdn(name));
    std::optional<DnsMessage> reply;

    for (size_t i = 0; i < upstreams.size(); i++) {
        try {
            reply = exchanger_.exchange(query, upstreams[i]);
        } catch (const std::exception& e) {
            if (i == upstreams.size() - 1) {
                logger_.error("Error querying from upstreams: " + name + " " + e.what());
                return {};
            }
            logger_.debug("udp[" + upstreams[i] + "] " + name + " failed: " + e.what());
            continue;
        }

        // Any reply ends the chain, even one without A records
        logger_.debug("udp[" + upstreams[i] + "] answered " + name);
        if (reply->isTruncated()) {
            logger_.debug("udp[" + upstreams[i] + "] reply for " + name + " is truncated");
        }
        break;
    }

    if (!reply) {
        logger_.info("No record found for " + name);
        return {};
    }

    AddressList addresses = addressesOf(*reply);
    if (logger_.debugEnabled()) {
        for (const auto& address : addresses) {
            logger_.debug("udp " + name + " -> " + address);
        }
    }
    return addresses;
}

AddressList UpstreamResolver::addressesOf(const DnsMessage& reply) {
    AddressList addresses;
    for (const auto& answer : reply.answers) {
        if (answer.type == DnsType::A) {
            addresses.push_back(answer.data);
        }
    }
    return addresses;
}
