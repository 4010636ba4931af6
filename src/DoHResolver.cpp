#include "DoHResolver.hpp"
#include <stdexcept>

DoHResolver::DoHResolver(DohClient& client, UpstreamResolver& fallback, const Logger& logger)
    : client_(client), fallback_(fallback), logger_(logger) {}

AddressList DoHResolver::resolve(const std::string& name, const UpstreamList& fallbackUpstreams) {
    AddressList addresses;
    try {
        addresses = client_.query(name, QUERY_TIMEOUT);
    } catch (const std::exception& e) {
        logger_.debug(name + " " + e.what());
        return fallback_.resolve(name, fallbackUpstreams);
    }

    if (logger_.debugEnabled()) {
        for (const auto& address : addresses) {
            logger_.debug("doh " + name + " -> " + address);
        }
    }
    return addresses;
}
