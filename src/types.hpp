#pragma once

#include <string>
#include <vector>

// IPv4 addresses in dotted-quad form, in the order the resolver returned them.
using AddressList = std::vector<std::string>;

// Ordered "host:port" endpoints; the first one to answer wins.
using UpstreamList = std::vector<std::string>;

// Cache keys and policy rules are fully-qualified ("example.com.").
inline std::string toFqdn(const std::string& name) {
    if (!name.empty() && name.back() == '.') {
        return name;
    }
    return name + ".";
}
