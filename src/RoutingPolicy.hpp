#pragma once

#include "Logger.hpp"
#include <set>
#include <string>

// Domains that are resolved over DNS-over-HTTPS. Matching is exact on the
// fully-qualified name; there are no wildcards. Read-only once loaded.
class RoutingPolicy {
public:
    explicit RoutingPolicy(const Logger& logger) : logger_(logger) {}

    // One domain per line. A missing file leaves the set empty.
    void loadFrom(const std::string& path);

    void add(const std::string& domain);

    bool matches(const std::string& name) const;

    size_t size() const { return rules_.size(); }

private:
    const Logger& logger_;
    std::set<std::string> rules_;
};
