#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

// Name of the environment variable that switches on debug logging ("1").
constexpr const char* DEBUG_ENV_VAR = "IDNS_DEBUG";

// Public resolvers used when a DoH lookup for a policy domain fails.
inline const UpstreamList POLICY_UPSTREAMS = {
    "8.8.8.8:53",
    "8.8.4.4:53",
    "1.1.1.1:53",
    "114.114.114.114:53"
};

struct ResolverConfig {
    std::string listenAddress = ":5353";
    std::string pacPath;
    std::string cachePath;
    UpstreamList upstreams = {"114.114.114.114:53", "8.8.8.8:53"};
    bool debug = false;
    bool showHelp = false;
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// Accepts "-flag value", "--flag value" and "-flag=value". Throws UsageError
// on unknown flags or missing values.
ResolverConfig parseCommandLine(int argc, char* argv[]);

// Splits a comma separated endpoint list, dropping empty items.
UpstreamList splitUpstreams(const std::string& list);

bool debugFromEnvironment();

std::string usage(const std::string& program);
