#include "Config.hpp"
#include <cstdlib>
#include <sstream>

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    size_t start = value.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(start, end - start + 1);
}

} // namespace

UpstreamList splitUpstreams(const std::string& list) {
    UpstreamList result;
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

ResolverConfig parseCommandLine(int argc, char* argv[]) {
    ResolverConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help" || arg == "-help") {
            config.showHelp = true;
            return config;
        }

        if (arg.size() < 2 || arg[0] != '-') {
            throw UsageError("unexpected argument: " + arg);
        }

        // Both -flag and --flag are accepted
        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::string value;
        bool hasValue = false;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            hasValue = true;
        }

        if (name != "addr" && name != "pac" && name != "cache" && name != "upstreams") {
            throw UsageError("flag provided but not defined: -" + name);
        }

        if (!hasValue) {
            if (i + 1 >= argc) {
                throw UsageError("flag needs an argument: -" + name);
            }
            value = argv[++i];
        }

        if (name == "addr") {
            config.listenAddress = value;
        } else if (name == "pac") {
            config.pacPath = value;
        } else if (name == "cache") {
            config.cachePath = value;
        } else {
            config.upstreams = splitUpstreams(value);
        }
    }

    return config;
}

bool debugFromEnvironment() {
    const char* value = std::getenv(DEBUG_ENV_VAR);
    return value != nullptr && std::string(value) == "1";
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -addr ADDR         UDP listen address (default: :5353)\n"
        << "  -pac PATH          File with domains resolved over DNS-over-HTTPS\n"
        << "  -cache PATH        File used to persist resolved records\n"
        << "  -upstreams LIST    Comma separated upstreams for domains not in the pac file\n"
        << "                     (default: 114.114.114.114:53,8.8.8.8:53)\n"
        << "  -h, --help         Show this help message\n"
        << "Environment:\n"
        << "  " << DEBUG_ENV_VAR << "=1         Enable debug logging\n";
    return oss.str();
}
