#include "RoutingPolicy.hpp"
#include "types.hpp"
#include <fstream>

void RoutingPolicy::loadFrom(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger_.info("pac file " + path + " is not found, no domains will use DNS-over-HTTPS");
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        add(line);
    }

    logger_.info("Loaded " + std::to_string(rules_.size()) + " pac rules from " + path);
    if (logger_.debugEnabled()) {
        std::string listing = "PAC rules:";
        for (const auto& rule : rules_) {
            listing += " " + rule;
        }
        logger_.debug(listing);
    }
}

void RoutingPolicy::add(const std::string& domain) {
    const char* whitespace = " \t\r\n";
    size_t start = domain.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return;
    }
    size_t end = domain.find_last_not_of(whitespace);
    rules_.insert(toFqdn(domain.substr(start, end - start + 1)));
}

bool RoutingPolicy::matches(const std::string& name) const {
    return rules_.count(toFqdn(name)) > 0;
}
