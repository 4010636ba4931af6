#include "HttpsDohClient.hpp"
#include <cctype>
#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const int DNS_TYPE_A = 1;
const int RCODE_NOERROR = 0;
const int RCODE_NXDOMAIN = 3;

// Shared between the caller and the per-provider threads, which may
// outlive the call.
struct RaceState {
    std::mutex mutex;
    std::condition_variable done;
    std::optional<AddressList> winner;
    size_t failures = 0;
    std::string lastError;
};

std::string encodeQueryValue(const std::string& value) {
    std::string encoded;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            encoded += hex;
        }
    }
    return encoded;
}

} // namespace

HttpsDohClient::HttpsDohClient(std::vector<DohProvider> providers, ProviderQuery queryProvider)
    : providers_(std::move(providers)), queryProvider_(std::move(queryProvider)) {}

std::string HttpsDohClient::buildQueryPath(const DohProvider& provider, const std::string& name) {
    return provider.path + "?name=" + encodeQueryValue(name) + "&type=A";
}

AddressList HttpsDohClient::parseJsonAnswer(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid DoH response: ") + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Invalid DoH response: not a JSON object");
    }

    // SERVFAIL, REFUSED and friends are provider failures; NXDOMAIN is an answer
    if (j.contains("Status")) {
        if (!j["Status"].is_number_integer()) {
            throw std::runtime_error("Invalid DoH response: bad Status field");
        }
        int status = j["Status"].get<int>();
        if (status != RCODE_NOERROR && status != RCODE_NXDOMAIN) {
            throw std::runtime_error("DoH provider returned status " + std::to_string(status));
        }
    }

    AddressList addresses;
    if (j.contains("Answer") && j["Answer"].is_array()) {
        for (const auto& record : j["Answer"]) {
            if (!record.is_object() || !record.contains("data") || !record["data"].is_string()) {
                continue;
            }
            if (record.value("type", 0) != DNS_TYPE_A) {
                continue;
            }
            addresses.push_back(record["data"].get<std::string>());
        }
    }
    return addresses;
}

AddressList HttpsDohClient::queryProvider(const DohProvider& provider, const std::string& name,
                                          std::chrono::milliseconds timeout) {
    httplib::Client client(provider.baseUrl);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    httplib::Headers headers = {{"Accept", "application/dns-json"}};
    auto res = client.Get(buildQueryPath(provider, name), headers);
    if (!res) {
        throw std::runtime_error(provider.name + ": " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error(provider.name + ": HTTP status " + std::to_string(res->status));
    }
    return parseJsonAnswer(res->body);
}

AddressList HttpsDohClient::query(const std::string& name, std::chrono::milliseconds timeout) {
    if (providers_.empty()) {
        throw std::runtime_error("No DoH providers configured");
    }

    auto state = std::make_shared<RaceState>();
    std::string queryName = name;
    if (!queryName.empty() && queryName.back() == '.') {
        queryName.pop_back();
    }

    for (const auto& provider : providers_) {
        std::thread([state, provider, queryName, timeout, ask = queryProvider_]() {
            try {
                AddressList addresses = ask(provider, queryName, timeout);
                std::lock_guard<std::mutex> lock(state->mutex);
                if (!state->winner) {
                    state->winner = std::move(addresses);
                }
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->failures++;
                state->lastError = e.what();
            }
            state->done.notify_all();
        }).detach();
    }

    const size_t total = providers_.size();
    std::unique_lock<std::mutex> lock(state->mutex);
    bool finished = state->done.wait_for(lock, timeout, [&state, total]() {
        return state->winner.has_value() || state->failures == total;
    });

    if (state->winner) {
        return *state->winner;
    }
    if (!finished) {
        throw std::runtime_error("DoH query for " + name + " timed out");
    }
    throw std::runtime_error("All DoH providers failed, last error: " + state->lastError);
}
