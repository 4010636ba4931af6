#pragma once

#include "DoHResolver.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

// A provider speaking the DNS JSON API (application/dns-json).
struct DohProvider {
    std::string name;
    std::string baseUrl;    // scheme://host[:port]
    std::string path;
};

inline const std::vector<DohProvider> DEFAULT_DOH_PROVIDERS = {
    {"quad9", "https://dns.quad9.net:5053", "/dns-query"},
    {"cloudflare", "https://cloudflare-dns.com", "/dns-query"},
    {"google", "https://dns.google", "/resolve"}
};

// Asks one provider; throws std::runtime_error when it fails. Copies run on
// the race threads, which may outlive the client.
using ProviderQuery = std::function<AddressList(const DohProvider& provider,
                                                const std::string& name,
                                                std::chrono::milliseconds timeout)>;

// Sends the query to every provider at once and returns the first answer.
// Providers still running after that are left to finish on their own.
class HttpsDohClient : public DohClient {
public:
    explicit HttpsDohClient(std::vector<DohProvider> providers = DEFAULT_DOH_PROVIDERS,
                            ProviderQuery queryProvider = &HttpsDohClient::queryProvider);

    AddressList query(const std::string& name, std::chrono::milliseconds timeout) override;

    // Extracts the data of type A records from a JSON API response body.
    // Throws std::runtime_error if the body is not valid JSON or reports an
    // error status other than NXDOMAIN.
    static AddressList parseJsonAnswer(const std::string& body);

    static std::string buildQueryPath(const DohProvider& provider, const std::string& name);

    // GET over HTTPS against the provider's JSON API.
    static AddressList queryProvider(const DohProvider& provider, const std::string& name,
                                     std::chrono::milliseconds timeout);

private:
    std::vector<DohProvider> providers_;
    ProviderQuery queryProvider_;
};
