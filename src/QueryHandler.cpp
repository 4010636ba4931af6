#include "QueryHandler.hpp"
#include <exception>
#include <utility>
#include <arpa/inet.h>

QueryHandler::QueryHandler(RecordCache& cache,
                           const RoutingPolicy& policy,
                           UpstreamResolver& upstreamResolver,
                           DoHResolver& dohResolver,
                           CacheUpdater& updater,
                           const Logger& logger,
                           UpstreamList nonPolicyUpstreams,
                           UpstreamList policyUpstreams)
    : cache_(cache),
      policy_(policy),
      upstreamResolver_(upstreamResolver),
      dohResolver_(dohResolver),
      updater_(updater),
      logger_(logger),
      nonPolicyUpstreams_(std::move(nonPolicyUpstreams)),
      policyUpstreams_(std::move(policyUpstreams)) {}

QueryHandler::~QueryHandler() {
    // Pending updates call back into inflight_
    updater_.flush();
}

DnsMessage QueryHandler::handle(const DnsMessage& query) {
    DnsMessage response = DnsMessage::replyTo(query);
    if (query.getOpcode() != static_cast<uint8_t>(DnsOpcode::QUERY)) {
        return response;
    }

    for (const auto& question : query.questions) {
        if (question.type != DnsType::A) {
            continue;
        }

        std::string fqdn = toFqdn(question.name);
        logger_.debug("query " + fqdn);

        for (const auto& address : lookup(fqdn)) {
            // Unparseable entries (e.g. a hand-edited cache file) are skipped
            struct in_addr parsed;
            if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
                logger_.warn("Skipping invalid address " + address + " for " + fqdn);
                continue;
            }
            DnsAnswer answer;
            answer.name = fqdn;
            answer.type = DnsType::A;
            answer.class_ = DnsClass::IN;
            answer.data = address;
            response.answers.push_back(answer);
        }
    }

    return response;
}

AddressList QueryHandler::lookup(const std::string& name) {
    std::string fqdn = toFqdn(name);
    if (auto cached = cache_.get(fqdn)) {
        return *cached;
    }
    return resolveShared(fqdn);
}

AddressList QueryHandler::resolveShared(const std::string& fqdn) {
    std::promise<AddressList> promise;
    std::unique_lock<std::mutex> lock(inflightMutex_);
    auto it = inflight_.find(fqdn);
    if (it != inflight_.end()) {
        std::shared_future<AddressList> pending = it->second;
        lock.unlock();
        return pending.get();
    }
    // The previous resolution may have landed between the cache miss and here
    if (auto cached = cache_.get(fqdn)) {
        return *cached;
    }
    inflight_.emplace(fqdn, promise.get_future().share());
    lock.unlock();

    AddressList addresses;
    try {
        addresses = resolve(fqdn);
    } catch (const std::exception&) {
        promise.set_exception(std::current_exception());
        lock.lock();
        inflight_.erase(fqdn);
        throw;
    }

    promise.set_value(addresses);

    // Later misses keep joining this entry until the cache holds the result
    updater_.submit(fqdn, addresses, [this, fqdn]() {
        std::lock_guard<std::mutex> guard(inflightMutex_);
        inflight_.erase(fqdn);
    });
    return addresses;
}

AddressList QueryHandler::resolve(const std::string& fqdn) {
    if (policy_.matches(fqdn)) {
        logger_.debug("hit pac rule " + fqdn);
        return dohResolver_.resolve(fqdn, policyUpstreams_);
    }
    return upstreamResolver_.resolve(fqdn, nonPolicyUpstreams_);
}
