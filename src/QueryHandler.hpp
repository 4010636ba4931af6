#pragma once

#include "CacheUpdater.hpp"
#include "Config.hpp"
#include "DnsPacket.hpp"
#include "DoHResolver.hpp"
#include "Logger.hpp"
#include "RecordCache.hpp"
#include "RoutingPolicy.hpp"
#include "UpstreamResolver.hpp"
#include <future>
#include <map>
#include <mutex>
#include <string>

// Answers A questions from the cache, or on a miss from DoH (policy
// domains) or the plain upstream chain (everything else). Safe to call
// from many threads at once; concurrent misses for one name share a single
// resolution.
class QueryHandler {
public:
    QueryHandler(RecordCache& cache,
                 const RoutingPolicy& policy,
                 UpstreamResolver& upstreamResolver,
                 DoHResolver& dohResolver,
                 CacheUpdater& updater,
                 const Logger& logger,
                 UpstreamList nonPolicyUpstreams,
                 UpstreamList policyUpstreams = POLICY_UPSTREAMS);
    ~QueryHandler();

    QueryHandler(const QueryHandler&) = delete;
    QueryHandler& operator=(const QueryHandler&) = delete;

    // Builds the reply for a decoded query. Questions that cannot be
    // answered simply get no answer records; the RCODE stays NOERROR.
    DnsMessage handle(const DnsMessage& query);

    // Cached addresses for name, resolving and scheduling a cache update on
    // a miss.
    AddressList lookup(const std::string& name);

private:
    AddressList resolveShared(const std::string& fqdn);
    AddressList resolve(const std::string& fqdn);

    RecordCache& cache_;
    const RoutingPolicy& policy_;
    UpstreamResolver& upstreamResolver_;
    DoHResolver& dohResolver_;
    CacheUpdater& updater_;
    const Logger& logger_;
    UpstreamList nonPolicyUpstreams_;
    UpstreamList policyUpstreams_;

    std::mutex inflightMutex_;
    std::map<std::string, std::shared_future<AddressList>> inflight_;
};
