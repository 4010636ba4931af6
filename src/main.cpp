#include "CacheUpdater.hpp"
#include "Config.hpp"
#include "DnsServer.hpp"
#include "DoHResolver.hpp"
#include "HttpsDohClient.hpp"
#include "Logger.hpp"
#include "QueryHandler.hpp"
#include "RecordCache.hpp"
#include "RoutingPolicy.hpp"
#include "UdpTransport.hpp"
#include "UpstreamResolver.hpp"
#include <csignal>
#include <iostream>

namespace {
DnsServer* g_dnsServer = nullptr;
}

void signalHandler(int) {
    if (g_dnsServer) {
        g_dnsServer->stop();
    }
}

int main(int argc, char* argv[]) {
    ResolverConfig config;
    try {
        config = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return 2;
    }
    if (config.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }
    config.debug = debugFromEnvironment();

    Logger logger(config.debug);

    try {
        RecordCache cache(logger, config.cachePath);
        if (!config.cachePath.empty()) {
            cache.loadFrom(config.cachePath);
        }

        RoutingPolicy policy(logger);
        if (!config.pacPath.empty()) {
            policy.loadFrom(config.pacPath);
        }

        std::string chain;
        for (const auto& upstream : config.upstreams) {
            chain += (chain.empty() ? "" : ",") + upstream;
        }
        logger.debug("upstreams [" + chain + "]");

        UdpTransport transport;
        UpstreamResolver upstreamResolver(transport, logger);
        HttpsDohClient dohClient;
        DoHResolver dohResolver(dohClient, upstreamResolver, logger);
        CacheUpdater updater(cache, logger);
        QueryHandler handler(cache, policy, upstreamResolver, dohResolver, updater, logger,
                             config.upstreams, POLICY_UPSTREAMS);

        DnsServer dnsServer(config.listenAddress, handler, updater, logger);
        g_dnsServer = &dnsServer;
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        dnsServer.start();

        g_dnsServer = nullptr;
        updater.flush();
        updater.rethrowIfFailed();
    } catch (const std::exception& e) {
        g_dnsServer = nullptr;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
