#pragma once

#include "CacheUpdater.hpp"
#include "Logger.hpp"
#include "QueryHandler.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <sys/socket.h>

class DnsServer {
public:
    static constexpr size_t MAX_UDP_SIZE = 65535;

    DnsServer(std::string listenAddress, QueryHandler& handler, CacheUpdater& updater, const Logger& logger);
    virtual ~DnsServer();

    DnsServer(const DnsServer&) = delete;
    DnsServer& operator=(const DnsServer&) = delete;

    // Serves until stop() is called. Throws std::runtime_error if the socket
    // cannot be set up or a background cache write failed.
    void start();

    // Only flips an atomic flag, so it may be called from a signal handler.
    void stop();

    // Port the socket is bound to, 0 until start() has bound it.
    uint16_t port() const { return boundPort_; }

protected:
    // Runs work on a new detached thread. Throws std::system_error when no
    // thread can be created.
    virtual void spawnWorker(std::function<void()> work);

private:
    void setupUdpServer();
    void closeSocket();
    void dispatch(const std::vector<uint8_t>& msg, const struct sockaddr_storage& clientAddr, socklen_t clientLen);
    void handleDnsQuery(const std::vector<uint8_t>& msg, const struct sockaddr_storage& clientAddr, socklen_t clientLen);
    void sendUdpResponse(const std::vector<uint8_t>& response, const struct sockaddr_storage& clientAddr, socklen_t clientLen);
    void finishWorker();
    void waitForWorkers();

    std::string listenAddress_;
    QueryHandler& handler_;
    CacheUpdater& updater_;
    const Logger& logger_;

    int udpSocket_;
    std::atomic<bool> running_;
    std::atomic<uint16_t> boundPort_;

    std::mutex workersMutex_;
    std::condition_variable workersDone_;
    size_t activeWorkers_ = 0;
};
