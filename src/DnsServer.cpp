#include "DnsServer.hpp"
#include "DnsPacket.hpp"
#include "UdpTransport.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <utility>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

DnsServer::DnsServer(std::string listenAddress, QueryHandler& handler, CacheUpdater& updater, const Logger& logger)
    : listenAddress_(std::move(listenAddress)),
      handler_(handler),
      updater_(updater),
      logger_(logger),
      udpSocket_(-1),
      running_(false),
      boundPort_(0) {}

DnsServer::~DnsServer() {
    stop();
    waitForWorkers();
    closeSocket();
}

void DnsServer::setupUdpServer() {
    Endpoint serverAddr = parseEndpoint(listenAddress_);

    udpSocket_ = socket(serverAddr.family(), SOCK_DGRAM, 0);
    if (udpSocket_ < 0) {
        throw std::runtime_error(std::string("Failed to create UDP socket: ") + strerror(errno));
    }

    int opt = 1;
    if (setsockopt(udpSocket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        closeSocket();
        throw std::runtime_error("Failed to set socket options");
    }
#ifdef SO_REUSEPORT
    if (setsockopt(udpSocket_, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0) {
        closeSocket();
        throw std::runtime_error("Failed to enable port reuse");
    }
#endif

    // Wake up regularly to notice stop() and background write failures
    struct timeval tv;
    tv.tv_sec = 1;
    tv.tv_usec = 0;
    if (setsockopt(udpSocket_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        closeSocket();
        throw std::runtime_error("Failed to set receive timeout");
    }

    if (bind(udpSocket_, serverAddr.get(), serverAddr.length) < 0) {
        int bindErrno = errno;
        closeSocket();
        throw std::runtime_error("Failed to bind UDP socket on " + listenAddress_ + ": " + strerror(bindErrno));
    }

    struct sockaddr_storage bound;
    socklen_t boundLen = sizeof(bound);
    if (getsockname(udpSocket_, reinterpret_cast<struct sockaddr*>(&bound), &boundLen) == 0) {
        if (bound.ss_family == AF_INET) {
            boundPort_ = ntohs(reinterpret_cast<struct sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            boundPort_ = ntohs(reinterpret_cast<struct sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    logger_.info("Starting at " + listenAddress_);
}

void DnsServer::closeSocket() {
    if (udpSocket_ >= 0) {
        close(udpSocket_);
        udpSocket_ = -1;
    }
}

void DnsServer::start() {
    running_ = true;
    setupUdpServer();

    std::vector<uint8_t> buffer(MAX_UDP_SIZE);

    try {
        while (running_) {
            updater_.rethrowIfFailed();

            struct sockaddr_storage clientAddr;
            socklen_t clientAddrLen = sizeof(clientAddr);
            ssize_t received = recvfrom(udpSocket_, buffer.data(), buffer.size(), 0,
                                        reinterpret_cast<struct sockaddr*>(&clientAddr), &clientAddrLen);

            if (received < 0) {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && running_) {
                    logger_.error(std::string("Error receiving UDP packet: ") + strerror(errno));
                }
                continue;
            }

            dispatch(std::vector<uint8_t>(buffer.begin(), buffer.begin() + received), clientAddr, clientAddrLen);
        }
    } catch (const std::exception&) {
        running_ = false;
        waitForWorkers();
        closeSocket();
        throw;
    }

    waitForWorkers();
    closeSocket();
    logger_.info("Server stopped");
}

void DnsServer::stop() {
    running_ = false;
}

void DnsServer::spawnWorker(std::function<void()> work) {
    std::thread(std::move(work)).detach();
}

void DnsServer::dispatch(const std::vector<uint8_t>& msg, const struct sockaddr_storage& clientAddr,
                         socklen_t clientLen) {
    auto work = [this, msg, clientAddr, clientLen]() {
        handleDnsQuery(msg, clientAddr, clientLen);
        finishWorker();
    };
    {
        std::lock_guard<std::mutex> lock(workersMutex_);
        activeWorkers_++;
    }

    // A worker that never started still has to be counted down
    try {
        spawnWorker(work);
    } catch (const std::exception& e) {
        logger_.warn(std::string("Cannot start worker thread, handling query inline: ") + e.what());
        work();
    }
}

void DnsServer::finishWorker() {
    std::lock_guard<std::mutex> lock(workersMutex_);
    if (--activeWorkers_ == 0) {
        workersDone_.notify_all();
    }
}

void DnsServer::waitForWorkers() {
    std::unique_lock<std::mutex> lock(workersMutex_);
    workersDone_.wait(lock, [this]() { return activeWorkers_ == 0; });
}

void DnsServer::handleDnsQuery(const std::vector<uint8_t>& msg, const struct sockaddr_storage& clientAddr,
                               socklen_t clientLen) {
    try {
        DnsMessage query = DnsPacket::decode(msg);
        if (query.isResponse()) {
            return;
        }

        DnsMessage response = handler_.handle(query);
        sendUdpResponse(DnsPacket::encode(response), clientAddr, clientLen);
    } catch (const std::exception& e) {
        logger_.error("Error handling DNS query from " + addressToString(clientAddr) + ": " + e.what());
    }
}

void DnsServer::sendUdpResponse(const std::vector<uint8_t>& response, const struct sockaddr_storage& clientAddr,
                                socklen_t clientLen) {
    if (sendto(udpSocket_, response.data(), response.size(), 0,
               reinterpret_cast<const struct sockaddr*>(&clientAddr), clientLen) < 0) {
        logger_.error(std::string("Error sending response: ") + strerror(errno));
    }
}
