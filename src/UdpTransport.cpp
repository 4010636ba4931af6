#include "UdpTransport.hpp"
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

// Closes the socket on every exit path.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

Endpoint parseEndpoint(const std::string& endpoint) {
    size_t colon = endpoint.rfind(':');
    if (colon == std::string::npos) {
        throw std::runtime_error("Invalid address, missing port: " + endpoint);
    }
    std::string host = endpoint.substr(0, colon);
    std::string portText = endpoint.substr(colon + 1);

    if (!host.empty() && host.front() == '[') {
        if (host.size() < 2 || host.back() != ']') {
            throw std::runtime_error("Invalid bracketed address: " + endpoint);
        }
        host = host.substr(1, host.size() - 2);
    } else if (host.find(':') != std::string::npos) {
        throw std::runtime_error("IPv6 address must be bracketed: " + endpoint);
    }

    int port = 0;
    try {
        size_t consumed = 0;
        port = std::stoi(portText, &consumed);
        if (consumed != portText.size()) {
            throw std::invalid_argument(portText);
        }
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port in address: " + endpoint);
    }
    if (port < 0 || port > 65535) {
        throw std::runtime_error("Port out of range in address: " + endpoint);
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_NUMERICSERV;
    if (host.empty()) {
        hints.ai_family = AF_INET;
        hints.ai_flags |= AI_PASSIVE;
    } else {
        hints.ai_family = AF_UNSPEC;
    }

    struct addrinfo* results = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
        throw std::runtime_error("Cannot resolve " + endpoint + ": " + gai_strerror(rc));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> owned(results, &freeaddrinfo);

    for (const struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        if ((ai->ai_family == AF_INET || ai->ai_family == AF_INET6) &&
            ai->ai_addrlen <= sizeof(struct sockaddr_storage)) {
            Endpoint resolved;
            std::memset(&resolved.address, 0, sizeof(resolved.address));
            std::memcpy(&resolved.address, ai->ai_addr, ai->ai_addrlen);
            resolved.length = static_cast<socklen_t>(ai->ai_addrlen);
            return resolved;
        }
    }
    throw std::runtime_error("No usable address for " + endpoint);
}

std::string addressToString(const struct sockaddr_storage& address) {
    char host[INET6_ADDRSTRLEN] = "?";
    if (address.ss_family == AF_INET) {
        inet_ntop(AF_INET, &reinterpret_cast<const struct sockaddr_in*>(&address)->sin_addr, host, sizeof(host));
    } else if (address.ss_family == AF_INET6) {
        inet_ntop(AF_INET6, &reinterpret_cast<const struct sockaddr_in6*>(&address)->sin6_addr, host, sizeof(host));
    }
    return host;
}

UdpTransport::UdpTransport(std::chrono::milliseconds timeout) : timeout_(timeout) {}

DnsMessage UdpTransport::exchange(const DnsMessage& query, const std::string& endpoint) {
    Endpoint upstream = parseEndpoint(endpoint);

    SocketGuard sock(socket(upstream.family(), SOCK_DGRAM, 0));
    if (sock.get() < 0) {
        throw std::runtime_error(std::string("Failed to create upstream socket: ") + strerror(errno));
    }

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
    if (setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(sock.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw std::runtime_error(std::string("Failed to set socket timeout: ") + strerror(errno));
    }

    // connect() makes the kernel drop datagrams from other sources
    if (connect(sock.get(), upstream.get(), upstream.length) < 0) {
        throw std::runtime_error("Failed to connect to " + endpoint + ": " + strerror(errno));
    }

    std::vector<uint8_t> request = DnsPacket::encode(query);
    if (send(sock.get(), request.data(), request.size(), 0) < 0) {
        throw std::runtime_error("Error sending to " + endpoint + ": " + strerror(errno));
    }

    std::vector<uint8_t> buffer(MAX_MESSAGE_SIZE);
    while (true) {
        ssize_t received = recv(sock.get(), buffer.data(), buffer.size(), 0);
        if (received < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw std::runtime_error("Timeout waiting for " + endpoint);
            }
            throw std::runtime_error("Error receiving from " + endpoint + ": " + strerror(errno));
        }

        std::vector<uint8_t> packet(buffer.begin(), buffer.begin() + received);
        DnsMessage reply = DnsPacket::decode(packet);
        if (!reply.isResponse() || reply.id != query.id) {
            // Late answer to an earlier query; keep waiting for ours
            continue;
        }
        return reply;
    }
}
