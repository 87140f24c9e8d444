/**
 * @file udp_receiver.hpp
 * @brief Loopback UDP socket that collects datagrams for transport tests.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace buffered_statsd::testing {

class UdpReceiver {
public:
    /// Bind 127.0.0.1 on an ephemeral port.
    UdpReceiver() {
        fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) throw std::runtime_error("socket() failed");

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            ::close(fd_);
            throw std::runtime_error("bind() failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~UdpReceiver() {
        if (fd_ >= 0) ::close(fd_);
    }

    UdpReceiver(const UdpReceiver&) = delete;
    UdpReceiver& operator=(const UdpReceiver&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// Next datagram, or nullopt after @p timeout.
    std::optional<std::string> receive(std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
            return std::nullopt;
        }
        char buf[65536];
        auto n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0) return std::nullopt;
        return std::string(buf, static_cast<size_t>(n));
    }

    /// Receive until @p count lines have arrived or a receive times out.
    std::vector<std::string> receive_lines(size_t count,
                                           std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::vector<std::string> lines;
        while (lines.size() < count) {
            auto packet = receive(timeout);
            if (!packet) break;
            std::istringstream in(*packet);
            std::string line;
            while (std::getline(in, line)) lines.push_back(line);
        }
        return lines;
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

}  // namespace buffered_statsd::testing
