/**
 * @file transport.cpp
 * @brief UdpTransport and LogTransport implementations.
 * @author Dimitris Kafetzis
 */

#include "transport/transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace buffered_statsd {

// ─────────────────────────────────────────────
// UdpTransport
// ─────────────────────────────────────────────

UdpTransport::UdpTransport(std::string prefix, uint32_t max_packet_size)
    : prefix_(std::move(prefix)), max_packet_size_(max_packet_size) {}

UdpTransport::~UdpTransport() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<void> UdpTransport::connect(const std::string& address, uint16_t port) {
    if (fd_ >= 0) {
        return Error{"Already connected", ErrorCode::Transport};
    }

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (::inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        return Error{"Invalid address: " + address, ErrorCode::Transport};
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return Error{"Failed to create socket: " + std::string(strerror(errno)),
                     ErrorCode::Transport};
    }

    // A connected datagram socket lets send() report ICMP port-unreachable.
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&dest), sizeof(dest)) < 0) {
        auto err = std::string(strerror(errno));
        ::close(fd);
        return Error{"Connect failed: " + err, ErrorCode::Transport};
    }

    fd_ = fd;
    return ok();
}

Result<void> UdpTransport::send(const Event& event) {
    if (fd_ < 0) {
        return Error{"Not connected", ErrorCode::Closed};
    }

    for (const auto& packet : pack_lines(render(event, prefix_), max_packet_size_)) {
        auto sent = ::send(fd_, packet.data(), packet.size(), MSG_NOSIGNAL);
        if (sent < 0) {
            return Error{"Send of '" + key_of(event) + "' failed: "
                         + std::string(strerror(errno)), ErrorCode::Transport};
        }
        if (static_cast<size_t>(sent) != packet.size()) {
            return Error{"Short send for '" + key_of(event) + "'", ErrorCode::Transport};
        }
        packets_sent_.fetch_add(1, std::memory_order_relaxed);
    }
    return ok();
}

Result<void> UdpTransport::close() {
    if (fd_ < 0) {
        return Error{"Not connected", ErrorCode::Closed};
    }
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) < 0) {
        return Error{"Close failed: " + std::string(strerror(errno)), ErrorCode::Transport};
    }
    return ok();
}

bool UdpTransport::is_connected() const noexcept {
    return fd_ >= 0;
}

std::vector<std::string> UdpTransport::pack_lines(const std::vector<std::string>& lines,
                                                  size_t max_packet_size) {
    std::vector<std::string> packets;
    std::string current;

    for (const auto& l : lines) {
        auto needed = current.empty() ? l.size() : current.size() + 1 + l.size();
        if (!current.empty() && needed > max_packet_size) {
            packets.push_back(std::move(current));
            current.clear();
        }
        if (!current.empty()) current += '\n';
        current += l;
    }
    if (!current.empty()) packets.push_back(std::move(current));
    return packets;
}

// ─────────────────────────────────────────────
// LogTransport
// ─────────────────────────────────────────────

LogTransport::LogTransport(Logger logger, std::string prefix)
    : logger_(std::move(logger)), prefix_(std::move(prefix)) {}

Result<void> LogTransport::send(const Event& event) {
    if (closed_.load()) {
        return Error{"Transport closed", ErrorCode::Closed};
    }
    for (const auto& l : render(event, prefix_)) {
        logger_.info(l);
    }
    return ok();
}

Result<void> LogTransport::close() {
    if (closed_.exchange(true)) {
        return Error{"Transport already closed", ErrorCode::Closed};
    }
    logger_.flush();
    return ok();
}

}  // namespace buffered_statsd
