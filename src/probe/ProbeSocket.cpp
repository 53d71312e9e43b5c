// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/probe/ProbeSocket.h"

#include "hoptrace/log/Log.h"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace hoptrace {

namespace {

std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

ProbeSocket::ProbeSocket(ProtocolVariant variant) : variant_(variant) {
    icmp_fd_ = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (icmp_fd_ < 0) {
        throw SendFailure(errno_text("raw ICMP socket (need root or CAP_NET_RAW)"));
    }
    HTLOG_TRACE("opened raw ICMP socket fd=%d variant=%s", icmp_fd_, to_string(variant_));
}

ProbeSocket::ProbeSocket(ProtocolVariant variant, int icmp_fd)
    : variant_(variant), icmp_fd_(icmp_fd) {}

ProbeSocket::~ProbeSocket() {
    for (int fd : udp_fds_) {
        ::close(fd);
    }
    udp_fds_.clear();
    if (icmp_fd_ >= 0) {
        ::close(icmp_fd_);
        icmp_fd_ = -1;
    }
}

void ProbeSocket::set_ttl(int fd, int ttl) {
    if (::setsockopt(fd, IPPROTO_IP, IP_TTL, &ttl, sizeof(ttl)) != 0) {
        throw SendFailure(errno_text("setsockopt(IP_TTL)"));
    }
}

void ProbeSocket::send_echo(const sockaddr_in& dst, int ttl, const std::vector<uint8_t>& packet,
                            Clock::time_point& sent_at) {
    set_ttl(icmp_fd_, ttl);
    sent_at = Clock::now();
    const ssize_t rc = ::sendto(icmp_fd_, packet.data(), packet.size(), 0,
                                reinterpret_cast<const sockaddr*>(&dst), sizeof(dst));
    if (rc < 0 || static_cast<std::size_t>(rc) != packet.size()) {
        throw SendFailure(errno_text("sendto(ICMP echo)"));
    }
}

uint16_t ProbeSocket::send_udp(const sockaddr_in& dst, int ttl, uint16_t dest_port, std::size_t payload_size,
                               Clock::time_point& sent_at) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        throw SendFailure(errno_text("UDP socket"));
    }
    udp_fds_.push_back(fd);

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = 0;
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
        throw SendFailure(errno_text("bind(UDP)"));
    }
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        throw SendFailure(errno_text("getsockname(UDP)"));
    }

    set_ttl(fd, ttl);

    sockaddr_in to = dst;
    to.sin_port = htons(dest_port);
    std::vector<uint8_t> payload(payload_size, 0x40);
    sent_at = Clock::now();
    const ssize_t rc = ::sendto(fd, payload.data(), payload.size(), 0,
                                reinterpret_cast<const sockaddr*>(&to), sizeof(to));
    if (rc < 0) {
        throw SendFailure(errno_text("sendto(UDP)"));
    }
    return ntohs(local.sin_port);
}

} // namespace hoptrace
