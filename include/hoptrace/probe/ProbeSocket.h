// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/probe/Probe.h"

#include <cstddef>
#include <cstdint>
#include <vector>

#include <netinet/in.h>

namespace hoptrace {

/**
 * @brief Owner of every file descriptor a single trace uses.
 *
 *  - one raw ICMP socket, used to send echo requests and to receive all
 *    replies and ICMP errors;
 *  - for the UDP variant, one datagram socket per probe. Each is bound to a
 *    kernel-chosen port that stays reserved until the trace ends, so the
 *    source port quoted back in an ICMP error identifies the probe.
 *
 * All descriptors are closed in the destructor.
 */
class ProbeSocket {
public:
    /// @throws SendFailure when the raw ICMP socket cannot be created.
    explicit ProbeSocket(ProtocolVariant variant);

    /// Take ownership of an open descriptor that delivers IPv4+ICMP datagrams.
    ProbeSocket(ProtocolVariant variant, int icmp_fd);
    ~ProbeSocket();

    ProbeSocket(const ProbeSocket&) = delete;
    ProbeSocket& operator=(const ProbeSocket&) = delete;

    int icmp_fd() const { return icmp_fd_; }
    ProtocolVariant variant() const { return variant_; }

    /**
     * @brief Send one echo request. @p sent_at is stamped right before sendto.
     * @throws SendFailure on setsockopt/sendto failure.
     */
    void send_echo(const sockaddr_in& dst, int ttl, const std::vector<uint8_t>& packet,
                   Clock::time_point& sent_at);

    /**
     * @brief Send one UDP datagram from a fresh socket.
     *
     * Socket setup happens before @p sent_at is stamped, so it is not
     * counted in the probe's round trip.
     * @return The source port the kernel assigned.
     * @throws SendFailure on socket/bind/sendto failure.
     */
    uint16_t send_udp(const sockaddr_in& dst, int ttl, uint16_t dest_port, std::size_t payload_size,
                      Clock::time_point& sent_at);

private:
    static void set_ttl(int fd, int ttl);

    ProtocolVariant variant_;
    int icmp_fd_ = -1;
    std::vector<int> udp_fds_;
};

} // namespace hoptrace
