// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/probe/ProbeSender.h"

#include "hoptrace/log/Log.h"
#include "hoptrace/net/IcmpPacket.h"
#include "hoptrace/net/Ipv4.h"

#include <arpa/inet.h>
#include <unistd.h>

#include <atomic>

namespace hoptrace {

ProbeSender::ProbeSender(ProbeSocket& socket, uint16_t udp_base_port, std::size_t payload_size)
    : socket_(socket),
      udp_base_port_(udp_base_port),
      payload_size_(payload_size),
      ident_(next_ident()) {}

uint16_t ProbeSender::next_ident() {
    static std::atomic<uint16_t> counter{0};
    const auto pid = static_cast<uint16_t>(::getpid() & 0xffff);
    return static_cast<uint16_t>(pid ^ static_cast<uint16_t>(counter.fetch_add(1) * 0x9e37u));
}

Probe ProbeSender::send(const std::string& destination,
                        int hop_limit,
                        uint16_t sequence,
                        ProtocolVariant variant,
                        int attempt) {
    const auto dst_host = net::parse_ipv4_host(destination);
    if (!dst_host) {
        throw SendFailure("invalid destination address: " + destination);
    }
    if (hop_limit < 1 || hop_limit > 255) {
        throw SendFailure("hop limit out of range: " + std::to_string(hop_limit));
    }

    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_addr.s_addr = htonl(*dst_host);

    Probe probe;
    probe.destination = destination;
    probe.hop_limit = hop_limit;
    probe.sequence = sequence;
    probe.attempt = attempt;
    probe.variant = variant;

    if (variant == ProtocolVariant::IcmpEcho) {
        probe.icmp_ident = ident_;
        const auto packet = net::build_echo_request(ident_, sequence, payload_size_);
        socket_.send_echo(dst, hop_limit, packet, probe.sent_at);
    } else {
        const int port = static_cast<int>(udp_base_port_) + attempt;
        if (port > 65535) {
            throw SendFailure("UDP destination port out of range: " + std::to_string(port));
        }
        probe.udp_dest_port = static_cast<uint16_t>(port);
        probe.udp_source_port = socket_.send_udp(dst, hop_limit, probe.udp_dest_port, payload_size_,
                                                 probe.sent_at);
    }

    HTLOG_DEBUG("probe sent dst=%s ttl=%d seq=%u attempt=%d proto=%s",
                destination.c_str(), hop_limit, static_cast<unsigned>(sequence), attempt,
                to_string(variant));
    return probe;
}

} // namespace hoptrace
