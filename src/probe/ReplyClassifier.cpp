// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/probe/ReplyClassifier.h"

#include "hoptrace/log/Log.h"
#include "hoptrace/net/IcmpPacket.h"
#include "hoptrace/net/Ipv4.h"

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace hoptrace {

namespace {

// Does the datagram quoted inside an ICMP error belong to this probe?
bool quotes_probe(const net::IcmpView& view, const Probe& probe) {
    if (!view.has_quoted || !view.has_quoted_transport) return false;

    if (net::network_to_string(view.quoted_destination_be) != probe.destination) {
        return false;
    }

    if (probe.variant == ProtocolVariant::IcmpEcho) {
        return view.quoted_protocol == IPPROTO_ICMP &&
               view.quoted_icmp_type == net::kIcmpEchoRequest &&
               view.quoted_icmp_ident == probe.icmp_ident &&
               view.quoted_icmp_sequence == probe.sequence;
    }
    return view.quoted_protocol == IPPROTO_UDP &&
           view.quoted_udp_source_port == probe.udp_source_port &&
           view.quoted_udp_dest_port == probe.udp_dest_port;
}

double elapsed_ms(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

ReplyClassifier::ReplyClassifier(ProbeSocket& socket) : socket_(socket) {}

std::optional<ProbeOutcome> ReplyClassifier::classify(const uint8_t* packet,
                                                      std::size_t length,
                                                      const Probe& probe,
                                                      Clock::time_point arrival) {
    net::IcmpView view;
    if (!net::IcmpParser::decode(packet, length, view)) {
        return std::nullopt;
    }

    const std::string responder = net::network_to_string(view.source_be);
    const double rtt = elapsed_ms(probe.sent_at, arrival);

    if (view.type == net::kIcmpEchoReply) {
        if (probe.variant != ProtocolVariant::IcmpEcho ||
            view.echo_ident != probe.icmp_ident ||
            view.echo_sequence != probe.sequence) {
            return std::nullopt;
        }
        return ProbeOutcome::reply(probe, OutcomeKind::EchoReply, responder, rtt, view.type, view.code);
    }

    if (view.type == net::kIcmpEchoRequest || !quotes_probe(view, probe)) {
        return std::nullopt;
    }

    OutcomeKind kind = OutcomeKind::OtherIcmp;
    if (view.type == net::kIcmpTimeExceeded) {
        kind = OutcomeKind::TimeExceeded;
    } else if (view.type == net::kIcmpDestUnreachable) {
        kind = OutcomeKind::DestUnreachable;
    }
    return ProbeOutcome::reply(probe, kind, responder, rtt, view.type, view.code);
}

ProbeOutcome ReplyClassifier::await_reply(const Probe& probe, std::chrono::milliseconds timeout) {
    const auto deadline = probe.sent_at + timeout;
    std::array<uint8_t, 1500> buf{};

    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            return ProbeOutcome::timeout(probe);
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd pfd{};
        pfd.fd = socket_.icmp_fd();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()) + 1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            HTLOG_WARN("poll on ICMP socket failed: %s", std::strerror(errno));
            return ProbeOutcome::timeout(probe);
        }
        if (rc == 0) continue;

        const ssize_t n = ::recv(socket_.icmp_fd(), buf.data(), buf.size(), MSG_DONTWAIT);
        const auto arrival = Clock::now();
        if (n <= 0) continue;

        if (auto outcome = classify(buf.data(), static_cast<std::size_t>(n), probe, arrival)) {
            HTLOG_DEBUG("reply seq=%u kind=%s from=%s rtt=%.3fms",
                        static_cast<unsigned>(probe.sequence), to_string(outcome->kind),
                        outcome->responder->c_str(), *outcome->rtt_ms);
            return *outcome;
        }
        HTLOG_TRACE("discarded uncorrelated ICMP datagram (%zd bytes)", n);
    }
}

} // namespace hoptrace
