// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/net/IcmpPacket.h"
#include "hoptrace/probe/ProbeSocket.h"
#include "hoptrace/probe/ReplyClassifier.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using hoptrace::OutcomeKind;
using hoptrace::Probe;
using hoptrace::ProtocolVariant;
using hoptrace::ReplyClassifier;

namespace {

void put_ipv4_header(std::vector<uint8_t>& out, uint8_t proto, const char* src, const char* dst) {
    uint8_t hdr[20] = {0x45, 0, 0, 0, 0, 0, 0, 0, 64, proto, 0, 0};
    inet_pton(AF_INET, src, hdr + 12);
    inet_pton(AF_INET, dst, hdr + 16);
    out.insert(out.end(), hdr, hdr + 20);
}

void put_be16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xff));
}

std::vector<uint8_t> echo_reply(const char* from, uint16_t ident, uint16_t seq) {
    std::vector<uint8_t> pkt;
    put_ipv4_header(pkt, IPPROTO_ICMP, from, "192.0.2.10");
    pkt.push_back(hoptrace::net::kIcmpEchoReply);
    pkt.push_back(0);
    put_be16(pkt, 0);
    put_be16(pkt, ident);
    put_be16(pkt, seq);
    return pkt;
}

// ICMP error from @p from quoting an echo request to @p dst.
std::vector<uint8_t> error_quoting_echo(uint8_t type, uint8_t code, const char* from,
                                        const char* dst, uint16_t ident, uint16_t seq) {
    std::vector<uint8_t> pkt;
    put_ipv4_header(pkt, IPPROTO_ICMP, from, "192.0.2.10");
    pkt.push_back(type);
    pkt.push_back(code);
    pkt.resize(pkt.size() + 6, 0);
    put_ipv4_header(pkt, IPPROTO_ICMP, "192.0.2.10", dst);
    pkt.push_back(hoptrace::net::kIcmpEchoRequest);
    pkt.push_back(0);
    put_be16(pkt, 0);
    put_be16(pkt, ident);
    put_be16(pkt, seq);
    return pkt;
}

// ICMP error from @p from quoting a UDP datagram to @p dst.
std::vector<uint8_t> error_quoting_udp(uint8_t type, uint8_t code, const char* from,
                                       const char* dst, uint16_t sport, uint16_t dport) {
    std::vector<uint8_t> pkt;
    put_ipv4_header(pkt, IPPROTO_ICMP, from, "192.0.2.10");
    pkt.push_back(type);
    pkt.push_back(code);
    pkt.resize(pkt.size() + 6, 0);
    put_ipv4_header(pkt, IPPROTO_UDP, "192.0.2.10", dst);
    put_be16(pkt, sport);
    put_be16(pkt, dport);
    put_be16(pkt, 40);
    put_be16(pkt, 0);
    return pkt;
}

Probe echo_probe(uint16_t ident, uint16_t seq) {
    Probe p;
    p.destination = "93.184.216.34";
    p.hop_limit = 3;
    p.sequence = seq;
    p.variant = ProtocolVariant::IcmpEcho;
    p.icmp_ident = ident;
    p.sent_at = hoptrace::Clock::now();
    return p;
}

Probe udp_probe(uint16_t sport, uint16_t dport) {
    Probe p;
    p.destination = "93.184.216.34";
    p.hop_limit = 2;
    p.sequence = 4;
    p.variant = ProtocolVariant::Udp;
    p.udp_source_port = sport;
    p.udp_dest_port = dport;
    p.sent_at = hoptrace::Clock::now();
    return p;
}

void send_datagram(int fd, const std::vector<uint8_t>& pkt) {
    const ssize_t n = ::send(fd, pkt.data(), pkt.size(), 0);
    assert(n == static_cast<ssize_t>(pkt.size()));
}

} // namespace

int main() {
    // Echo reply with our identifier and sequence: ECHO_REPLY with RTT.
    {
        const auto probe = echo_probe(0x4242, 9);
        const auto pkt = echo_reply("93.184.216.34", 0x4242, 9);
        auto out = ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at + 12ms);
        assert(out);
        assert(out->kind == OutcomeKind::EchoReply);
        assert(*out->responder == "93.184.216.34");
        assert(*out->rtt_ms > 11.9 && *out->rtt_ms < 12.1);
        assert(out->probe.sequence == 9);
    }

    // Echo reply for a different sequence or identifier: ignored.
    {
        const auto probe = echo_probe(0x4242, 9);
        auto pkt = echo_reply("93.184.216.34", 0x4242, 10);
        assert(!ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at + 1ms));
        pkt = echo_reply("93.184.216.34", 0x4343, 9);
        assert(!ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at + 1ms));
    }

    // Time exceeded quoting our echo request: TIME_EXCEEDED from the router.
    {
        const auto probe = echo_probe(0x4242, 9);
        const auto pkt = error_quoting_echo(hoptrace::net::kIcmpTimeExceeded, 0,
                                            "203.0.113.1", "93.184.216.34", 0x4242, 9);
        auto out = ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at + 5ms);
        assert(out);
        assert(out->kind == OutcomeKind::TimeExceeded);
        assert(*out->responder == "203.0.113.1");
        assert(out->icmp_type == hoptrace::net::kIcmpTimeExceeded);
    }

    // Time exceeded for another destination or sequence: uncorrelated.
    {
        const auto probe = echo_probe(0x4242, 9);
        auto pkt = error_quoting_echo(hoptrace::net::kIcmpTimeExceeded, 0,
                                      "203.0.113.1", "198.51.100.99", 0x4242, 9);
        assert(!ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at));
        pkt = error_quoting_echo(hoptrace::net::kIcmpTimeExceeded, 0,
                                 "203.0.113.1", "93.184.216.34", 0x4242, 8);
        assert(!ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at));
    }

    // Port unreachable quoting our UDP probe: DEST_UNREACHABLE.
    {
        const auto probe = udp_probe(50000, 33435);
        const auto pkt = error_quoting_udp(hoptrace::net::kIcmpDestUnreachable, 3,
                                           "93.184.216.34", "93.184.216.34", 50000, 33435);
        auto out = ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at + 30ms);
        assert(out);
        assert(out->kind == OutcomeKind::DestUnreachable);
        assert(out->icmp_code == 3);
        assert(*out->responder == "93.184.216.34");
    }

    // UDP quote with a different port pair belongs to another probe.
    {
        const auto probe = udp_probe(50000, 33435);
        const auto pkt = error_quoting_udp(hoptrace::net::kIcmpTimeExceeded, 0,
                                           "10.0.0.1", "93.184.216.34", 50001, 33435);
        assert(!ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at));
    }

    // An echo reply never answers a UDP probe.
    {
        const auto probe = udp_probe(50000, 33434);
        const auto pkt = echo_reply("93.184.216.34", 0, 4);
        assert(!ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at));
    }

    // Any other ICMP type quoting the probe: OTHER_ICMP.
    {
        const auto probe = echo_probe(7, 1);
        const auto pkt = error_quoting_echo(12 /* parameter problem */, 0,
                                            "198.51.100.7", "93.184.216.34", 7, 1);
        auto out = ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at + 2ms);
        assert(out);
        assert(out->kind == OutcomeKind::OtherIcmp);
    }

    // Our own echo request looped back on the raw socket is not a reply.
    {
        const auto probe = echo_probe(7, 1);
        auto pkt = echo_reply("127.0.0.1", 7, 1);
        pkt[20] = hoptrace::net::kIcmpEchoRequest;
        assert(!ReplyClassifier::classify(pkt.data(), pkt.size(), probe, probe.sent_at));
    }

    // Garbage is dropped.
    {
        const auto probe = echo_probe(7, 1);
        const uint8_t junk[6] = {1, 2, 3, 4, 5, 6};
        assert(!ReplyClassifier::classify(junk, sizeof(junk), probe, probe.sent_at));
    }

    // Nothing arrives: TIMEOUT once the per-probe deadline passes.
    {
        int sv[2];
        assert(::socketpair(AF_UNIX, SOCK_DGRAM, 0, sv) == 0);
        hoptrace::ProbeSocket sock(ProtocolVariant::IcmpEcho, sv[0]);
        ReplyClassifier classifier(sock);

        const auto probe = echo_probe(0x5151, 1);
        const auto out = classifier.await_reply(probe, 80ms);
        const auto waited = hoptrace::Clock::now() - probe.sent_at;
        assert(out.timed_out());
        assert(!out.responder && !out.rtt_ms);
        assert(waited >= 80ms);
        assert(waited < 1080ms);
        ::close(sv[1]);
    }

    // Junk and other probes' replies are skipped until ours shows up.
    {
        int sv[2];
        assert(::socketpair(AF_UNIX, SOCK_DGRAM, 0, sv) == 0);
        hoptrace::ProbeSocket sock(ProtocolVariant::IcmpEcho, sv[0]);
        ReplyClassifier classifier(sock);

        const auto probe = echo_probe(0x5151, 2);
        send_datagram(sv[1], {1, 2, 3, 4, 5, 6});
        send_datagram(sv[1], error_quoting_echo(hoptrace::net::kIcmpTimeExceeded, 0,
                                                "203.0.113.1", "93.184.216.34", 0x5151, 1));
        send_datagram(sv[1], error_quoting_echo(hoptrace::net::kIcmpTimeExceeded, 0,
                                                "203.0.113.9", "93.184.216.34", 0x5151, 2));

        const auto out = classifier.await_reply(probe, 2000ms);
        assert(out.kind == OutcomeKind::TimeExceeded);
        assert(*out.responder == "203.0.113.9");
        assert(*out.rtt_ms < 1000.0);
        ::close(sv[1]);
    }

    // A reply arriving mid-wait wakes the poll loop; RTT covers the delay.
    {
        int sv[2];
        assert(::socketpair(AF_UNIX, SOCK_DGRAM, 0, sv) == 0);
        hoptrace::ProbeSocket sock(ProtocolVariant::IcmpEcho, sv[0]);
        ReplyClassifier classifier(sock);

        const auto probe = echo_probe(0x5151, 3);
        const int peer = sv[1];
        std::thread late([peer]() {
            std::this_thread::sleep_for(30ms);
            send_datagram(peer, echo_reply("93.184.216.34", 0x5151, 3));
        });
        const auto out = classifier.await_reply(probe, 2000ms);
        late.join();
        assert(out.kind == OutcomeKind::EchoReply);
        assert(*out.rtt_ms >= 30.0);
        assert(*out.rtt_ms < 2000.0);
        ::close(sv[1]);
    }

    return 0;
}
