// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/net/IcmpPacket.h"
#include "hoptrace/net/Ipv4.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cassert>
#include <cstdint>
#include <vector>

namespace {

void put_ipv4_header(std::vector<uint8_t>& out, uint8_t proto, const char* src, const char* dst) {
    uint8_t hdr[20] = {0x45, 0, 0, 0, 0, 0, 0, 0, 64, proto, 0, 0};
    inet_pton(AF_INET, src, hdr + 12);
    inet_pton(AF_INET, dst, hdr + 16);
    out.insert(out.end(), hdr, hdr + 20);
}

} // namespace

int main() {
    using namespace hoptrace::net;

    // Echo request layout: type 8, ident/sequence big-endian, valid checksum.
    {
        auto pkt = build_echo_request(0x1234, 7, 32);
        assert(pkt.size() == kIcmpHeaderLen + 32);
        assert(pkt[0] == kIcmpEchoRequest);
        assert(pkt[4] == 0x12 && pkt[5] == 0x34);
        assert(pkt[6] == 0x00 && pkt[7] == 0x07);
        // Checksumming a packet that already carries its checksum yields zero.
        assert(internet_checksum(pkt.data(), pkt.size()) == 0);
    }

    // Payload smaller than the embedded sequence is widened.
    {
        auto pkt = build_echo_request(1, 2, 0);
        assert(pkt.size() == kIcmpHeaderLen + 2);
    }

    // Echo reply decodes ident/sequence and the responder.
    {
        std::vector<uint8_t> pkt;
        put_ipv4_header(pkt, IPPROTO_ICMP, "93.184.216.34", "192.0.2.10");
        uint8_t icmp[8] = {kIcmpEchoReply, 0, 0, 0, 0xab, 0xcd, 0x00, 0x05};
        pkt.insert(pkt.end(), icmp, icmp + 8);

        IcmpView view;
        assert(IcmpParser::decode(pkt.data(), pkt.size(), view));
        assert(view.type == kIcmpEchoReply);
        assert(view.echo_ident == 0xabcd);
        assert(view.echo_sequence == 5);
        assert(network_to_string(view.source_be) == "93.184.216.34");
        assert(!view.has_quoted);
    }

    // Time exceeded quoting a UDP probe exposes the quoted ports and destination.
    {
        std::vector<uint8_t> pkt;
        put_ipv4_header(pkt, IPPROTO_ICMP, "203.0.113.1", "192.0.2.10");
        uint8_t icmp[8] = {kIcmpTimeExceeded, 0, 0, 0, 0, 0, 0, 0};
        pkt.insert(pkt.end(), icmp, icmp + 8);
        put_ipv4_header(pkt, IPPROTO_UDP, "192.0.2.10", "93.184.216.34");
        uint8_t udp[8] = {0xc3, 0x50, 0x82, 0x9b, 0, 40, 0, 0}; // 50000 -> 33435
        pkt.insert(pkt.end(), udp, udp + 8);

        IcmpView view;
        assert(IcmpParser::decode(pkt.data(), pkt.size(), view));
        assert(view.type == kIcmpTimeExceeded);
        assert(view.has_quoted && view.has_quoted_transport);
        assert(view.quoted_protocol == IPPROTO_UDP);
        assert(network_to_string(view.quoted_destination_be) == "93.184.216.34");
        assert(view.quoted_udp_source_port == 50000);
        assert(view.quoted_udp_dest_port == 33435);
    }

    // A quote cut short after the inner IP header still decodes, without transport.
    {
        std::vector<uint8_t> pkt;
        put_ipv4_header(pkt, IPPROTO_ICMP, "203.0.113.1", "192.0.2.10");
        uint8_t icmp[8] = {kIcmpDestUnreachable, 3, 0, 0, 0, 0, 0, 0};
        pkt.insert(pkt.end(), icmp, icmp + 8);
        put_ipv4_header(pkt, IPPROTO_UDP, "192.0.2.10", "93.184.216.34");
        pkt.push_back(0xc3);

        IcmpView view;
        assert(IcmpParser::decode(pkt.data(), pkt.size(), view));
        assert(view.has_quoted);
        assert(!view.has_quoted_transport);
    }

    // Not IPv4, not ICMP, or a truncated ICMP header: rejected.
    {
        std::vector<uint8_t> pkt;
        put_ipv4_header(pkt, IPPROTO_UDP, "203.0.113.1", "192.0.2.10");
        pkt.resize(pkt.size() + 8, 0);
        IcmpView view;
        assert(!IcmpParser::decode(pkt.data(), pkt.size(), view));

        pkt[9] = IPPROTO_ICMP;
        pkt[0] = 0x65; // version 6
        assert(!IcmpParser::decode(pkt.data(), pkt.size(), view));

        pkt[0] = 0x45;
        assert(!IcmpParser::decode(pkt.data(), 24, view));
        assert(!IcmpParser::decode(nullptr, 0, view));
    }

    // Private range checks.
    assert(is_private_ipv4("10.0.0.1"));
    assert(is_private_ipv4("172.16.5.4"));
    assert(is_private_ipv4("172.31.255.255"));
    assert(is_private_ipv4("192.168.1.1"));
    assert(!is_private_ipv4("172.32.0.1"));
    assert(!is_private_ipv4("8.8.8.8"));
    assert(!is_private_ipv4("not-an-address"));

    return 0;
}
