// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/net/IcmpPacket.h"

#include <netinet/in.h>

#include <cstring>

namespace hoptrace::net {

namespace {

inline uint16_t load_be16(const uint8_t* p) noexcept {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t load_raw32(const uint8_t* p) noexcept {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

// Validate an IPv4 header at p and return its length in bytes, or 0.
std::size_t ipv4_header_len(const uint8_t* p, std::size_t avail) noexcept {
    if (avail < 20) return 0;
    if ((p[0] >> 4) != 4) return 0;
    const std::size_t ihl = static_cast<std::size_t>(p[0] & 0x0F) * 4;
    if (ihl < 20 || ihl > avail) return 0;
    return ihl;
}

} // namespace

uint16_t internet_checksum(const uint8_t* data, std::size_t len) {
    uint32_t sum = 0;
    std::size_t i = 0;
    for (; i + 1 < len; i += 2) {
        uint16_t word;
        std::memcpy(&word, data + i, sizeof(word));
        sum += word;
    }
    if (i < len) {
        uint16_t last = 0;
        std::memcpy(&last, data + i, 1);
        sum += last;
    }
    while (sum >> 16) sum = (sum & 0xFFFF) + (sum >> 16);
    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> build_echo_request(uint16_t ident, uint16_t sequence, std::size_t payload_size) {
    if (payload_size < 2) payload_size = 2;
    std::vector<uint8_t> pkt(kIcmpHeaderLen + payload_size, 0);

    pkt[0] = kIcmpEchoRequest;
    pkt[1] = 0;
    pkt[4] = static_cast<uint8_t>(ident >> 8);
    pkt[5] = static_cast<uint8_t>(ident & 0xff);
    pkt[6] = static_cast<uint8_t>(sequence >> 8);
    pkt[7] = static_cast<uint8_t>(sequence & 0xff);

    pkt[8] = pkt[6];
    pkt[9] = pkt[7];
    for (std::size_t i = 10; i < pkt.size(); ++i) {
        pkt[i] = static_cast<uint8_t>(0x40 + (i % 32));
    }

    const uint16_t sum = internet_checksum(pkt.data(), pkt.size());
    std::memcpy(pkt.data() + 2, &sum, sizeof(sum));
    return pkt;
}

bool IcmpParser::decode(const uint8_t* packet, std::size_t length, IcmpView& out) {
    if (!packet) return false;
    out = IcmpView{};

    // ---------------------------------------------------------------------
    // 1. Outer IPv4 header.
    // ---------------------------------------------------------------------
    const std::size_t outer_len = ipv4_header_len(packet, length);
    if (outer_len == 0) return false;
    if (packet[9] != IPPROTO_ICMP) return false;
    out.source_be = load_raw32(packet + 12);

    // ---------------------------------------------------------------------
    // 2. ICMP header.
    // ---------------------------------------------------------------------
    const uint8_t* icmp = packet + outer_len;
    const std::size_t icmp_len = length - outer_len;
    if (icmp_len < kIcmpHeaderLen) return false;

    out.type = icmp[0];
    out.code = icmp[1];

    if (out.type == kIcmpEchoReply || out.type == kIcmpEchoRequest) {
        out.echo_ident = load_be16(icmp + 4);
        out.echo_sequence = load_be16(icmp + 6);
        return true;
    }

    // ---------------------------------------------------------------------
    // 3. Quoted original datagram (errors only).
    // ---------------------------------------------------------------------
    const uint8_t* inner = icmp + kIcmpHeaderLen;
    const std::size_t inner_avail = icmp_len - kIcmpHeaderLen;
    const std::size_t inner_len = ipv4_header_len(inner, inner_avail);
    if (inner_len == 0) return true;

    out.has_quoted = true;
    out.quoted_protocol = inner[9];
    out.quoted_destination_be = load_raw32(inner + 16);

    const uint8_t* transport = inner + inner_len;
    if (inner_avail - inner_len < 8) return true;
    out.has_quoted_transport = true;

    if (out.quoted_protocol == IPPROTO_ICMP) {
        out.quoted_icmp_type = transport[0];
        out.quoted_icmp_ident = load_be16(transport + 4);
        out.quoted_icmp_sequence = load_be16(transport + 6);
    } else if (out.quoted_protocol == IPPROTO_UDP) {
        out.quoted_udp_source_port = load_be16(transport);
        out.quoted_udp_dest_port = load_be16(transport + 2);
    }
    return true;
}

} // namespace hoptrace::net
