// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hoptrace::net {

inline constexpr uint8_t kIcmpEchoReply = 0;
inline constexpr uint8_t kIcmpDestUnreachable = 3;
inline constexpr uint8_t kIcmpEchoRequest = 8;
inline constexpr uint8_t kIcmpTimeExceeded = 11;

inline constexpr std::size_t kIcmpHeaderLen = 8;
inline constexpr std::size_t kUdpHeaderLen = 8;

/**
 * @brief Decoded view of one ICMPv4 message as read from a raw ICMP socket.
 *
 * Addresses are kept in network byte order exactly as they appear on the
 * wire. For error messages (Time Exceeded, Destination Unreachable, ...) the
 * quoted_* fields describe the original datagram embedded in the payload.
 */
struct IcmpView {
    uint32_t source_be = 0;     ///< Outer IP source, i.e. the responder.
    uint8_t  type = 0;
    uint8_t  code = 0;

    // Echo Reply / Echo Request fields.
    uint16_t echo_ident = 0;
    uint16_t echo_sequence = 0;

    // Original datagram quoted inside an ICMP error.
    bool     has_quoted = false;
    uint8_t  quoted_protocol = 0;
    uint32_t quoted_destination_be = 0;
    bool     has_quoted_transport = false; ///< First 8 transport bytes present.
    uint8_t  quoted_icmp_type = 0;
    uint16_t quoted_icmp_ident = 0;
    uint16_t quoted_icmp_sequence = 0;
    uint16_t quoted_udp_source_port = 0;
    uint16_t quoted_udp_dest_port = 0;
};

/// RFC 1071 Internet checksum (result in network byte order as a raw u16).
uint16_t internet_checksum(const uint8_t* data, std::size_t len);

/**
 * @brief Build an ICMP Echo Request with a checksummed header.
 *
 * The payload starts with the big-endian sequence number and is padded with
 * a fixed byte pattern up to @p payload_size bytes.
 */
std::vector<uint8_t> build_echo_request(uint16_t ident, uint16_t sequence, std::size_t payload_size);

/**
 * @brief Stateless decoder for IPv4 datagrams carrying ICMP.
 *
 * Raw ICMP sockets on Linux deliver the full IPv4 header followed by the ICMP
 * message; decode() walks both and, for error messages, the quoted original
 * IPv4 header plus the first 8 bytes of its transport header.
 */
class IcmpParser {
public:
    /**
     * @return true if @p packet holds a well-formed IPv4/ICMP datagram.
     *         Truncated quotes still decode; has_quoted / has_quoted_transport
     *         tell the caller how much of the original probe is visible.
     */
    static bool decode(const uint8_t* packet, std::size_t length, IcmpView& out);
};

} // namespace hoptrace::net
