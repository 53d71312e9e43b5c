// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/net/Ipv4.h"

#include <arpa/inet.h>

#include <sstream>

namespace hoptrace::net {

std::optional<uint32_t> parse_ipv4_host(const std::string& text) {
    if (text.empty()) return std::nullopt;
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return std::nullopt;
    return ntohl(addr.s_addr);
}

std::string host_to_string(uint32_t host) {
    std::ostringstream out;
    out << ((host >> 24) & 0xff) << '.'
        << ((host >> 16) & 0xff) << '.'
        << ((host >> 8) & 0xff) << '.'
        << (host & 0xff);
    return out.str();
}

std::string network_to_string(uint32_t be_addr) {
    return host_to_string(ntohl(be_addr));
}

uint32_t mask_from_bits(int bits) {
    if (bits <= 0) return 0;
    if (bits >= 32) return 0xFFFFFFFFu;
    return 0xFFFFFFFFu << (32 - bits);
}

bool is_private_ipv4(const std::string& text) {
    const auto host = parse_ipv4_host(text);
    if (!host) return false;
    const uint32_t x = *host;
    if ((x & mask_from_bits(8)) == 0x0A000000u) return true;   // 10.0.0.0/8
    if ((x & mask_from_bits(12)) == 0xAC100000u) return true;  // 172.16.0.0/12
    if ((x & mask_from_bits(16)) == 0xC0A80000u) return true;  // 192.168.0.0/16
    return false;
}

} // namespace hoptrace::net
