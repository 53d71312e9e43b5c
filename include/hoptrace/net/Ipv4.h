// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hoptrace::net {

/// Parse a dotted-decimal IPv4 string into host-order integer form.
std::optional<uint32_t> parse_ipv4_host(const std::string& text);

/// Render a host-order IPv4 address as dotted decimal.
std::string host_to_string(uint32_t host);

/// Render a network-order (s_addr) IPv4 address as dotted decimal.
std::string network_to_string(uint32_t be_addr);

/// Produce a standard CIDR mask given the number of prefix bits.
uint32_t mask_from_bits(int bits);

/**
 * @brief True for RFC1918 space: 10.0.0.0/8, 172.16.0.0/12, 192.168.0.0/16.
 *
 * Text that is not a valid IPv4 literal is never private.
 */
bool is_private_ipv4(const std::string& text);

} // namespace hoptrace::net
