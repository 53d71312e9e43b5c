// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/trace/PathResult.h"

#include <string>

namespace hoptrace {

/// "traceroute to <dest> (<addr>), <max> hops max, <variant>"
std::string format_header(const std::string& destination,
                          const std::string& address,
                          int max_hops,
                          ProtocolVariant variant);

/**
 * @brief One operator-facing hop line.
 *
 * Hop limit right-justified in two columns, then one segment per probe:
 * " *" for a timeout, " <addr> (<rtt> ms)" otherwise (rtt with three decimals).
 */
std::string format_hop_line(const HopRecord& hop);

/// Multi-line trailer: result, AS path joined with " -> ", average latency.
std::string format_summary(const PathResult& result);

} // namespace hoptrace
