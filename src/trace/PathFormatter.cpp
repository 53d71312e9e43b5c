// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/trace/PathFormatter.h"

#include <cstdio>

namespace hoptrace {

std::string format_header(const std::string& destination,
                          const std::string& address,
                          int max_hops,
                          ProtocolVariant variant) {
    return "traceroute to " + destination + " (" + address + "), " +
           std::to_string(max_hops) + " hops max, " + to_string(variant);
}

std::string format_hop_line(const HopRecord& hop) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%2d", hop.hop_limit);
    std::string line = buf;
    for (const auto& o : hop.outcomes) {
        if (o.timed_out()) {
            line += " *";
            continue;
        }
        std::snprintf(buf, sizeof(buf), " (%.3f ms)", *o.rtt_ms);
        line += " " + *o.responder + buf;
    }
    return line;
}

std::string format_summary(const PathResult& result) {
    std::string out = "result: ";
    out += result.terminal_reason ? to_string(*result.terminal_reason) : "UNSEALED";
    if (!result.error.empty()) {
        out += " (" + result.error + ")";
    }
    out += "\n";

    if (!result.as_path.empty()) {
        out += "AS path: ";
        for (std::size_t i = 0; i < result.as_path.size(); ++i) {
            if (i) out += " -> ";
            out += result.as_path[i];
        }
        out += "\n";
    }

    if (result.average_latency_ms) {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "average latency: %.3f ms\n", *result.average_latency_ms);
        out += buf;
    } else {
        out += "average latency: n/a\n";
    }
    return out;
}

} // namespace hoptrace
