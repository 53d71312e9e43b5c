// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/trace/PathResult.h"

namespace hoptrace {

HopRecord HopRecord::from_outcomes(int hop_limit, std::vector<ProbeOutcome> outcomes) {
    HopRecord rec;
    rec.hop_limit = hop_limit;
    rec.outcomes = std::move(outcomes);
    for (const auto& o : rec.outcomes) {
        if (o.timed_out()) continue;
        rec.resolved = true;
        rec.representative_address = *o.responder;
        rec.representative_latency_ms = o.rtt_ms;
        break;
    }
    return rec;
}

const char* to_string(TerminalReason reason) {
    switch (reason) {
        case TerminalReason::DestinationReached: return "DESTINATION_REACHED";
        case TerminalReason::MaxHopsExceeded:    return "MAX_HOPS_EXCEEDED";
        case TerminalReason::ResolutionFailed:   return "RESOLUTION_FAILED";
        case TerminalReason::SendFailed:         return "SEND_FAILED";
        case TerminalReason::Cancelled:          return "CANCELLED";
    }
    return "?";
}

std::vector<std::string> PathResult::hop_addresses() const {
    std::vector<std::string> out;
    out.reserve(hops.size());
    for (const auto& hop : hops) {
        out.push_back(hop.representative_address);
    }
    return out;
}

std::optional<double> average_latency(const std::vector<HopRecord>& hops) {
    double sum = 0.0;
    std::size_t count = 0;
    for (const auto& hop : hops) {
        if (!hop.representative_latency_ms) continue;
        sum += *hop.representative_latency_ms;
        ++count;
    }
    if (count == 0) return std::nullopt;
    return sum / static_cast<double>(count);
}

void append_as_label(std::vector<std::string>& as_path, const std::string& label) {
    if (as_path.empty() || as_path.back() != label) {
        as_path.push_back(label);
    }
}

} // namespace hoptrace
