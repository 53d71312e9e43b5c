// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/trace/PathFormatter.h"

#include <cassert>
#include <string>
#include <vector>

namespace {

hoptrace::ProbeOutcome reply(const std::string& addr, double rtt) {
    hoptrace::Probe p;
    return hoptrace::ProbeOutcome::reply(p, hoptrace::OutcomeKind::TimeExceeded, addr, rtt);
}

hoptrace::ProbeOutcome lost() {
    return hoptrace::ProbeOutcome::timeout(hoptrace::Probe{});
}

} // namespace

int main() {
    // Mixed hop: right-justified index, one segment per probe.
    {
        auto rec = hoptrace::HopRecord::from_outcomes(
            3, {reply("198.51.100.7", 12.3456), lost(), reply("198.51.100.7", 11.0)});
        assert(hoptrace::format_hop_line(rec) ==
               " 3 198.51.100.7 (12.346 ms) * 198.51.100.7 (11.000 ms)");
    }

    // Silent hop prints asterisks only.
    {
        auto rec = hoptrace::HopRecord::from_outcomes(12, {lost(), lost(), lost()});
        assert(hoptrace::format_hop_line(rec) == "12 * * *");
    }

    assert(hoptrace::format_header("example.com", "93.184.216.34", 30, hoptrace::ProtocolVariant::Udp) ==
           "traceroute to example.com (93.184.216.34), 30 hops max, udp");

    // Summary with AS path and latency.
    {
        hoptrace::PathResult r;
        r.terminal_reason = hoptrace::TerminalReason::DestinationReached;
        r.as_path = {"Private", "TRANSIT-A", "EDGECAST"};
        r.average_latency_ms = 7.0;
        const auto s = hoptrace::format_summary(r);
        assert(s.find("result: DESTINATION_REACHED\n") == 0);
        assert(s.find("AS path: Private -> TRANSIT-A -> EDGECAST\n") != std::string::npos);
        assert(s.find("average latency: 7.000 ms") != std::string::npos);
    }

    // Failure summary carries the error; no latency is reported as n/a.
    {
        hoptrace::PathResult r;
        r.terminal_reason = hoptrace::TerminalReason::ResolutionFailed;
        r.error = "could not resolve nonexistent.invalid";
        const auto s = hoptrace::format_summary(r);
        assert(s.find("RESOLUTION_FAILED (could not resolve nonexistent.invalid)") != std::string::npos);
        assert(s.find("AS path") == std::string::npos);
        assert(s.find("average latency: n/a") != std::string::npos);
    }

    return 0;
}
