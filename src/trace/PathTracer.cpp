// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/trace/PathTracer.h"

#include "hoptrace/asn/AsAttributionCache.h"
#include "hoptrace/log/Log.h"
#include "hoptrace/trace/HopProber.h"

#include <utility>

namespace hoptrace {

PathTracer::PathTracer(HostResolver& resolver,
                       asn::AsAttributionCache* cache,
                       ChannelFactory factory)
    : resolver_(resolver), cache_(cache), factory_(std::move(factory)) {}

bool PathTracer::stop_requested(const TraceOptions& opts) const {
    if (opts.should_stop && opts.should_stop()) return true;
    return opts.deadline && Clock::now() >= *opts.deadline;
}

PathResult PathTracer::trace(const std::string& destination, const TraceOptions& opts) {
    PathResult result;
    result.destination = destination;
    result.variant = opts.variant;
    result.started_at = std::chrono::system_clock::now();

    try {
        result.resolved_address = resolver_.resolve(destination);
    } catch (const ResolutionFailure& e) {
        HTLOG_WARN("%s: %s", destination.c_str(), e.what());
        result.terminal_reason = TerminalReason::ResolutionFailed;
        result.error = e.what();
        finalize(result, opts);
        return result;
    }

    HTLOG_INFO("tracing %s (%s) via %s, max %d hops",
               destination.c_str(), result.resolved_address.c_str(),
               to_string(opts.variant), opts.max_hops);

    try {
        ProbeSettings settings;
        settings.variant = opts.variant;
        settings.udp_base_port = opts.udp_base_port;
        settings.payload_size = opts.payload_size;
        std::unique_ptr<ProbeChannel> channel = factory_(settings);

        HopProber prober(*channel, opts.variant);
        for (int hop = 1; !result.sealed(); ++hop) {
            if (stop_requested(opts)) {
                result.terminal_reason = TerminalReason::Cancelled;
                result.error = "cancelled before hop " + std::to_string(hop);
                break;
            }

            result.hops.push_back(prober.probe_hop(result.resolved_address, hop,
                                                   opts.probes_per_hop, opts.timeout));
            const HopRecord& rec = result.hops.back();

            if (rec.resolved && rec.representative_address == result.resolved_address) {
                result.terminal_reason = TerminalReason::DestinationReached;
            } else if (hop >= opts.max_hops) {
                result.terminal_reason = TerminalReason::MaxHopsExceeded;
            }
        }
    } catch (const SendFailure& e) {
        HTLOG_ERROR("%s: send failed after %zu hops: %s",
                    destination.c_str(), result.hops.size(), e.what());
        result.terminal_reason = TerminalReason::SendFailed;
        result.error = e.what();
    }

    finalize(result, opts);
    return result;
}

void PathTracer::finalize(PathResult& result, const TraceOptions& opts) {
    result.success = result.terminal_reason == TerminalReason::DestinationReached;
    result.average_latency_ms = average_latency(result.hops);

    if (cache_ && opts.attribute) {
        for (const auto& hop : result.hops) {
            if (!hop.resolved) continue;
            append_as_label(result.as_path, cache_->attribute(hop.representative_address).label);
        }
    }

    result.finished_at = std::chrono::system_clock::now();
    HTLOG_DEBUG("%s sealed: %s, %zu hops",
                result.destination.c_str(), to_string(*result.terminal_reason), result.hops.size());
}

} // namespace hoptrace
