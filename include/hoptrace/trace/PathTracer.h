// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/probe/ProbeChannel.h"
#include "hoptrace/trace/HostResolver.h"
#include "hoptrace/trace/PathResult.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace hoptrace {

namespace asn {
class AsAttributionCache;
}

/**
 * @brief Per-trace knobs. Passed by value into every trace; nothing here is
 * process-wide.
 */
struct TraceOptions {
    ProtocolVariant variant{ProtocolVariant::IcmpEcho};
    int max_hops = 30;
    int probes_per_hop = 3;
    std::chrono::milliseconds timeout{2000};
    uint16_t udp_base_port = 33434;
    std::size_t payload_size = 32;
    bool attribute = true;

    /// Polled before each hop; returning true ends the trace as CANCELLED.
    std::function<bool()> should_stop{};
    /// Wall deadline for the whole trace, checked at the same points.
    std::optional<Clock::time_point> deadline{};
};

using ChannelFactory = std::function<std::unique_ptr<ProbeChannel>(const ProbeSettings&)>;

/**
 * @brief Drives the Hop Prober across increasing hop limits.
 *
 * State machine: PROBING(1) -> ... -> DONE(reason). Resolution failure skips
 * probing entirely; a SendFailure ends the trace keeping the hops already
 * sealed. AS attribution happens after the probing loop, so a slow registry
 * never stretches the time between hops.
 */
class PathTracer {
public:
    /**
     * @param resolver Forward lookup used once per trace.
     * @param cache    Shared attribution cache; nullptr disables AS paths.
     * @param factory  Opens the transport for one trace.
     */
    PathTracer(HostResolver& resolver,
               asn::AsAttributionCache* cache,
               ChannelFactory factory = make_raw_probe_channel);

    /// Never throws for per-destination failures; they end up in terminal_reason.
    PathResult trace(const std::string& destination, const TraceOptions& opts);

private:
    bool stop_requested(const TraceOptions& opts) const;
    void finalize(PathResult& result, const TraceOptions& opts);

    HostResolver& resolver_;
    asn::AsAttributionCache* cache_;
    ChannelFactory factory_;
};

} // namespace hoptrace
