// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/probe/ProbeChannel.h"
#include "hoptrace/trace/PathResult.h"

#include <chrono>
#include <cstdint>
#include <string>

namespace hoptrace {

/**
 * @brief Issues every probe for one hop limit and seals the Hop Record.
 *
 * Probes go out one after another on the trace's channel. All @p probe_count
 * probes are sent and recorded even after the first reply; the extra samples
 * feed latency-variance reporting downstream.
 */
class HopProber {
public:
    HopProber(ProbeChannel& channel, ProtocolVariant variant);

    /// @throws SendFailure propagated from the channel.
    HopRecord probe_hop(const std::string& destination_address,
                        int hop_limit,
                        int probe_count,
                        std::chrono::milliseconds timeout);

    /// Next sequence number that will be used; unique across the trace.
    uint16_t next_sequence() const { return next_sequence_; }

private:
    ProbeChannel& channel_;
    ProtocolVariant variant_;
    uint16_t next_sequence_ = 1;
};

} // namespace hoptrace
