// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/trace/HopProber.h"

#include "hoptrace/log/Log.h"

#include <vector>

namespace hoptrace {

HopProber::HopProber(ProbeChannel& channel, ProtocolVariant variant)
    : channel_(channel), variant_(variant) {}

HopRecord HopProber::probe_hop(const std::string& destination_address,
                               int hop_limit,
                               int probe_count,
                               std::chrono::milliseconds timeout) {
    std::vector<ProbeOutcome> outcomes;
    outcomes.reserve(static_cast<std::size_t>(probe_count > 0 ? probe_count : 0));

    for (int attempt = 0; attempt < probe_count; ++attempt) {
        const uint16_t sequence = next_sequence_++;
        Probe probe = channel_.send(destination_address, hop_limit, sequence, variant_, attempt);
        outcomes.push_back(channel_.await_reply(probe, timeout));
    }

    HopRecord rec = HopRecord::from_outcomes(hop_limit, std::move(outcomes));
    HTLOG_TRACE("hop %d sealed resolved=%d representative=%s",
                hop_limit, rec.resolved ? 1 : 0, rec.representative_address.c_str());
    return rec;
}

} // namespace hoptrace
