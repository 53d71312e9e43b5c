// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/probe/Probe.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace hoptrace {

/**
 * @brief Send/receive seam used by the Hop Prober.
 *
 * One channel serves exactly one trace and owns whatever transport that trace
 * needs; destroying it releases the sockets. The production implementation is
 * RawProbeChannel; tests substitute scripted channels.
 */
class ProbeChannel {
public:
    virtual ~ProbeChannel() = default;

    /**
     * @brief Transmit one probe.
     * @throws SendFailure if the packet cannot be sent.
     */
    virtual Probe send(const std::string& destination,
                       int hop_limit,
                       uint16_t sequence,
                       ProtocolVariant variant,
                       int attempt) = 0;

    /**
     * @brief Block until a reply correlated with @p probe arrives or
     * @p timeout elapses (measured from the probe's send time).
     */
    virtual ProbeOutcome await_reply(const Probe& probe, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Transport settings for the raw-socket channel.
 */
struct ProbeSettings {
    ProtocolVariant variant{ProtocolVariant::IcmpEcho};
    uint16_t udp_base_port = 33434;
    std::size_t payload_size = 32;
};

/**
 * @brief Open the raw sockets for one trace.
 *
 * Needs root or CAP_NET_RAW (a raw ICMP socket is required for receiving
 * replies in both variants).
 *
 * @throws SendFailure if the transport cannot be opened.
 */
std::unique_ptr<ProbeChannel> make_raw_probe_channel(const ProbeSettings& settings);

} // namespace hoptrace
