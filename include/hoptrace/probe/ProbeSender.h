// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/probe/Probe.h"
#include "hoptrace/probe/ProbeSocket.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace hoptrace {

/**
 * @brief Builds and transmits single probes over a trace's ProbeSocket.
 *
 * Echo probes carry a per-trace ICMP identifier plus the probe sequence; UDP
 * probes target base_port + attempt from a dedicated source port.
 */
class ProbeSender {
public:
    ProbeSender(ProbeSocket& socket, uint16_t udp_base_port, std::size_t payload_size);

    /**
     * @brief Transmit one probe with the IP TTL set to @p hop_limit.
     *
     * @throws SendFailure for an invalid destination, a hop limit outside
     *         [1, 255], or any transport error.
     */
    Probe send(const std::string& destination,
               int hop_limit,
               uint16_t sequence,
               ProtocolVariant variant,
               int attempt);

    uint16_t icmp_ident() const { return ident_; }

    /// Allocate an ICMP identifier distinct from other live traces in this process.
    static uint16_t next_ident();

private:
    ProbeSocket& socket_;
    uint16_t udp_base_port_;
    std::size_t payload_size_;
    uint16_t ident_;
};

} // namespace hoptrace
