// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace hoptrace {

using Clock = std::chrono::steady_clock;

enum class ProtocolVariant {
    IcmpEcho,
    Udp
};

const char* to_string(ProtocolVariant variant);
std::optional<ProtocolVariant> parse_protocol(const std::string& text);

/// UDP probes use base_port + attempt; true when every attempt stays <= 65535.
bool udp_ports_fit(int base_port, int probes_per_hop);

/**
 * @brief One transmitted packet. Immutable once returned by the sender.
 */
struct Probe {
    std::string destination;          ///< Dotted-quad target address.
    int hop_limit = 0;                ///< IP TTL the probe was sent with.
    uint16_t sequence = 0;            ///< Unique within the enclosing trace.
    int attempt = 0;                  ///< Index of this probe within its hop.
    ProtocolVariant variant{ProtocolVariant::IcmpEcho};
    Clock::time_point sent_at{};

    // Correlation keys written into the outgoing packet.
    uint16_t icmp_ident = 0;          ///< ICMP echo identifier (IcmpEcho only).
    uint16_t udp_source_port = 0;     ///< Kernel-assigned source port (Udp only).
    uint16_t udp_dest_port = 0;       ///< base port + attempt (Udp only).
};

enum class OutcomeKind {
    EchoReply,
    TimeExceeded,
    DestUnreachable,
    OtherIcmp,
    Timeout
};

const char* to_string(OutcomeKind kind);

/**
 * @brief Result of one probe.
 *
 * responder and rtt_ms are both engaged unless kind == Timeout, in which case
 * both are empty; the factory functions below are the only way the probing
 * code builds outcomes so the pairing cannot drift.
 */
struct ProbeOutcome {
    Probe probe{};
    OutcomeKind kind{OutcomeKind::Timeout};
    std::optional<std::string> responder;
    std::optional<double> rtt_ms;
    uint8_t icmp_type = 0;
    uint8_t icmp_code = 0;

    bool timed_out() const { return kind == OutcomeKind::Timeout; }

    static ProbeOutcome timeout(const Probe& probe);
    static ProbeOutcome reply(const Probe& probe,
                              OutcomeKind kind,
                              std::string responder,
                              double rtt_ms,
                              uint8_t icmp_type = 0,
                              uint8_t icmp_code = 0);
};

/**
 * @brief Raised when a probe cannot be transmitted (socket creation or
 * sendto failure). Fatal for the current trace only.
 */
class SendFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace hoptrace
