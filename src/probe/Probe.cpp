// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/probe/Probe.h"

#include <cctype>

namespace hoptrace {

const char* to_string(ProtocolVariant variant) {
    switch (variant) {
        case ProtocolVariant::IcmpEcho: return "icmp";
        case ProtocolVariant::Udp:      return "udp";
    }
    return "?";
}

std::optional<ProtocolVariant> parse_protocol(const std::string& text) {
    std::string lower = text;
    for (auto& ch : lower) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    if (lower == "icmp" || lower == "icmp-echo") return ProtocolVariant::IcmpEcho;
    if (lower == "udp") return ProtocolVariant::Udp;
    return std::nullopt;
}

bool udp_ports_fit(int base_port, int probes_per_hop) {
    return base_port >= 1 && probes_per_hop >= 1 && base_port + probes_per_hop - 1 <= 65535;
}

const char* to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::EchoReply:       return "ECHO_REPLY";
        case OutcomeKind::TimeExceeded:    return "TIME_EXCEEDED";
        case OutcomeKind::DestUnreachable: return "DEST_UNREACHABLE";
        case OutcomeKind::OtherIcmp:       return "OTHER_ICMP";
        case OutcomeKind::Timeout:         return "TIMEOUT";
    }
    return "?";
}

ProbeOutcome ProbeOutcome::timeout(const Probe& probe) {
    ProbeOutcome out;
    out.probe = probe;
    out.kind = OutcomeKind::Timeout;
    return out;
}

ProbeOutcome ProbeOutcome::reply(const Probe& probe,
                                 OutcomeKind kind,
                                 std::string responder,
                                 double rtt_ms,
                                 uint8_t icmp_type,
                                 uint8_t icmp_code) {
    if (kind == OutcomeKind::Timeout) {
        return timeout(probe);
    }
    ProbeOutcome out;
    out.probe = probe;
    out.kind = kind;
    out.responder = std::move(responder);
    out.rtt_ms = rtt_ms < 0.0 ? 0.0 : rtt_ms;
    out.icmp_type = icmp_type;
    out.icmp_code = icmp_code;
    return out;
}

} // namespace hoptrace
