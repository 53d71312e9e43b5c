// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/probe/Probe.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hoptrace {

/// Representative address of a hop where every probe timed out.
inline constexpr const char* kNoResponse = "*";

/**
 * @brief Aggregated state of one hop limit.
 */
struct HopRecord {
    int hop_limit = 0;
    std::vector<ProbeOutcome> outcomes;        ///< Issuance order.
    bool resolved = false;                     ///< At least one non-timeout outcome.
    std::string representative_address{kNoResponse};
    std::optional<double> representative_latency_ms;

    /**
     * @brief Build a record from the outcomes collected at @p hop_limit.
     *
     * The representative is the first non-timeout outcome in issuance order.
     */
    static HopRecord from_outcomes(int hop_limit, std::vector<ProbeOutcome> outcomes);
};

enum class TerminalReason {
    DestinationReached,
    MaxHopsExceeded,
    ResolutionFailed,
    SendFailed,
    Cancelled
};

const char* to_string(TerminalReason reason);

/**
 * @brief Complete output of one trace.
 *
 * Filled by PathTracer while the trace runs and sealed (terminal_reason set)
 * exactly once when the loop ends. Consumers receive it by const reference
 * or by value and treat it as immutable.
 */
struct PathResult {
    std::string destination;                   ///< Host or address as given.
    std::string resolved_address;              ///< Empty when resolution failed.
    ProtocolVariant variant{ProtocolVariant::IcmpEcho};
    std::vector<HopRecord> hops;               ///< hops[i].hop_limit == i + 1.
    bool success = false;
    std::optional<double> average_latency_ms;
    std::vector<std::string> as_path;
    std::optional<TerminalReason> terminal_reason;
    std::string error;                         ///< Detail for failure reasons.
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};

    bool sealed() const { return terminal_reason.has_value(); }

    /// Representative address per hop, "*" for silent hops.
    std::vector<std::string> hop_addresses() const;
};

/// Mean of every present representative latency; nullopt when none is present.
std::optional<double> average_latency(const std::vector<HopRecord>& hops);

/// Append @p label unless it equals the current last entry.
void append_as_label(std::vector<std::string>& as_path, const std::string& label);

} // namespace hoptrace
