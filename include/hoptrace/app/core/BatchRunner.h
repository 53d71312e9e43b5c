// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/config/Config.h"
#include "hoptrace/trace/PathTracer.h"

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace hoptrace {

namespace sink {
class PathResultSink;
}

/**
 * @brief Read destinations, one per line. Blank lines and lines starting
 * with '#' are skipped; surrounding whitespace is trimmed.
 */
std::vector<std::string> read_targets(std::istream& in);

/// @return nullopt if @p path cannot be opened.
std::optional<std::vector<std::string>> load_targets(const std::string& path);

/// Translate the probe/attribution sections of @p cfg into trace options.
TraceOptions make_trace_options(const Config& cfg);

/**
 * @brief Options for a batch of traces.
 */
struct BatchOptions {
    TraceOptions trace{};

    // Callbacks
    std::function<bool()> should_stop;                          // Stops the batch (and the running trace).
    std::function<void(const PathResult&)> on_result;           // Operator output.
};

/**
 * @brief Batch outcome.
 */
struct BatchSummary {
    std::size_t attempted = 0;
    std::size_t reached = 0;
    std::size_t failed = 0;         // Every sealed trace that did not reach its destination.
    std::size_t sink_errors = 0;
    bool interrupted = false;
};

/**
 * @brief Traces each destination in turn.
 *
 * Each trace is isolated: failures end up in that trace's terminal reason
 * and the batch moves on. Results go to @p sink (when set) for every
 * terminal reason, failed traces included.
 */
BatchSummary run_batch(PathTracer& tracer,
                       const std::vector<std::string>& destinations,
                       const BatchOptions& opts,
                       sink::PathResultSink* sink);

} // namespace hoptrace
