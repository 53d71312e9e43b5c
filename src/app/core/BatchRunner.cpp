// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/app/core/BatchRunner.h"

#include "hoptrace/log/Log.h"
#include "hoptrace/sink/PathResultSink.h"

#include <fstream>
#include <stdexcept>

namespace hoptrace {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

std::vector<std::string> read_targets(std::istream& in) {
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        out.push_back(line);
    }
    return out;
}

std::optional<std::vector<std::string>> load_targets(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    return read_targets(in);
}

TraceOptions make_trace_options(const Config& cfg) {
    TraceOptions opts;
    opts.variant = parse_protocol(cfg.probe.protocol).value_or(ProtocolVariant::IcmpEcho);
    opts.max_hops = cfg.probe.max_hops;
    opts.probes_per_hop = cfg.probe.probes_per_hop;
    opts.timeout = std::chrono::milliseconds(cfg.probe.timeout_ms);
    opts.udp_base_port = cfg.probe.udp_base_port;
    opts.payload_size = cfg.probe.payload_size;
    opts.attribute = cfg.attribution.enabled;
    return opts;
}

BatchSummary run_batch(PathTracer& tracer,
                       const std::vector<std::string>& destinations,
                       const BatchOptions& opts,
                       sink::PathResultSink* sink) {
    BatchSummary summary;

    TraceOptions trace_opts = opts.trace;
    if (opts.should_stop) {
        auto outer = trace_opts.should_stop;
        auto batch_stop = opts.should_stop;
        trace_opts.should_stop = [outer, batch_stop]() {
            return batch_stop() || (outer && outer());
        };
    }

    for (const auto& destination : destinations) {
        if (opts.should_stop && opts.should_stop()) {
            summary.interrupted = true;
            break;
        }

        ++summary.attempted;
        PathResult result = tracer.trace(destination, trace_opts);

        if (result.success) {
            ++summary.reached;
        } else {
            ++summary.failed;
        }

        if (opts.on_result) {
            opts.on_result(result);
        }

        if (sink) {
            try {
                sink->write(result);
            } catch (const std::runtime_error& e) {
                ++summary.sink_errors;
                HTLOG_ERROR("cannot store result for %s: %s", destination.c_str(), e.what());
            }
        }

        if (result.terminal_reason == TerminalReason::Cancelled) {
            summary.interrupted = true;
            break;
        }
    }

    HTLOG_INFO("batch done: %zu traced, %zu reached, %zu not reached%s",
               summary.attempted, summary.reached, summary.failed,
               summary.interrupted ? " (interrupted)" : "");
    return summary;
}

} // namespace hoptrace
