// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/app/cli/cli_helpers.h"
#include "hoptrace/app/core/BatchRunner.h"
#include "hoptrace/app/core/RuntimeSetup.h"
#include "hoptrace/config/Config.h"
#include "hoptrace/log/Log.h"
#include "hoptrace/net/HttpsClient.h"
#include "hoptrace/sink/PathResultSink.h"
#include "hoptrace/trace/PathFormatter.h"

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

volatile sig_atomic_t g_stop_requested = 0;

void handle_signal(int sig) {
    // Only note the request; the tracer polls it between hops.
    g_stop_requested = 1;
    std::signal(sig, handle_signal);
}

void install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

void print_result(const hoptrace::PathResult& result, int max_hops) {
    const std::string addr = result.resolved_address.empty() ? "?" : result.resolved_address;
    std::cout << hoptrace::format_header(result.destination, addr, max_hops, result.variant) << '\n';
    for (const auto& hop : result.hops) {
        std::cout << hoptrace::format_hop_line(hop) << '\n';
    }
    std::cout << hoptrace::format_summary(result) << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    auto cli_opts = hoptrace::cli::normalize_options(hoptrace::cli::parse_args(argc, argv));
    install_signal_handlers();

    auto cfg = hoptrace::Config::from_file(cli_opts.config_path);
    if (!cfg) {
        std::cerr << "Failed to load config: " << cli_opts.config_path << '\n';
        return 1;
    }
    hoptrace::cli::apply_overrides(cli_opts, *cfg);
    std::string cfg_error;
    if (!hoptrace::validate_config(*cfg, cfg_error)) {
        std::cerr << "Invalid settings: " << cfg_error << '\n';
        return 1;
    }

    hoptrace::Logger::init(hoptrace::make_logger_config(*cfg));

    std::vector<std::string> destinations = cli_opts.destinations;
    if (destinations.empty()) {
        if (cfg->targets_file.empty()) {
            std::cerr << "No destinations given and no targets file configured\n";
            return 1;
        }
        auto targets = hoptrace::load_targets(cfg->targets_file);
        if (!targets) {
            std::cerr << "Cannot read targets file: " << cfg->targets_file << '\n';
            return 1;
        }
        destinations = std::move(*targets);
        HTLOG_INFO("loaded %zu targets from %s", destinations.size(), cfg->targets_file.c_str());
    }
    if (destinations.empty()) {
        std::cerr << "Target list is empty\n";
        return 1;
    }

    std::unique_ptr<hoptrace::sink::PathResultSink> sink;
    if (!cfg->output.results_file.empty()) {
        try {
            sink = std::make_unique<hoptrace::sink::JsonLinesSink>(cfg->output.results_file,
                                                                   cfg->output.source_region);
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << '\n';
            return 1;
        }
    }

    std::unique_ptr<hoptrace::net::CurlGlobal> curl;
    try {
        curl = std::make_unique<hoptrace::net::CurlGlobal>();
    } catch (const hoptrace::net::HttpError& e) {
        std::cerr << e.what() << '\n';
        return 1;
    }

    hoptrace::AttributionRuntime attribution = hoptrace::make_attribution_runtime(*cfg);
    hoptrace::SystemHostResolver resolver;
    hoptrace::PathTracer tracer(resolver, attribution.cache.get());

    hoptrace::BatchOptions batch;
    batch.trace = hoptrace::make_trace_options(*cfg);
    batch.should_stop = []() { return g_stop_requested != 0; };
    const int max_hops = batch.trace.max_hops;
    batch.on_result = [max_hops](const hoptrace::PathResult& r) { print_result(r, max_hops); };

    const auto summary = hoptrace::run_batch(tracer, destinations, batch, sink.get());

    if (summary.interrupted) {
        std::cerr << "Interrupted after " << summary.attempted << " of "
                  << destinations.size() << " destinations\n";
    }
    return (summary.reached == destinations.size()) ? 0 : 2;
}
