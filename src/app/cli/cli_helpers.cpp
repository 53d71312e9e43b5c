// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/app/cli/cli_helpers.h"

#include "hoptrace/probe/Probe.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>

namespace hoptrace::cli {

std::string to_lower(std::string value) {
    for (auto& ch : value) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
    return value;
}

namespace {

int parse_int_or_exit(const std::string& value, const char* what, long min, long max) {
    char* end = nullptr;
    errno = 0;
    long n = std::strtol(value.c_str(), &end, 10);
    if (errno != 0 || end == value.c_str() || *end != '\0' || n < min || n > max) {
        std::cerr << "Invalid " << what << ": " << value << '\n';
        std::exit(1);
    }
    return static_cast<int>(n);
}

void print_usage() {
    std::cout << "Usage: hoptrace [options] [destination...]\n"
              << "  -c, --config <path>      Configuration file (default examples/configs/config_default.yaml)\n"
              << "  -m, --max-hops <n>       Highest hop limit to probe (1-255)\n"
              << "  -q, --probes <n>         Probes per hop\n"
              << "  -w, --timeout-ms <ms>    Per-probe reply timeout\n"
              << "  -P, --protocol <icmp|udp> Probe type\n"
              << "  -p, --port <port>        UDP base destination port\n"
              << "  -t, --targets <file>     Read destinations from file (one per line, # comments)\n"
              << "  -o, --output <file>      Append JSON-lines results to file\n"
              << "  --cache <file>           Persistent AS attribution cache\n"
              << "  --no-asn                 Skip AS attribution\n"
              << "\nCtrl+C stops the batch after the hop in progress.\n";
}

} // namespace

CliOptions parse_args(int argc, char** argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if ((arg == "--max-hops" || arg == "-m") && i + 1 < argc) {
            opts.max_hops = parse_int_or_exit(argv[++i], "max hops", 1, 255);
        } else if ((arg == "--probes" || arg == "-q") && i + 1 < argc) {
            opts.probes_per_hop = parse_int_or_exit(argv[++i], "probe count", 1, 10);
        } else if ((arg == "--timeout-ms" || arg == "-w") && i + 1 < argc) {
            opts.timeout_ms = parse_int_or_exit(argv[++i], "timeout", 1, 600000);
        } else if ((arg == "--protocol" || arg == "-P") && i + 1 < argc) {
            std::string p = to_lower(argv[++i]);
            if (!parse_protocol(p)) {
                std::cerr << "Invalid --protocol value: " << p << " (use icmp or udp)\n";
                std::exit(1);
            }
            opts.protocol = p;
        } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            opts.udp_base_port = parse_int_or_exit(argv[++i], "port", 1, 65535);
        } else if ((arg == "--targets" || arg == "-t") && i + 1 < argc) {
            opts.targets_file = argv[++i];
        } else if ((arg == "--output" || arg == "-o") && i + 1 < argc) {
            opts.results_file = argv[++i];
        } else if (arg == "--cache" && i + 1 < argc) {
            opts.cache_file = argv[++i];
        } else if (arg == "--no-asn") {
            opts.no_asn = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown or incomplete option: " << arg << '\n';
            print_usage();
            std::exit(1);
        } else {
            opts.destinations.push_back(arg);
        }
    }

    if (opts.udp_base_port &&
        !udp_ports_fit(*opts.udp_base_port, opts.probes_per_hop.value_or(1))) {
        std::cerr << "Invalid --port: " << *opts.udp_base_port << " + "
                  << opts.probes_per_hop.value_or(1) << " probes exceeds port 65535\n";
        std::exit(1);
    }
    return opts;
}

CliOptions normalize_options(CliOptions opts) {
    if (opts.protocol) {
        // "icmp-echo" and "icmp" name the same probe type.
        const auto variant = parse_protocol(to_lower(*opts.protocol));
        if (!variant) {
            opts.protocol.reset();
        } else {
            opts.protocol = *variant == ProtocolVariant::Udp ? "udp" : "icmp";
        }
    }
    if (opts.targets_file && opts.targets_file->empty()) {
        opts.targets_file.reset();
    }
    return opts;
}

void apply_overrides(const CliOptions& opts, Config& cfg) {
    if (opts.max_hops) cfg.probe.max_hops = *opts.max_hops;
    if (opts.probes_per_hop) cfg.probe.probes_per_hop = *opts.probes_per_hop;
    if (opts.timeout_ms) cfg.probe.timeout_ms = *opts.timeout_ms;
    if (opts.protocol) cfg.probe.protocol = *opts.protocol;
    if (opts.udp_base_port) cfg.probe.udp_base_port = static_cast<uint16_t>(*opts.udp_base_port);
    if (opts.targets_file) cfg.targets_file = *opts.targets_file;
    if (opts.results_file) cfg.output.results_file = *opts.results_file;
    if (opts.cache_file) cfg.attribution.cache_file = *opts.cache_file;
    if (opts.no_asn) cfg.attribution.enabled = false;
}

} // namespace hoptrace::cli
