// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/config/Config.h"

#include <optional>
#include <string>
#include <vector>

namespace hoptrace::cli {

struct CliOptions {
    std::string config_path = "examples/configs/config_default.yaml";
    std::vector<std::string> destinations;
    std::optional<int> max_hops;
    std::optional<int> probes_per_hop;
    std::optional<int> timeout_ms;
    std::optional<std::string> protocol;
    std::optional<int> udp_base_port;
    std::optional<std::string> targets_file;
    std::optional<std::string> results_file;
    std::optional<std::string> cache_file;
    bool no_asn = false;
};

std::string to_lower(std::string value);

/// Parse argv; prints usage and exits on -h or on malformed values.
CliOptions parse_args(int argc, char** argv);

CliOptions normalize_options(CliOptions opts);

/// Copy every flag the operator set on top of the values loaded from YAML.
void apply_overrides(const CliOptions& opts, Config& cfg);

} // namespace hoptrace::cli
