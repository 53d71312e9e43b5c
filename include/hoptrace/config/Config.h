// SPDX-License-Identifier: BSD-2-Clause

#pragma once
/**
 * @file Config.h
 * @brief Configuration holder parsed from YAML.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace hoptrace {

/**
 * @brief In-memory representation of the YAML configuration file.
 *
 * Every field has a usable default so a missing section simply keeps them.
 */
struct Config {
    struct ProbeConfig {
        std::string protocol = "icmp";   // icmp|udp
        int max_hops = 30;
        int probes_per_hop = 3;
        int timeout_ms = 2000;           // Per-probe reply deadline.
        uint16_t udp_base_port = 33434;  // Destination port of attempt 0.
        std::size_t payload_size = 32;
    };

    struct AttributionConfig {
        bool enabled = true;
        std::string lookup_host = "stat.ripe.net";
        uint16_t lookup_port = 443;
        int request_timeout_ms = 10000;
        int negative_ttl_seconds = 300;  // Retry "Unknown" entries after this long.
        std::string cache_file;          // Empty keeps the cache in memory only.
    };

    struct OutputConfig {
        std::string results_file;        // JSON lines; empty disables.
        std::string source_region = "local";
    };

    ProbeConfig probe{};
    AttributionConfig attribution{};
    OutputConfig output{};

    std::string targets_file;            // One destination per line.
    std::string daemon_listen = "0.0.0.0:50061";

    // Logging
    std::string log_mode  = "console";  // console|file|silent
    std::string log_level = "info";     // trace|debug|info|warn|error
    std::string log_file  = "hoptrace.log"; // Only used when mode==file.

    /**
     * @brief Parse configuration from a YAML document.
     *
     * The document is validated against config_schema.json located in the
     * same directory.
     *
     * @param path File path to read.
     * @return Populated config on success, std::nullopt on failure.
     */
    static std::optional<Config> from_file(const std::string& path);
};

/**
 * @brief Cross-field checks the schema cannot express.
 *
 * Run by from_file() and again after command-line overrides are merged.
 * @return false with a message in @p error when the config is unusable.
 */
bool validate_config(const Config& cfg, std::string& error);

} // namespace hoptrace
