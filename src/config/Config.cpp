// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/config/Config.h"

#include "hoptrace/log/Log.h"
#include "hoptrace/probe/Probe.h"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <nlohmann/json-schema.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace hoptrace {
namespace {

template <typename T>
void set_if_present(const YAML::Node& node, const char* key, T& target) {
    if (!node) return;
    if (auto child = node[key]) {
        target = child.as<T>();
    }
}

// Convert YAML scalars to JSON types with best-effort typing.
nlohmann::json yaml_scalar_to_json(const YAML::Node& node) {
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return b;
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.Scalar();
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        return yaml_scalar_to_json(node);
    case YAML::NodeType::Sequence: {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& elem : node) arr.push_back(yaml_to_json(elem));
        return arr;
    }
    case YAML::NodeType::Map: {
        nlohmann::json obj = nlohmann::json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            obj[it->first.as<std::string>()] = yaml_to_json(it->second);
        }
        return obj;
    }
    default:
        return nullptr;
    }
}

std::optional<nlohmann::json> load_schema(const std::string& config_path) {
    namespace fs = std::filesystem;
    fs::path schema_path = fs::path(config_path).parent_path() / "config_schema.json";
    std::ifstream in(schema_path);
    if (!in) return std::nullopt;
    try {
        nlohmann::json schema;
        in >> schema;
        return schema;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

bool validate_root(const YAML::Node& root, const nlohmann::json& schema, std::string& error) {
    try {
        nlohmann::json_schema::json_validator validator(
            nullptr,
            nlohmann::json_schema::default_string_format_check);
        validator.set_root_schema(schema);
        validator.validate(yaml_to_json(root));
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
        return false;
    }
}

void apply_probe_config(const YAML::Node& probe, Config::ProbeConfig& cfg) {
    if (!probe) return;
    set_if_present(probe, "protocol", cfg.protocol);
    set_if_present(probe, "max_hops", cfg.max_hops);
    set_if_present(probe, "probes_per_hop", cfg.probes_per_hop);
    set_if_present(probe, "timeout_ms", cfg.timeout_ms);
    set_if_present(probe, "udp_base_port", cfg.udp_base_port);
    set_if_present(probe, "payload_size", cfg.payload_size);
}

void apply_attribution_config(const YAML::Node& attr, Config::AttributionConfig& cfg) {
    if (!attr) return;
    set_if_present(attr, "enabled", cfg.enabled);
    set_if_present(attr, "lookup_host", cfg.lookup_host);
    set_if_present(attr, "lookup_port", cfg.lookup_port);
    set_if_present(attr, "request_timeout_ms", cfg.request_timeout_ms);
    set_if_present(attr, "negative_ttl_seconds", cfg.negative_ttl_seconds);
    set_if_present(attr, "cache_file", cfg.cache_file);
}

} // namespace

bool validate_config(const Config& cfg, std::string& error) {
    if (!parse_protocol(cfg.probe.protocol)) {
        error = "probe.protocol must be icmp or udp";
        return false;
    }
    if (cfg.probe.max_hops < 1 || cfg.probe.max_hops > 255) {
        error = "probe.max_hops must be within 1..255";
        return false;
    }
    if (cfg.probe.probes_per_hop < 1) {
        error = "probe.probes_per_hop must be positive";
        return false;
    }
    if (!udp_ports_fit(cfg.probe.udp_base_port, cfg.probe.probes_per_hop)) {
        error = "probe.udp_base_port + probe.probes_per_hop - 1 exceeds 65535";
        return false;
    }
    if (cfg.probe.timeout_ms < 1) {
        error = "probe.timeout_ms must be positive";
        return false;
    }
    if (cfg.attribution.negative_ttl_seconds < 0) {
        error = "attribution.negative_ttl_seconds must not be negative";
        return false;
    }
    return true;
}

/**
 * @brief Populate a Config structure from a YAML document on disk.
 */
std::optional<Config> Config::from_file(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        HTLOG_ERROR("cannot read config %s", path.c_str());
        return std::nullopt;
    } catch (const YAML::ParserException& e) {
        HTLOG_ERROR("cannot parse config %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }

    Config cfg;

    auto schema = load_schema(path);
    if (!schema) {
        HTLOG_ERROR("failed to load config schema near %s", path.c_str());
        return std::nullopt;
    }

    std::string error;
    if (!validate_root(root, *schema, error)) {
        HTLOG_ERROR("config validation failed: %s", error.c_str());
        return std::nullopt;
    }

    try {
        if (auto log = root["log"]) {
            set_if_present(log, "mode", cfg.log_mode);
            set_if_present(log, "level", cfg.log_level);
            set_if_present(log, "file", cfg.log_file);
        }
        apply_probe_config(root["probe"], cfg.probe);
        apply_attribution_config(root["attribution"], cfg.attribution);
        if (auto output = root["output"]) {
            set_if_present(output, "results_file", cfg.output.results_file);
            set_if_present(output, "source_region", cfg.output.source_region);
        }
        if (auto targets = root["targets"]) {
            set_if_present(targets, "file", cfg.targets_file);
        }
        if (auto daemon = root["daemon"]) {
            set_if_present(daemon, "listen", cfg.daemon_listen);
        }
    } catch (const YAML::Exception& e) {
        HTLOG_ERROR("config %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }

    if (!validate_config(cfg, error)) {
        HTLOG_ERROR("config %s: %s", path.c_str(), error.c_str());
        return std::nullopt;
    }
    return cfg;
}

} // namespace hoptrace
