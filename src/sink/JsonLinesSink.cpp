// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/sink/PathResultSink.h"

#include "hoptrace/log/Log.h"

#include <ctime>
#include <stdexcept>
#include <utility>

namespace hoptrace::sink {

namespace {

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace

nlohmann::json to_json(const PathResult& result, const std::string& source_region) {
    nlohmann::json j;
    j["timestamp"] = iso8601_utc(result.finished_at);
    j["source_region"] = source_region;
    j["destination"] = result.destination;
    j["destination_ip"] = result.resolved_address;
    j["protocol"] = to_string(result.variant);
    j["bgp_as_path"] = result.as_path;
    if (result.average_latency_ms) {
        j["latency_ms"] = *result.average_latency_ms;
    } else {
        j["latency_ms"] = nullptr;
    }
    j["traceroute_result"] = join(result.hop_addresses(), " -> ");
    j["success"] = result.success;
    j["terminal_reason"] = result.terminal_reason ? to_string(*result.terminal_reason) : "";
    if (!result.error.empty()) {
        j["error"] = result.error;
    }

    nlohmann::json hops = nlohmann::json::array();
    for (const auto& hop : result.hops) {
        nlohmann::json h;
        h["hop"] = hop.hop_limit;
        h["address"] = hop.representative_address;
        if (hop.representative_latency_ms) {
            h["rtt_ms"] = *hop.representative_latency_ms;
        } else {
            h["rtt_ms"] = nullptr;
        }
        nlohmann::json probes = nlohmann::json::array();
        for (const auto& o : hop.outcomes) {
            nlohmann::json p;
            p["kind"] = to_string(o.kind);
            if (!o.timed_out()) {
                p["responder"] = *o.responder;
                p["rtt_ms"] = *o.rtt_ms;
            }
            probes.push_back(std::move(p));
        }
        h["probes"] = std::move(probes);
        hops.push_back(std::move(h));
    }
    j["hops"] = std::move(hops);
    return j;
}

JsonLinesSink::JsonLinesSink(const std::string& path, std::string source_region)
    : path_(path), source_region_(std::move(source_region)), out_(path, std::ios::app) {
    if (!out_) {
        throw std::runtime_error("cannot open results file " + path);
    }
}

void JsonLinesSink::write(const PathResult& result) {
    const std::string line = to_json(result, source_region_).dump();
    std::lock_guard<std::mutex> lk(mtx_);
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("write to " + path_ + " failed");
    }
    HTLOG_DEBUG("stored result for %s in %s", result.destination.c_str(), path_.c_str());
}

} // namespace hoptrace::sink
