// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/app/core/RuntimeSetup.h"

#include <stdexcept>

namespace hoptrace {

LoggerConfig make_logger_config(const Config& cfg) {
    LoggerConfig lc;
    lc.mode = parse_log_mode(cfg.log_mode).value_or(LogMode::Console);
    lc.level = parse_log_level(cfg.log_level).value_or(LogLevel::INFO);
    lc.file_path = cfg.log_file;
    return lc;
}

AttributionRuntime make_attribution_runtime(const Config& cfg) {
    AttributionRuntime rt;
    if (!cfg.attribution.enabled) {
        return rt;
    }

    asn::RipeStatOptions ro;
    ro.host = cfg.attribution.lookup_host;
    ro.port = cfg.attribution.lookup_port;
    ro.timeout = std::chrono::milliseconds(cfg.attribution.request_timeout_ms);
    rt.lookup = std::make_unique<asn::RipeStatLookup>(ro);

    if (cfg.attribution.cache_file.empty()) {
        rt.store = std::make_unique<asn::MemoryAttributionStore>();
    } else {
        auto file_store = std::make_unique<asn::JsonlAttributionStore>(cfg.attribution.cache_file);
        // Collapse the previous runs' appends before warming the cache.
        try {
            file_store->compact();
        } catch (const std::runtime_error& e) {
            HTLOG_WARN("attribution cache %s not compacted: %s",
                       cfg.attribution.cache_file.c_str(), e.what());
        }
        rt.store = std::move(file_store);
    }

    asn::AttributionOptions ao;
    ao.negative_ttl = std::chrono::seconds(cfg.attribution.negative_ttl_seconds);
    rt.cache = std::make_unique<asn::AsAttributionCache>(*rt.lookup, ao, rt.store.get());
    return rt;
}

} // namespace hoptrace
