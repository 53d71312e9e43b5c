// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/asn/AsAttributionCache.h"
#include "hoptrace/config/Config.h"
#include "hoptrace/log/Log.h"

#include <memory>

namespace hoptrace {

// Logger settings from the log: section; unknown text falls back to defaults.
LoggerConfig make_logger_config(const Config& cfg);

/**
 * @brief Owns the lookup, store and cache built from the attribution: section.
 *
 * Members are declared in dependency order so the cache is destroyed before
 * the collaborators it references.
 */
struct AttributionRuntime {
    std::unique_ptr<asn::OwnershipLookup> lookup;
    std::unique_ptr<asn::AttributionStore> store;
    std::unique_ptr<asn::AsAttributionCache> cache;
};

/// Empty runtime (cache == nullptr) when attribution is disabled.
AttributionRuntime make_attribution_runtime(const Config& cfg);

} // namespace hoptrace
