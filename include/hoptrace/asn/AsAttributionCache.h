// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/asn/AttributionStore.h"
#include "hoptrace/asn/OwnershipLookup.h"

#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace hoptrace::asn {

inline constexpr const char* kPrivateLabel = "Private";
inline constexpr const char* kUnknownLabel = "Unknown";

struct AttributionOptions {
    /// How long an "Unknown" placeholder is served before the lookup is retried.
    std::chrono::seconds negative_ttl{300};
};

struct AttributionOutcome {
    std::string label;
    bool resolved = false;    ///< A real owner (or "Private") rather than "Unknown".
    bool from_cache = false;
};

/// Label for a lookup result: description, else "AS<n>", else "Unknown".
std::string owner_label(const OwnershipRecord& rec);

/**
 * @brief Process-wide memo of address -> owner label.
 *
 * Shared by every trace in the process. Readers take a shared lock; the
 * remote lookup itself runs with no lock held, so two threads may race to
 * look up the same address. The first successful label stored for an address
 * is never replaced, and a failure never replaces a success.
 *
 * RFC 1918 addresses are answered "Private" without a lookup and are not
 * stored.
 */
class AsAttributionCache {
public:
    /**
     * @param lookup Remote registry; must outlive the cache.
     * @param store  Optional persistence; loaded once here, written through
     *               on every new entry. Must outlive the cache.
     */
    AsAttributionCache(OwnershipLookup& lookup,
                       AttributionOptions opts = {},
                       AttributionStore* store = nullptr);

    AsAttributionCache(const AsAttributionCache&) = delete;
    AsAttributionCache& operator=(const AsAttributionCache&) = delete;

    AttributionOutcome attribute(const std::string& address);

    std::optional<AttributionEntry> peek(const std::string& address) const;
    std::size_t size() const;

    /// Remote lookups issued since construction.
    std::size_t lookups_issued() const { return lookups_.load(std::memory_order_relaxed); }

private:
    bool usable(const AttributionEntry& e) const;

    OwnershipLookup& lookup_;
    AttributionOptions opts_;
    AttributionStore* store_;

    mutable std::shared_mutex mtx_;
    std::unordered_map<std::string, AttributionEntry> entries_;
    std::atomic<std::size_t> lookups_{0};
};

} // namespace hoptrace::asn
