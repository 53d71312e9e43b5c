// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/asn/AsAttributionCache.h"

#include "hoptrace/log/Log.h"
#include "hoptrace/net/Ipv4.h"

#include <mutex>
#include <stdexcept>

namespace hoptrace::asn {

std::string owner_label(const OwnershipRecord& rec) {
    if (!rec.ok) return kUnknownLabel;
    if (rec.description && !rec.description->empty()) return *rec.description;
    if (rec.asn) return "AS" + std::to_string(*rec.asn);
    return kUnknownLabel;
}

AsAttributionCache::AsAttributionCache(OwnershipLookup& lookup,
                                       AttributionOptions opts,
                                       AttributionStore* store)
    : lookup_(lookup), opts_(opts), store_(store) {
    if (!store_) return;
    for (auto& e : store_->load()) {
        auto it = entries_.find(e.address);
        if (it != entries_.end() && it->second.resolved && !e.resolved) continue;
        entries_[e.address] = std::move(e);
    }
    HTLOG_DEBUG("attribution cache warmed with %zu entries", entries_.size());
}

bool AsAttributionCache::usable(const AttributionEntry& e) const {
    if (e.resolved) return true;
    return std::chrono::system_clock::now() - e.looked_up_at < opts_.negative_ttl;
}

AttributionOutcome AsAttributionCache::attribute(const std::string& address) {
    if (net::is_private_ipv4(address)) {
        return {kPrivateLabel, true, false};
    }

    {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        auto it = entries_.find(address);
        if (it != entries_.end() && usable(it->second)) {
            return {it->second.label, it->second.resolved, true};
        }
    }

    lookups_.fetch_add(1, std::memory_order_relaxed);
    const OwnershipRecord rec = lookup_.lookup(address);

    AttributionEntry fresh;
    fresh.address = address;
    fresh.label = owner_label(rec);
    fresh.resolved = fresh.label != kUnknownLabel;
    fresh.looked_up_at = std::chrono::system_clock::now();

    AttributionEntry stored;
    bool changed = false;
    {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        auto it = entries_.find(address);
        if (it == entries_.end()) {
            it = entries_.emplace(address, fresh).first;
            changed = true;
        } else if (!it->second.resolved) {
            // A racing thread may have stored a success meanwhile; keep it.
            it->second = fresh;
            changed = true;
        }
        stored = it->second;
    }

    if (changed && store_) {
        try {
            store_->put(stored);
        } catch (const std::runtime_error& e) {
            HTLOG_WARN("cannot persist attribution for %s: %s", address.c_str(), e.what());
        }
    }

    HTLOG_DEBUG("attributed %s -> %s", address.c_str(), stored.label.c_str());
    return {stored.label, stored.resolved, false};
}

std::optional<AttributionEntry> AsAttributionCache::peek(const std::string& address) const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    auto it = entries_.find(address);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::size_t AsAttributionCache::size() const {
    std::shared_lock<std::shared_mutex> lk(mtx_);
    return entries_.size();
}

} // namespace hoptrace::asn
