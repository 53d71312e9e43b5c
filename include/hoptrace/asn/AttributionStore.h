// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hoptrace::asn {

/**
 * @brief One cached address-to-label mapping.
 */
struct AttributionEntry {
    std::string address;
    std::string label;
    bool resolved = false;  ///< False for "Unknown" placeholders.
    std::chrono::system_clock::time_point looked_up_at{};
};

/**
 * @brief Persistence seam for the attribution cache.
 *
 * put() is called with the cache's write lock released, possibly from
 * several threads; implementations serialise themselves.
 */
class AttributionStore {
public:
    virtual ~AttributionStore() = default;

    /// All stored entries; later entries for the same address win.
    virtual std::vector<AttributionEntry> load() = 0;

    virtual void put(const AttributionEntry& entry) = 0;
};

class MemoryAttributionStore final : public AttributionStore {
public:
    std::vector<AttributionEntry> load() override;
    void put(const AttributionEntry& entry) override;

    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, AttributionEntry> entries_;
};

/**
 * @brief Append-only JSON-lines file: one object per put().
 *
 * {"address":"...","label":"...","resolved":true,"looked_up_at":<epoch s>}
 *
 * load() tolerates a missing file and skips malformed lines. compact()
 * rewrites the file with one line per address.
 *
 * put() and compact() hold an flock on "<path>.lock", so several processes
 * may share one cache file: each append reopens the path and lands in the
 * current file, never in one a concurrent compaction is replacing.
 */
class JsonlAttributionStore final : public AttributionStore {
public:
    explicit JsonlAttributionStore(std::string path);

    std::vector<AttributionEntry> load() override;

    /// @throws std::runtime_error if the file cannot be opened for append.
    void put(const AttributionEntry& entry) override;

    /// @throws std::runtime_error if the rewrite fails.
    void compact();

    const std::string& path() const { return path_; }

private:
    std::vector<AttributionEntry> load_locked();

    std::string path_;
    std::mutex mtx_;
};

} // namespace hoptrace::asn
