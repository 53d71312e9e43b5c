// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/asn/AsAttributionCache.h"
#include "hoptrace/log/Log.h"

#include "test_fakes.h"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using hoptrace::asn::AsAttributionCache;
using hoptrace::asn::AttributionOptions;
using hoptrace::testing::FakeLookup;

int main() {
    hoptrace::Logger::init({hoptrace::LogLevel::ERROR, hoptrace::LogMode::Silent, {}});

    // Label selection.
    {
        hoptrace::asn::OwnershipRecord rec;
        assert(hoptrace::asn::owner_label(rec) == "Unknown");
        rec.ok = true;
        rec.asn = 15133;
        assert(hoptrace::asn::owner_label(rec) == "AS15133");
        rec.description = "EDGECAST";
        assert(hoptrace::asn::owner_label(rec) == "EDGECAST");
        rec.description = std::string{};
        assert(hoptrace::asn::owner_label(rec) == "AS15133");
    }

    // Private ranges never hit the registry and are not stored.
    {
        FakeLookup lookup;
        AsAttributionCache cache(lookup);
        for (const char* addr : {"192.168.1.1", "10.1.2.3", "172.20.0.1"}) {
            auto out = cache.attribute(addr);
            assert(out.label == "Private");
            assert(out.resolved);
        }
        assert(lookup.calls.load() == 0);
        assert(cache.size() == 0);
    }

    // Warm cache answers repeated lookups without another query.
    {
        FakeLookup lookup;
        lookup.set("93.184.216.34", "EDGECAST", 15133);
        AsAttributionCache cache(lookup);

        auto first = cache.attribute("93.184.216.34");
        assert(first.label == "EDGECAST" && !first.from_cache);
        for (int i = 0; i < 5; ++i) {
            auto again = cache.attribute("93.184.216.34");
            assert(again.label == "EDGECAST");
            assert(again.from_cache);
        }
        assert(lookup.calls.load() == 1);
        assert(cache.lookups_issued() == 1);
    }

    // "Unknown" is served until the negative TTL lapses, then retried and replaced.
    {
        FakeLookup lookup;
        AttributionOptions opts;
        opts.negative_ttl = 3600s;
        AsAttributionCache cache(lookup, opts);

        auto miss = cache.attribute("198.51.100.7");
        assert(miss.label == "Unknown" && !miss.resolved);
        lookup.set("198.51.100.7", "TRANSIT-B", 64501);
        auto cached = cache.attribute("198.51.100.7");
        assert(cached.label == "Unknown" && cached.from_cache);
        assert(lookup.calls.load() == 1);
    }
    {
        FakeLookup lookup;
        AttributionOptions opts;
        opts.negative_ttl = 0s;
        AsAttributionCache cache(lookup, opts);

        assert(cache.attribute("198.51.100.7").label == "Unknown");
        lookup.set("198.51.100.7", "TRANSIT-B", 64501);
        auto retried = cache.attribute("198.51.100.7");
        assert(retried.label == "TRANSIT-B" && retried.resolved);
        assert(lookup.calls.load() == 2);
        assert(cache.peek("198.51.100.7")->label == "TRANSIT-B");
    }

    // A failure never replaces a success.
    {
        FakeLookup lookup;
        lookup.set("203.0.113.1", "TRANSIT-A", 64500);
        AsAttributionCache cache(lookup, AttributionOptions{0s});
        assert(cache.attribute("203.0.113.1").label == "TRANSIT-A");
        lookup.records.clear();
        assert(cache.attribute("203.0.113.1").label == "TRANSIT-A");
        assert(lookup.calls.load() == 1);
    }

    // Write-through to the store, and warm start from it.
    {
        hoptrace::asn::MemoryAttributionStore store;
        {
            FakeLookup lookup;
            lookup.set("203.0.113.1", "TRANSIT-A", 64500);
            AsAttributionCache cache(lookup, {}, &store);
            cache.attribute("203.0.113.1");
            cache.attribute("192.168.0.1");
        }
        assert(store.size() == 1);

        FakeLookup cold;
        AsAttributionCache cache(cold, {}, &store);
        auto out = cache.attribute("203.0.113.1");
        assert(out.label == "TRANSIT-A" && out.from_cache);
        assert(cold.calls.load() == 0);
    }

    // Concurrent first lookups of the same addresses settle on one entry each.
    {
        FakeLookup lookup;
        std::vector<std::string> addrs;
        for (int i = 1; i <= 16; ++i) {
            const std::string a = "203.0.113." + std::to_string(i);
            lookup.set(a, "AS-HOLDER-" + std::to_string(i), static_cast<uint32_t>(64500 + i));
            addrs.push_back(a);
        }
        AsAttributionCache cache(lookup);

        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&cache, &addrs]() {
                for (int round = 0; round < 50; ++round) {
                    for (const auto& a : addrs) {
                        auto out = cache.attribute(a);
                        assert(out.resolved);
                        assert(out.label == "AS-HOLDER-" + a.substr(a.rfind('.') + 1));
                    }
                }
            });
        }
        for (auto& th : threads) th.join();

        assert(cache.size() == addrs.size());
        // At most one racing lookup per thread per address.
        assert(lookup.calls.load() >= 16);
        assert(lookup.calls.load() <= 16 * 8);
    }

    return 0;
}
