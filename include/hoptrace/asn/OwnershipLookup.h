// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/net/HttpsClient.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hoptrace::asn {

/**
 * @brief Result of asking an ownership registry about one address.
 */
struct OwnershipRecord {
    bool ok = false;
    std::optional<std::string> description;  ///< Holder / AS description.
    std::optional<uint32_t> asn;
    std::string error;                       ///< Set when !ok.
};

/**
 * @brief Network-ownership lookup seam.
 *
 * Implementations must be safe to call from several threads at once and
 * must report failures through OwnershipRecord rather than by throwing.
 */
class OwnershipLookup {
public:
    virtual ~OwnershipLookup() = default;
    virtual OwnershipRecord lookup(const std::string& address) = 0;
};

struct RipeStatOptions {
    std::string host = "stat.ripe.net";
    uint16_t port = 443;
    std::chrono::milliseconds timeout{10000};
};

/**
 * @brief Looks addresses up in the RIPEstat prefix-overview data call.
 */
class RipeStatLookup final : public OwnershipLookup {
public:
    explicit RipeStatLookup(RipeStatOptions opts);

    OwnershipRecord lookup(const std::string& address) override;

private:
    RipeStatOptions opts_;
    net::HttpsClient client_;
};

/**
 * @brief Interpret a prefix-overview JSON document.
 *
 * Uses the first entry of data.asns; an empty list (unannounced space) or a
 * non-"ok" status yields a failed record.
 */
OwnershipRecord parse_ripestat_response(const std::string& body);

} // namespace hoptrace::asn
