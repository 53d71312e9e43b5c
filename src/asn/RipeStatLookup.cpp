// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/asn/OwnershipLookup.h"

#include "hoptrace/log/Log.h"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace hoptrace::asn {

RipeStatLookup::RipeStatLookup(RipeStatOptions opts)
    : opts_(std::move(opts)), client_(opts_.timeout) {}

OwnershipRecord RipeStatLookup::lookup(const std::string& address) {
    const std::string url = "https://" + opts_.host + ":" + std::to_string(opts_.port) +
                            "/data/prefix-overview/data.json?resource=" + address;
    net::HttpResponse resp;
    try {
        resp = client_.get(url);
    } catch (const net::HttpError& e) {
        HTLOG_WARN("ownership lookup for %s failed: %s", address.c_str(), e.what());
        OwnershipRecord rec;
        rec.error = e.what();
        return rec;
    }

    if (resp.status != 200) {
        HTLOG_WARN("ownership lookup for %s returned HTTP %ld", address.c_str(), resp.status);
        OwnershipRecord rec;
        rec.error = "HTTP " + std::to_string(resp.status);
        return rec;
    }

    OwnershipRecord rec = parse_ripestat_response(resp.body);
    if (!rec.ok) {
        HTLOG_DEBUG("no owner for %s: %s", address.c_str(), rec.error.c_str());
    }
    return rec;
}

OwnershipRecord parse_ripestat_response(const std::string& body) {
    OwnershipRecord rec;
    try {
        const auto doc = nlohmann::json::parse(body);
        const auto status = doc.value("status", std::string{});
        if (status != "ok") {
            rec.error = "status '" + status + "'";
            return rec;
        }
        const auto data = doc.find("data");
        if (data == doc.end() || !data->is_object()) {
            rec.error = "missing data object";
            return rec;
        }
        const auto asns = data->find("asns");
        if (asns == data->end() || !asns->is_array() || asns->empty()) {
            rec.error = "no announcing AS";
            return rec;
        }
        const auto& first = asns->front();
        if (first.contains("asn") && first.at("asn").is_number_unsigned()) {
            rec.asn = first.at("asn").get<uint32_t>();
        }
        if (first.contains("holder") && first.at("holder").is_string()) {
            auto holder = first.at("holder").get<std::string>();
            if (!holder.empty()) rec.description = std::move(holder);
        }
        if (!rec.asn && !rec.description) {
            rec.error = "AS entry carries neither number nor holder";
            return rec;
        }
        rec.ok = true;
    } catch (const nlohmann::json::exception& e) {
        rec.ok = false;
        rec.description.reset();
        rec.asn.reset();
        rec.error = std::string("bad JSON: ") + e.what();
    }
    return rec;
}

} // namespace hoptrace::asn
