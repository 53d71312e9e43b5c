// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/asn/OwnershipLookup.h"
#include "hoptrace/probe/ProbeChannel.h"
#include "hoptrace/trace/HostResolver.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace hoptrace::testing {

// One scripted answer; an empty responder means the probe times out.
struct ScriptedReply {
    std::string responder;
    OutcomeKind kind{OutcomeKind::Timeout};
    double rtt_ms = 0.0;
};

inline ScriptedReply silent() { return {}; }
inline ScriptedReply hop(const std::string& addr, double rtt) {
    return {addr, OutcomeKind::TimeExceeded, rtt};
}
inline ScriptedReply echo(const std::string& addr, double rtt) {
    return {addr, OutcomeKind::EchoReply, rtt};
}
inline ScriptedReply unreachable(const std::string& addr, double rtt) {
    return {addr, OutcomeKind::DestUnreachable, rtt};
}

/**
 * Answers probes from a per-hop script indexed by attempt. Hops or attempts
 * without a script time out.
 */
struct ChannelScript {
    std::map<int, std::vector<ScriptedReply>> hops;
    int fail_send_at_hop = 0;              // >0: send() throws at that hop.
    std::vector<Probe> sent;               // Every probe, in issuance order.
};

class ScriptedChannel final : public ProbeChannel {
public:
    explicit ScriptedChannel(std::shared_ptr<ChannelScript> script) : script_(std::move(script)) {}

    Probe send(const std::string& destination,
               int hop_limit,
               uint16_t sequence,
               ProtocolVariant variant,
               int attempt) override {
        if (script_->fail_send_at_hop > 0 && hop_limit == script_->fail_send_at_hop) {
            throw SendFailure("sendto: Network is unreachable");
        }
        Probe p;
        p.destination = destination;
        p.hop_limit = hop_limit;
        p.sequence = sequence;
        p.attempt = attempt;
        p.variant = variant;
        p.sent_at = Clock::now();
        p.udp_dest_port = static_cast<uint16_t>(33434 + attempt);
        script_->sent.push_back(p);
        return p;
    }

    ProbeOutcome await_reply(const Probe& probe, std::chrono::milliseconds) override {
        auto it = script_->hops.find(probe.hop_limit);
        if (it == script_->hops.end() ||
            probe.attempt >= static_cast<int>(it->second.size())) {
            return ProbeOutcome::timeout(probe);
        }
        const auto& r = it->second[static_cast<std::size_t>(probe.attempt)];
        if (r.responder.empty()) {
            return ProbeOutcome::timeout(probe);
        }
        return ProbeOutcome::reply(probe, r.kind, r.responder, r.rtt_ms);
    }

private:
    std::shared_ptr<ChannelScript> script_;
};

inline std::function<std::unique_ptr<ProbeChannel>(const ProbeSettings&)>
scripted_factory(std::shared_ptr<ChannelScript> script) {
    return [script](const ProbeSettings&) -> std::unique_ptr<ProbeChannel> {
        return std::make_unique<ScriptedChannel>(script);
    };
}

class FakeResolver final : public HostResolver {
public:
    std::map<std::string, std::string> names;

    std::string resolve(const std::string& host) override {
        auto it = names.find(host);
        if (it != names.end()) return it->second;
        throw ResolutionFailure("could not resolve " + host + ": Name or service not known");
    }
};

class FakeLookup final : public asn::OwnershipLookup {
public:
    asn::OwnershipRecord lookup(const std::string& address) override {
        calls.fetch_add(1);
        std::lock_guard<std::mutex> lk(mtx);
        auto it = records.find(address);
        if (it == records.end()) {
            asn::OwnershipRecord rec;
            rec.error = "no announcing AS";
            return rec;
        }
        return it->second;
    }

    void set(const std::string& address, const std::string& holder, uint32_t asn) {
        std::lock_guard<std::mutex> lk(mtx);
        asn::OwnershipRecord rec;
        rec.ok = true;
        if (!holder.empty()) rec.description = holder;
        rec.asn = asn;
        records[address] = rec;
    }

    std::atomic<int> calls{0};
    std::mutex mtx;
    std::map<std::string, asn::OwnershipRecord> records;
};

} // namespace hoptrace::testing
