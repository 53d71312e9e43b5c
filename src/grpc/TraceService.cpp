// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/grpc/TraceService.h"

#include "hoptrace/app/core/BatchRunner.h"
#include "hoptrace/asn/AsAttributionCache.h"
#include "hoptrace/log/Log.h"
#include "hoptrace/net/Ipv4.h"
#include "hoptrace/sink/PathResultSink.h"

#include <grpcpp/grpcpp.h>

#include <utility>

namespace hoptrace::grpc_service {

TraceServiceImpl::TraceServiceImpl(const Config& defaults,
                                   HostResolver& resolver,
                                   asn::AsAttributionCache* cache,
                                   ChannelFactory factory)
    : defaults_(defaults), cache_(cache), tracer_(resolver, cache, std::move(factory)) {}

bool TraceServiceImpl::make_options(const hoptrace::api::TraceRequest& req,
                                    TraceOptions& opts,
                                    std::string& error) const {
    opts = make_trace_options(defaults_);

    if (req.has_protocol()) {
        auto variant = parse_protocol(req.protocol());
        if (!variant) {
            error = "unknown protocol '" + req.protocol() + "'";
            return false;
        }
        opts.variant = *variant;
    }
    if (req.has_max_hops()) {
        if (req.max_hops() < 1 || req.max_hops() > 255) {
            error = "max_hops must be within 1..255";
            return false;
        }
        opts.max_hops = static_cast<int>(req.max_hops());
    }
    if (req.has_probes_per_hop()) {
        if (req.probes_per_hop() < 1 || req.probes_per_hop() > 10) {
            error = "probes_per_hop must be within 1..10";
            return false;
        }
        opts.probes_per_hop = static_cast<int>(req.probes_per_hop());
    }
    if (req.has_timeout_ms()) {
        if (req.timeout_ms() == 0) {
            error = "timeout_ms must be positive";
            return false;
        }
        opts.timeout = std::chrono::milliseconds(req.timeout_ms());
    }
    if (opts.variant == ProtocolVariant::Udp &&
        !udp_ports_fit(opts.udp_base_port, opts.probes_per_hop)) {
        error = "udp_base_port + probes_per_hop - 1 exceeds 65535";
        return false;
    }
    if (req.has_attribute()) {
        opts.attribute = req.attribute();
    }
    return true;
}

void fill_response(const PathResult& result,
                   const std::string& source_region,
                   hoptrace::api::TraceResponse& response) {
    response.set_destination(result.destination);
    response.set_resolved_address(result.resolved_address);
    response.set_success(result.success);
    response.set_terminal_reason(result.terminal_reason ? to_string(*result.terminal_reason) : "");
    response.set_error(result.error);

    for (const auto& hop : result.hops) {
        auto* h = response.add_hops();
        h->set_hop_limit(static_cast<uint32_t>(hop.hop_limit));
        h->set_resolved(hop.resolved);
        h->set_address(hop.representative_address);
        if (hop.representative_latency_ms) {
            h->set_rtt_ms(*hop.representative_latency_ms);
        }
        for (const auto& o : hop.outcomes) {
            auto* p = h->add_probes();
            p->set_kind(to_string(o.kind));
            if (!o.timed_out()) {
                p->set_responder(*o.responder);
                p->set_rtt_ms(*o.rtt_ms);
            }
        }
    }
    for (const auto& label : result.as_path) {
        response.add_as_path(label);
    }
    if (result.average_latency_ms) {
        response.set_average_latency_ms(*result.average_latency_ms);
    }
    response.set_json_summary(sink::to_json(result, source_region).dump());
}

::grpc::Status TraceServiceImpl::Trace(::grpc::ServerContext* context,
                                       const hoptrace::api::TraceRequest* request,
                                       hoptrace::api::TraceResponse* response) {
    if (!request || request->destination().empty()) {
        return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "missing destination");
    }

    TraceOptions opts;
    std::string error;
    if (!make_options(*request, opts, error)) {
        return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, error);
    }
    if (context) {
        // IsCancelled() also turns true once the client deadline passes.
        opts.should_stop = [context]() { return context->IsCancelled(); };
    }

    HTLOG_INFO("[grpc_trace] destination=%s protocol=%s max_hops=%d probes=%d",
               request->destination().c_str(), to_string(opts.variant),
               opts.max_hops, opts.probes_per_hop);

    const PathResult result = tracer_.trace(request->destination(), opts);
    fill_response(result, defaults_.output.source_region, *response);

    HTLOG_INFO("[grpc_trace_end] destination=%s reason=%s hops=%zu",
               request->destination().c_str(), response->terminal_reason().c_str(),
               result.hops.size());
    return ::grpc::Status::OK;
}

::grpc::Status TraceServiceImpl::Attribute(::grpc::ServerContext*,
                                           const hoptrace::api::AttributeRequest* request,
                                           hoptrace::api::AttributeResponse* response) {
    if (!request || !net::parse_ipv4_host(request->address())) {
        return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "address must be a dotted-quad IPv4 literal");
    }
    if (!cache_) {
        return ::grpc::Status(::grpc::StatusCode::FAILED_PRECONDITION, "attribution is disabled");
    }

    const auto outcome = cache_->attribute(request->address());
    response->set_address(request->address());
    response->set_label(outcome.label);
    response->set_resolved(outcome.resolved);
    response->set_from_cache(outcome.from_cache);
    return ::grpc::Status::OK;
}

} // namespace hoptrace::grpc_service
