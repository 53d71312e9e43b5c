// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "hoptrace/config/Config.h"
#include "hoptrace/trace/PathTracer.h"
#include "hoptrace.grpc.pb.h"

#include <string>

namespace hoptrace {
namespace asn {
class AsAttributionCache;
}

namespace grpc_service {

/**
 * @brief gRPC control service running traces in-process.
 *
 * Every RPC runs on a gRPC worker thread; concurrent Trace calls each get
 * their own channel and share only the attribution cache.
 */
class TraceServiceImpl final :
    public hoptrace::api::TraceService::Service {
public:
    /**
     * @param defaults Config applied when request fields are unset.
     * @param resolver Forward lookup shared by all requests; must be thread-safe.
     * @param cache    Shared attribution cache, nullptr when disabled.
     * @param factory  Transport factory for each trace.
     */
    TraceServiceImpl(const Config& defaults,
                     HostResolver& resolver,
                     asn::AsAttributionCache* cache,
                     ChannelFactory factory = make_raw_probe_channel);

    /**
     * @brief Run one trace.
     *
     * Client cancellation and the call deadline end the trace as CANCELLED at
     * the next hop boundary. Per-destination failures are reported in the
     * response with status OK; only malformed requests fail the RPC.
     */
    ::grpc::Status Trace(::grpc::ServerContext* context,
                         const hoptrace::api::TraceRequest* request,
                         hoptrace::api::TraceResponse* response) override;

    ::grpc::Status Attribute(::grpc::ServerContext* context,
                             const hoptrace::api::AttributeRequest* request,
                             hoptrace::api::AttributeResponse* response) override;

    /// Request fields merged over the configured defaults.
    /// @return INVALID_ARGUMENT status text in @p error on bad input.
    bool make_options(const hoptrace::api::TraceRequest& req,
                      TraceOptions& opts,
                      std::string& error) const;

private:
    Config defaults_{};
    asn::AsAttributionCache* cache_;
    PathTracer tracer_;
};

/// Copy a sealed result into the wire message.
void fill_response(const PathResult& result,
                   const std::string& source_region,
                   hoptrace::api::TraceResponse& response);

} // namespace grpc_service
} // namespace hoptrace
