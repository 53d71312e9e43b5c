// SPDX-License-Identifier: BSD-2-Clause

#include "hoptrace/app/core/RuntimeSetup.h"
#include "hoptrace/config/Config.h"
#include "hoptrace/grpc/TraceService.h"
#include "hoptrace/log/Log.h"
#include "hoptrace/net/HttpsClient.h"

#include <grpcpp/grpcpp.h>

#include <memory>
#include <optional>
#include <string>
#include <signal.h>
#include <thread>

namespace {

struct DaemonArgs {
    std::string config_path{"examples/configs/config_default.yaml"};
    std::optional<std::string> listen;
    std::optional<hoptrace::LogLevel> log_level;
};

DaemonArgs parse_args(int argc, char** argv) {
    DaemonArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-l" || arg == "--listen") && i + 1 < argc) {
            args.listen = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            args.log_level = hoptrace::parse_log_level(argv[++i]);
        }
    }
    return args;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);

    auto cfg = hoptrace::Config::from_file(args.config_path);
    if (!cfg) {
        HTLOG_WARN("Failed to load config at %s, using defaults", args.config_path.c_str());
        cfg = hoptrace::Config{};
    }

    auto lc = hoptrace::make_logger_config(*cfg);
    if (args.log_level) lc.level = *args.log_level;
    hoptrace::Logger::init(lc);

    const std::string listen = args.listen.value_or(cfg->daemon_listen);

    std::unique_ptr<hoptrace::net::CurlGlobal> curl;
    try {
        curl = std::make_unique<hoptrace::net::CurlGlobal>();
    } catch (const hoptrace::net::HttpError& e) {
        HTLOG_ERROR("%s", e.what());
        return 1;
    }

    hoptrace::AttributionRuntime attribution = hoptrace::make_attribution_runtime(*cfg);
    hoptrace::SystemHostResolver resolver;
    hoptrace::grpc_service::TraceServiceImpl service(*cfg, resolver, attribution.cache.get());

    // Block SIGINT/SIGTERM before gRPC spawns threads; a dedicated thread
    // sigwaits for them and shuts the server down.
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    ::grpc::ServerBuilder builder;
    builder.AddListeningPort(listen, ::grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<::grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        HTLOG_ERROR("Failed to start hoptraced gRPC server on %s", listen.c_str());
        return 1;
    }

    HTLOG_INFO("hoptraced listening on %s", listen.c_str());
    std::thread sig_thread([&]() {
        int sig = 0;
        if (sigwait(&set, &sig) == 0) {
            HTLOG_INFO("hoptraced received signal %d, shutting down...", sig);
            server->Shutdown();
        }
    });

    server->Wait();
    if (sig_thread.joinable()) sig_thread.join();

    HTLOG_INFO("hoptraced shutdown complete");
    return 0;
}
