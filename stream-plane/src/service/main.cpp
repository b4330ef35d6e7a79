#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include <gst/gst.h>
#include <spdlog/spdlog.h>
#include "acquisition/gst_media_acquirer.hpp"
#include "coordinator/queue_coordinator.hpp"
#include "queue/board_queue_source.hpp"
#include "service/service_context.hpp"
#include "service/stream_service.hpp"
#include "storage/active_asset_registry.hpp"
#include "storage/storage_reclaimer.hpp"
#include "transcode/posix_process.hpp"
#include "transcode/transcode_supervisor.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"

using namespace jukebox::stream;

namespace {

std::atomic<bool> g_shutdown{false};

void OnSignal(int /*signo*/) {
    g_shutdown = true;
}

int Run(service::ServiceContext& ctx) {
    const service::Config& cfg = ctx.config;

    ctx.metrics = std::make_shared<utils::Metrics>();
    if (!cfg.metrics_addr.empty()) {
        ctx.metrics->Expose(cfg.metrics_addr);
    }

    ctx.active_asset = std::make_shared<storage::ActiveAssetRegistry>();

    auto board = std::make_shared<queue::BoardQueueSource>(cfg.board_path);
    board->RecoverOrphans();
    ctx.queue_source = board;

    ctx.acquirer = std::make_shared<acquisition::GstMediaAcquirer>(cfg.ToAcquirerConfig(), *ctx.metrics);

    transcode::PosixProcessFactory process_factory;
    transcode::TranscodeSupervisor supervisor(cfg.ToSupervisorConfig(), process_factory, *ctx.active_asset,
                                              *ctx.metrics);
    storage::StorageReclaimer reclaimer(cfg.ToReclaimConfig(), *ctx.active_asset, *ctx.metrics);

    auto coordinator = std::make_shared<coordinator::QueueCoordinator>(
        cfg.ToCoordinatorConfig(), *ctx.queue_source, *ctx.acquirer, supervisor, reclaimer, *ctx.active_asset,
        *ctx.metrics);

    service::StreamServiceImpl service(coordinator);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(cfg.grpc_addr, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("Failed to start gRPC server on {}", cfg.grpc_addr);
        return 1;
    }

    coordinator->Start();
    spdlog::info("Stream plane is running");

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);
    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutdown requested");
    server->Shutdown();
    coordinator->Stop();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    service::ServiceContext ctx;
    try {
        ctx.config = service::Config::LoadFromEnv();
        ctx.config.ApplyArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Configuration error: " << e.what() << "\n\n" << service::Config::Usage();
        return 1;
    }

    if (ctx.config.help) {
        std::cout << service::Config::Usage();
        return 0;
    }

    // Initialize GStreamer
    gst_init(&argc, &argv);

    utils::Logger::Init(ctx.config.log_level, ctx.config.log_file);

    spdlog::info("Starting Jukebox Stream Plane");
    spdlog::info("Board: {}, media: {}, HLS: {}", ctx.config.board_path, ctx.config.media_dir, ctx.config.hls_dir);
    spdlog::info("gRPC address: {}", ctx.config.grpc_addr);
    spdlog::info("Metrics address: {}", ctx.config.metrics_addr);
    spdlog::info("Storage budget: {} MB", ctx.config.max_storage_mb);

    try {
        return Run(ctx);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
}
