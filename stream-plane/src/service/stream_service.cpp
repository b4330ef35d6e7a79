#include "service/stream_service.hpp"
#include "transcode/session_fsm.hpp"
#include <spdlog/spdlog.h>

namespace jukebox::stream::service {

StreamServiceImpl::StreamServiceImpl(std::shared_ptr<coordinator::QueueCoordinator> coordinator)
    : coordinator_(coordinator) {}

grpc::Status StreamServiceImpl::GetStatus(grpc::ServerContext* /*context*/,
                                          const jukebox::stream::v1::GetStatusRequest* /*request*/,
                                          jukebox::stream::v1::GetStatusResponse* response) {
    auto status = coordinator_->GetStatus();

    response->set_running(status.running);
    response->set_session_state(transcode::SessionFSM::StateToString(status.session_state));
    response->set_queue_depth(static_cast<int64_t>(status.queue_depth));
    if (status.media_path) {
        response->set_media_file(status.media_path->filename().string());
    }

    if (status.current) {
        auto* item = response->mutable_current();
        item->set_id(status.current->id);
        item->set_name(status.current->name);
        item->set_state(queue::ItemStateToString(status.current->state));
        item->set_attempts(status.current->attempts);
    }

    if (status.last_reclaim) {
        response->set_last_reclaim_bytes_after(status.last_reclaim->bytes_after);
        response->set_last_reclaim_over_budget(status.last_reclaim->over_budget);
    }

    return grpc::Status::OK;
}

grpc::Status StreamServiceImpl::SkipCurrent(grpc::ServerContext* /*context*/,
                                            const jukebox::stream::v1::SkipCurrentRequest* /*request*/,
                                            jukebox::stream::v1::SkipCurrentResponse* response) {
    if (!coordinator_->SkipCurrent()) {
        return grpc::Status(grpc::FAILED_PRECONDITION, "Nothing is playing");
    }
    response->set_skipped(true);
    return grpc::Status::OK;
}

grpc::Status StreamServiceImpl::ReclaimStorage(grpc::ServerContext* /*context*/,
                                               const jukebox::stream::v1::ReclaimStorageRequest* /*request*/,
                                               jukebox::stream::v1::ReclaimStorageResponse* response) {
    storage::ReclaimReport report;
    try {
        report = coordinator_->ReclaimNow();
    } catch (const std::exception& e) {
        spdlog::error("ReclaimStorage failed: {}", e.what());
        return grpc::Status(grpc::INTERNAL, e.what());
    }

    response->set_bytes_before(report.bytes_before);
    response->set_bytes_after(report.bytes_after);
    response->set_files_deleted(report.files_deleted);
    response->set_delete_failures(report.delete_failures);
    response->set_over_budget(report.over_budget);
    return grpc::Status::OK;
}

grpc::Status StreamServiceImpl::Health(grpc::ServerContext* /*context*/,
                                       const jukebox::stream::v1::HealthRequest* /*request*/,
                                       jukebox::stream::v1::HealthResponse* response) {
    bool running = coordinator_->GetStatus().running;
    response->set_ok(running);
    response->set_status(running ? "OK" : "STOPPED");
    return grpc::Status::OK;
}

} // namespace jukebox::stream::service
