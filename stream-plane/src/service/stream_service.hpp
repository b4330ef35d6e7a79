#pragma once
#include "jukebox/stream/v1/stream.grpc.pb.h"
#include "coordinator/queue_coordinator.hpp"

namespace jukebox::stream::service {

class StreamServiceImpl final : public jukebox::stream::v1::StreamService::Service {
public:
    explicit StreamServiceImpl(std::shared_ptr<coordinator::QueueCoordinator> coordinator);

    grpc::Status GetStatus(grpc::ServerContext* context,
                           const jukebox::stream::v1::GetStatusRequest* request,
                           jukebox::stream::v1::GetStatusResponse* response) override;

    grpc::Status SkipCurrent(grpc::ServerContext* context,
                             const jukebox::stream::v1::SkipCurrentRequest* request,
                             jukebox::stream::v1::SkipCurrentResponse* response) override;

    grpc::Status ReclaimStorage(grpc::ServerContext* context,
                                const jukebox::stream::v1::ReclaimStorageRequest* request,
                                jukebox::stream::v1::ReclaimStorageResponse* response) override;

    grpc::Status Health(grpc::ServerContext* context,
                        const jukebox::stream::v1::HealthRequest* request,
                        jukebox::stream::v1::HealthResponse* response) override;

private:
    std::shared_ptr<coordinator::QueueCoordinator> coordinator_;
};

} // namespace jukebox::stream::service
