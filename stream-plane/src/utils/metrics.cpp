#include "metrics.hpp"

namespace jukebox::stream::utils {

Metrics::Metrics() : registry_(std::make_shared<prometheus::Registry>()) {
    queue_depth_ = &prometheus::BuildGauge()
                        .Name("jukebox_queue_depth")
                        .Help("Number of eligible items seen on the last queue refresh")
                        .Register(*registry_)
                        .Add({});

    items_family_ = &prometheus::BuildCounter()
                         .Name("jukebox_items_total")
                         .Help("Queue items finished, by outcome")
                         .Register(*registry_);

    item_retries_total_ = &prometheus::BuildCounter()
                               .Name("jukebox_item_retries_total")
                               .Help("Queue items returned to the queue after a failed attempt")
                               .Register(*registry_)
                               .Add({});

    acquisitions_family_ = &prometheus::BuildCounter()
                                .Name("jukebox_acquisitions_total")
                                .Help("Attachment downloads, by result")
                                .Register(*registry_);

    sessions_active_ = &prometheus::BuildGauge()
                            .Name("jukebox_sessions_active")
                            .Help("Number of active transcode sessions (0 or 1)")
                            .Register(*registry_)
                            .Add({});

    sessions_started_total_ = &prometheus::BuildCounter()
                                   .Name("jukebox_sessions_started_total")
                                   .Help("Transcode sessions that passed verification")
                                   .Register(*registry_)
                                   .Add({});

    session_start_failures_family_ = &prometheus::BuildCounter()
                                          .Name("jukebox_session_start_failures_total")
                                          .Help("Transcode sessions that failed to start, by reason")
                                          .Register(*registry_);

    transcode_diagnostic_errors_total_ = &prometheus::BuildCounter()
                                              .Name("jukebox_transcode_diagnostic_errors_total")
                                              .Help("Error lines seen on the transcoder diagnostic stream")
                                              .Register(*registry_)
                                              .Add({});

    forced_kills_total_ = &prometheus::BuildCounter()
                               .Name("jukebox_transcode_forced_kills_total")
                               .Help("Transcoder processes killed after the grace period")
                               .Register(*registry_)
                               .Add({});

    media_storage_bytes_ = &prometheus::BuildGauge()
                                .Name("jukebox_media_storage_bytes")
                                .Help("Bytes used by the media directory at the last reclaim pass")
                                .Register(*registry_)
                                .Add({});

    reclaim_bytes_total_ = &prometheus::BuildCounter()
                                .Name("jukebox_reclaim_bytes_total")
                                .Help("Total bytes reclaimed from the media directory")
                                .Register(*registry_)
                                .Add({});

    reclaim_failures_total_ = &prometheus::BuildCounter()
                                   .Name("jukebox_reclaim_failures_total")
                                   .Help("Media files that could not be deleted")
                                   .Register(*registry_)
                                   .Add({});

    reclaim_over_budget_total_ = &prometheus::BuildCounter()
                                      .Name("jukebox_reclaim_over_budget_total")
                                      .Help("Reclaim passes that ended over the storage budget")
                                      .Register(*registry_)
                                      .Add({});

    errors_family_ = &prometheus::BuildCounter()
                          .Name("jukebox_errors_total")
                          .Help("Total number of errors by type")
                          .Register(*registry_);
}

void Metrics::Expose(const std::string& addr) {
    if (exposer_) return;
    exposer_ = std::make_unique<prometheus::Exposer>(addr);
    exposer_->RegisterCollectable(registry_);
}

prometheus::Gauge& Metrics::queue_depth() { return *queue_depth_; }

prometheus::Counter& Metrics::items_total(const std::string& outcome) {
    return items_family_->Add({{"outcome", outcome}});
}

prometheus::Counter& Metrics::item_retries_total() { return *item_retries_total_; }

prometheus::Counter& Metrics::acquisitions_total(const std::string& result) {
    return acquisitions_family_->Add({{"result", result}});
}

prometheus::Gauge& Metrics::sessions_active() { return *sessions_active_; }
prometheus::Counter& Metrics::sessions_started_total() { return *sessions_started_total_; }

prometheus::Counter& Metrics::session_start_failures_total(const std::string& reason) {
    return session_start_failures_family_->Add({{"reason", reason}});
}

prometheus::Counter& Metrics::transcode_diagnostic_errors_total() { return *transcode_diagnostic_errors_total_; }
prometheus::Counter& Metrics::forced_kills_total() { return *forced_kills_total_; }

prometheus::Gauge& Metrics::media_storage_bytes() { return *media_storage_bytes_; }
prometheus::Counter& Metrics::reclaim_bytes_total() { return *reclaim_bytes_total_; }
prometheus::Counter& Metrics::reclaim_failures_total() { return *reclaim_failures_total_; }
prometheus::Counter& Metrics::reclaim_over_budget_total() { return *reclaim_over_budget_total_; }

prometheus::Counter& Metrics::errors_total(const std::string& type) {
    return errors_family_->Add({{"type", type}});
}

} // namespace jukebox::stream::utils
