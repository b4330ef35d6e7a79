#pragma once
#include <prometheus/registry.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/counter.h>
#include <memory>
#include <string>

namespace jukebox::stream::utils {

// Owned by the ServiceContext and handed to every component that reports.
// Construction only registers the metric families; Expose() starts serving them.
class Metrics {
public:
    Metrics();

    void Expose(const std::string& addr);
    std::shared_ptr<prometheus::Registry> registry() const { return registry_; }

    // Queue
    prometheus::Gauge& queue_depth();
    prometheus::Counter& items_total(const std::string& outcome);
    prometheus::Counter& item_retries_total();
    prometheus::Counter& acquisitions_total(const std::string& result);

    // Transcode sessions
    prometheus::Gauge& sessions_active();
    prometheus::Counter& sessions_started_total();
    prometheus::Counter& session_start_failures_total(const std::string& reason);
    prometheus::Counter& transcode_diagnostic_errors_total();
    prometheus::Counter& forced_kills_total();

    // Storage
    prometheus::Gauge& media_storage_bytes();
    prometheus::Counter& reclaim_bytes_total();
    prometheus::Counter& reclaim_failures_total();
    prometheus::Counter& reclaim_over_budget_total();

    prometheus::Counter& errors_total(const std::string& type);

private:
    std::shared_ptr<prometheus::Registry> registry_;
    std::unique_ptr<prometheus::Exposer> exposer_;

    prometheus::Gauge* queue_depth_ = nullptr;
    prometheus::Family<prometheus::Counter>* items_family_ = nullptr;
    prometheus::Counter* item_retries_total_ = nullptr;
    prometheus::Family<prometheus::Counter>* acquisitions_family_ = nullptr;

    prometheus::Gauge* sessions_active_ = nullptr;
    prometheus::Counter* sessions_started_total_ = nullptr;
    prometheus::Family<prometheus::Counter>* session_start_failures_family_ = nullptr;
    prometheus::Counter* transcode_diagnostic_errors_total_ = nullptr;
    prometheus::Counter* forced_kills_total_ = nullptr;

    prometheus::Gauge* media_storage_bytes_ = nullptr;
    prometheus::Counter* reclaim_bytes_total_ = nullptr;
    prometheus::Counter* reclaim_failures_total_ = nullptr;
    prometheus::Counter* reclaim_over_budget_total_ = nullptr;

    prometheus::Family<prometheus::Counter>* errors_family_ = nullptr;
};

} // namespace jukebox::stream::utils
