#include "chunkvault/metrics.hpp"
#include "chunkvault/chunk_engine.hpp"
#include "chunkvault/log.hpp"

#include <fstream>
#include <prometheus/family.h>
#include <prometheus/text_serializer.h>

namespace chunkvault {

namespace {

using Labels = std::map<std::string, std::string>;

// Upload and download latency, seconds
const prometheus::Histogram::BucketBoundaries kTransferBuckets{
    0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300};

prometheus::Family<prometheus::Counter>& counter_family(prometheus::Registry& registry,
                                                        const Labels& constant,
                                                        const std::string& name,
                                                        const std::string& help) {
    return prometheus::BuildCounter().Name(name).Help(help).Labels(constant).Register(registry);
}

prometheus::Counter& plain_counter(prometheus::Registry& registry, const Labels& constant,
                                   const std::string& name, const std::string& help) {
    return counter_family(registry, constant, name, help).Add({});
}

prometheus::Gauge& plain_gauge(prometheus::Registry& registry, const Labels& constant,
                               const std::string& name, const std::string& help) {
    return prometheus::BuildGauge().Name(name).Help(help).Labels(constant).Register(registry).Add({});
}

prometheus::Histogram& latency_histogram(prometheus::Registry& registry, const Labels& constant,
                                         const std::string& name, const std::string& help) {
    return prometheus::BuildHistogram()
        .Name(name)
        .Help(help)
        .Labels(constant)
        .Register(registry)
        .Add({}, kTransferBuckets);
}

}  // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {
    auto& reg = *registry_;

    // Operations, split by a "result" label
    auto& uploads = counter_family(reg, labels, "chunkvault_uploads_total",
                                   "Uploads by result");
    uploads_success_ = &uploads.Add({{"result", "success"}});
    uploads_failure_ = &uploads.Add({{"result", "failure"}});

    auto& downloads = counter_family(reg, labels, "chunkvault_downloads_total",
                                     "Downloads by result");
    downloads_success_ = &downloads.Add({{"result", "success"}});
    downloads_failure_ = &downloads.Add({{"result", "failure"}});

    auto& deletes = counter_family(reg, labels, "chunkvault_deletes_total",
                                   "File deletions by outcome");
    deletes_deleted_ = &deletes.Add({{"result", "deleted"}});
    deletes_partial_ = &deletes.Add({{"result", "partial"}});
    deletes_absent_ = &deletes.Add({{"result", "absent"}});

    auto& restores = counter_family(reg, labels, "chunkvault_restores_total",
                                    "Version restores by result");
    restores_success_ = &restores.Add({{"result", "success"}});
    restores_failure_ = &restores.Add({{"result", "failure"}});

    // Per-chunk backend traffic
    auto& chunk_puts = counter_family(reg, labels, "chunkvault_chunk_puts_total",
                                      "Chunk writes to backends");
    chunk_puts_success_ = &chunk_puts.Add({{"result", "success"}});
    chunk_puts_failure_ = &chunk_puts.Add({{"result", "failure"}});

    auto& chunk_gets = counter_family(reg, labels, "chunkvault_chunk_gets_total",
                                      "Chunk reads from backends");
    chunk_gets_success_ = &chunk_gets.Add({{"result", "success"}});
    chunk_gets_failure_ = &chunk_gets.Add({{"result", "failure"}});

    auto& cleanup = counter_family(reg, labels, "chunkvault_cleanup_deletions_total",
                                   "Chunk deletions issued while cleaning up failed uploads");
    cleanup_deleted_ = &cleanup.Add({{"result", "success"}});
    cleanup_failed_ = &cleanup.Add({{"result", "failure"}});

    upload_bytes_total_ = &plain_counter(reg, labels, "chunkvault_upload_bytes_total",
                                         "Bytes accepted by successful uploads");
    download_bytes_total_ = &plain_counter(reg, labels, "chunkvault_download_bytes_total",
                                           "Bytes downloaded and verified");
    integrity_failures_ = &plain_counter(reg, labels, "chunkvault_integrity_failures_total",
                                         "Chunks rejected by size or hash verification");

    backends_configured_ = &plain_gauge(reg, labels, "chunkvault_backends_configured",
                                        "Configured storage backends");
    files_total_ = &plain_gauge(reg, labels, "chunkvault_files_total",
                                "Files with a stored manifest");

    upload_duration_ = &latency_histogram(reg, labels, "chunkvault_upload_duration_seconds",
                                          "Upload wall time");
    download_duration_ = &latency_histogram(reg, labels, "chunkvault_download_duration_seconds",
                                            "Download wall time");
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    std::lock_guard lock(cv_mutex_);
    if (running_) return;
    running_ = true;
    writer_thread_ = std::thread([this] { writer_loop(); });
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (!was_running) return;

    cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();

    // Final snapshot, so short-lived runs still leave a file behind
    write_file();
}

void MetricsExporter::writer_loop() {
    std::unique_lock lock(cv_mutex_);
    while (!cv_.wait_for(lock, write_interval_, [this] { return !running_; })) {
        lock.unlock();
        write_file();
        lock.lock();
    }
}

void MetricsExporter::update_gauges() {
    if (!engine_) return;
    backends_configured_->Set(static_cast<double>(engine_->backend_count()));
    try {
        files_total_->Set(static_cast<double>(engine_->file_count()));
    } catch (const std::exception& e) {
        log_warn("Metrics: cannot count stored files: %s", e.what());
    }
}

void MetricsExporter::write_file() {
    std::lock_guard lock(write_mutex_);
    update_gauges();

    std::filesystem::path staging = prom_file_path_;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::out | std::ios::trunc);
        if (!out) {
            log_warn("Metrics: cannot open %s", staging.c_str());
            return;
        }
        out << prometheus::TextSerializer().Serialize(registry_->Collect());
        out.flush();
        if (!out) {
            log_warn("Metrics: failed writing %s", staging.c_str());
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, prom_file_path_, ec);
    if (ec) {
        log_warn("Metrics: cannot rename to %s: %s", prom_file_path_.c_str(),
                 ec.message().c_str());
        std::filesystem::remove(staging, ec);
    }
}

}  // namespace chunkvault
