#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace chunkvault {

class ChunkEngine;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports chunkvault metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Engine used for gauge snapshots (not owned).
    void set_engine(ChunkEngine* engine) { engine_ = engine; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread and write one final snapshot.
    /// No-op unless start() was called; the engine is not touched after.
    void stop();

    /// Serialize the registry now.
    void write_file();

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& deletes_deleted() { return *deletes_deleted_; }
    prometheus::Counter& deletes_partial() { return *deletes_partial_; }
    prometheus::Counter& deletes_absent() { return *deletes_absent_; }
    prometheus::Counter& restores_success() { return *restores_success_; }
    prometheus::Counter& restores_failure() { return *restores_failure_; }
    prometheus::Counter& chunk_puts_success() { return *chunk_puts_success_; }
    prometheus::Counter& chunk_puts_failure() { return *chunk_puts_failure_; }
    prometheus::Counter& chunk_gets_success() { return *chunk_gets_success_; }
    prometheus::Counter& chunk_gets_failure() { return *chunk_gets_failure_; }
    prometheus::Counter& integrity_failures() { return *integrity_failures_; }
    prometheus::Counter& cleanup_deleted() { return *cleanup_deleted_; }
    prometheus::Counter& cleanup_failed() { return *cleanup_failed_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointer for gauge snapshots (not owned)
    ChunkEngine* engine_ = nullptr;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* deletes_deleted_;
    prometheus::Counter* deletes_partial_;
    prometheus::Counter* deletes_absent_;
    prometheus::Counter* restores_success_;
    prometheus::Counter* restores_failure_;
    prometheus::Counter* chunk_puts_success_;
    prometheus::Counter* chunk_puts_failure_;
    prometheus::Counter* chunk_gets_success_;
    prometheus::Counter* chunk_gets_failure_;
    prometheus::Counter* integrity_failures_;
    prometheus::Counter* cleanup_deleted_;
    prometheus::Counter* cleanup_failed_;

    // --- Gauges ---
    prometheus::Gauge* backends_configured_;
    prometheus::Gauge* files_total_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::mutex write_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace chunkvault
