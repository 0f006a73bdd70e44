#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace s3backup {

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

/// Exports backup run metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. The file is written
/// once per run with atomic temp+rename, so the collector never reads a
/// partial file.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    const std::map<std::string, std::string>& labels);

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    // --- Counter accessors ---
    prometheus::Counter& files_uploaded() { return *files_uploaded_; }
    prometheus::Counter& files_skipped() { return *files_skipped_; }
    prometheus::Counter& files_failed() { return *files_failed_; }
    prometheus::Counter& deleted_total() { return *deleted_total_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }

    // --- Gauge accessors ---
    prometheus::Gauge& candidates() { return *candidates_; }
    prometheus::Gauge& last_run_success() { return *last_run_success_; }
    prometheus::Gauge& last_run_timestamp() { return *last_run_timestamp_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& run_duration() { return *run_duration_; }

    /// Text exposition of the current registry.
    std::string serialize() const;

    /// Write the .prom file. Returns false if it could not be written.
    bool write_file() const;

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    std::filesystem::path prom_file_path_;
    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* files_uploaded_;
    prometheus::Counter* files_skipped_;
    prometheus::Counter* files_failed_;
    prometheus::Counter* deleted_total_;
    prometheus::Counter* upload_bytes_total_;

    // --- Gauges ---
    prometheus::Gauge* candidates_;
    prometheus::Gauge* last_run_success_;
    prometheus::Gauge* last_run_timestamp_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* run_duration_;
};

}  // namespace s3backup
