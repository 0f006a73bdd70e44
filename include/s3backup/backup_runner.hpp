#pragma once

#include "s3backup/upload_worker.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace s3backup {

class MetricsExporter;
class StorageClient;
struct RunConfig;

/// Aggregate counters for one run. Only the orchestrator thread mutates them.
struct RunStatistics {
    size_t candidates = 0;
    size_t uploaded = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t deleted = 0;
    uint64_t total_bytes = 0;

    void record(const UploadOutcome& outcome);
    void record_fault() { ++failed; }

    bool success() const { return failed == 0; }
};

struct RunnerOptions {
    std::filesystem::path backup_dir;
    std::set<std::string> extensions;
    int day_delta = 0;
    size_t max_workers = 1;
    WorkerOptions worker;
    std::string target;  // Store description for the run header

    static RunnerOptions from_config(const RunConfig& config, bool dry_run);
};

/// Orchestrates one run: select candidates, process them on a bounded
/// upload queue sharing one StorageClient, fold outcomes as they complete.
class BackupRunner {
public:
    BackupRunner(StorageClient& store, RunnerOptions options,
                 MetricsExporter* metrics = nullptr);

    RunStatistics run();
    RunStatistics run(std::chrono::system_clock::time_point now);

private:
    void log_header() const;
    void log_summary(const RunStatistics& stats) const;
    void export_metrics(const RunStatistics& stats) const;

    StorageClient& store_;
    RunnerOptions options_;
    MetricsExporter* metrics_;  // Not owned, may be null
};

}  // namespace s3backup
