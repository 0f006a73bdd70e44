#include "s3backup/backup_runner.hpp"
#include "s3backup/backup_config.hpp"
#include "s3backup/core/log.hpp"
#include "s3backup/metrics.hpp"
#include "s3backup/storage/client.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace s3backup {

namespace {

const std::string kRule(80, '=');

// One finished task. fault holds the message when the worker threw.
struct Completion {
    size_t index = 0;
    std::optional<UploadOutcome> outcome;
    std::string fault;
};

// Finished tasks, in completion order.
class CompletionChannel {
public:
    void push(Completion done) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_.push_back(std::move(done));
        }
        cv_.notify_one();
    }

    Completion pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !done_.empty(); });
        Completion done = std::move(done_.front());
        done_.pop_front();
        return done;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Completion> done_;
};

// Candidate indices drained by a fixed set of upload threads.
// The destructor finishes queued work, then joins.
class UploadQueue {
public:
    using Task = std::function<void(size_t)>;

    UploadQueue(size_t num_threads, Task task)
        : task_(std::move(task)) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&UploadQueue::upload_worker, this);
        }
    }

    ~UploadQueue() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }

    UploadQueue(const UploadQueue&) = delete;
    UploadQueue& operator=(const UploadQueue&) = delete;

    void push(size_t index) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push(index);
        }
        cv_.notify_one();
    }

private:
    void upload_worker() {
        while (true) {
            size_t index;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !pending_.empty() || shutdown_; });
                if (shutdown_ && pending_.empty()) return;
                index = pending_.front();
                pending_.pop();
            }
            task_(index);
        }
    }

    Task task_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<size_t> pending_;
    bool shutdown_ = false;
    std::vector<std::thread> workers_;
};

double to_mb(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}  // namespace

// --- RunStatistics ---

void RunStatistics::record(const UploadOutcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Uploaded:
            ++uploaded;
            total_bytes += outcome.bytes;
            if (outcome.deleted) ++deleted;
            break;
        case OutcomeKind::SkippedExisting:
        case OutcomeKind::WouldUpload:
            ++skipped;
            break;
        case OutcomeKind::VerificationFailed:
        case OutcomeKind::TransferFailed:
            ++failed;
            break;
    }
}

// --- RunnerOptions ---

RunnerOptions RunnerOptions::from_config(const RunConfig& config, bool dry_run) {
    RunnerOptions options;
    options.backup_dir = config.backup_dir;
    options.extensions = config.extensions;
    options.day_delta = config.day_delta;
    options.max_workers = static_cast<size_t>(config.max_workers);
    options.worker.dry_run = dry_run;
    options.worker.delete_after_upload = config.delete_after_upload;
    options.worker.storage_class = config.store.storage_class;
    options.target = config.store.describe();
    return options;
}

// --- BackupRunner ---

BackupRunner::BackupRunner(StorageClient& store, RunnerOptions options,
                           MetricsExporter* metrics)
    : store_(store)
    , options_(std::move(options))
    , metrics_(metrics) {}

RunStatistics BackupRunner::run() {
    return run(std::chrono::system_clock::now());
}

RunStatistics BackupRunner::run(std::chrono::system_clock::time_point now) {
    std::optional<ScopedTimer> run_timer;
    if (metrics_ && !options_.worker.dry_run) run_timer.emplace(metrics_->run_duration());

    RunStatistics stats;
    log_header();

    FileSelector selector(options_.backup_dir, options_.extensions, options_.day_delta);
    auto candidates = selector.select(now).value_or(std::vector<CandidateFile>{});
    stats.candidates = candidates.size();

    if (candidates.empty()) {
        log_info("No files to upload");
        log_summary(stats);
        export_metrics(stats);
        return stats;
    }

    uint64_t total_size = 0;
    for (const auto& c : candidates) total_size += c.size;
    log_info("Found %zu file(s) to upload", candidates.size());
    log_info("Total size: %.2f MB", to_mb(total_size));

    UploadWorker worker(store_, options_.worker);
    CompletionChannel channel;

    auto process = [&worker, &candidates, &channel](size_t i) {
        Completion done;
        done.index = i;
        try {
            done.outcome = worker.process(candidates[i]);
        } catch (const std::exception& e) {
            done.fault = e.what();
        } catch (...) {
            done.fault = "unknown exception";
        }
        channel.push(std::move(done));
    };

    {
        UploadQueue queue(std::min(options_.max_workers, candidates.size()), process);
        for (size_t i = 0; i < candidates.size(); ++i) {
            queue.push(i);
        }

        for (size_t n = 0; n < candidates.size(); ++n) {
            Completion done = channel.pop();
            if (!done.outcome) {
                log_error("Unexpected error processing %s: %s",
                          candidates[done.index].path.c_str(), done.fault.c_str());
                stats.record_fault();
                continue;
            }
            stats.record(*done.outcome);
            if (metrics_ && done.outcome->kind == OutcomeKind::Uploaded) {
                metrics_->upload_duration().Observe(done.outcome->duration_seconds);
            }
        }
    }

    log_summary(stats);
    export_metrics(stats);
    return stats;
}

void BackupRunner::log_header() const {
    log_info("%s", kRule.c_str());
    log_info("Starting backup upload");
    if (options_.worker.dry_run) {
        log_info("DRY-RUN mode: no files will be uploaded or deleted");
    }
    log_info("Store: %s", options_.target.c_str());
    log_info("Source: %s", options_.backup_dir.c_str());
    log_info("%s", kRule.c_str());
}

void BackupRunner::log_summary(const RunStatistics& stats) const {
    log_info("%s", kRule.c_str());
    log_info("Run summary:");
    log_info("  Uploaded:    %zu", stats.uploaded);
    log_info("  Skipped:     %zu", stats.skipped);
    log_info("  Failed:      %zu", stats.failed);
    log_info("  Deleted:     %zu", stats.deleted);
    log_info("  Transferred: %.2f MB", to_mb(stats.total_bytes));
    log_info("%s", kRule.c_str());
}

void BackupRunner::export_metrics(const RunStatistics& stats) const {
    // A dry run must not look like a completed backup to alerting
    if (!metrics_ || options_.worker.dry_run) return;

    metrics_->files_uploaded().Increment(static_cast<double>(stats.uploaded));
    metrics_->files_skipped().Increment(static_cast<double>(stats.skipped));
    metrics_->files_failed().Increment(static_cast<double>(stats.failed));
    metrics_->deleted_total().Increment(static_cast<double>(stats.deleted));
    metrics_->upload_bytes_total().Increment(static_cast<double>(stats.total_bytes));
    metrics_->candidates().Set(static_cast<double>(stats.candidates));
    metrics_->last_run_success().Set(stats.success() ? 1.0 : 0.0);
    metrics_->last_run_timestamp().SetToCurrentTime();
}

}  // namespace s3backup
