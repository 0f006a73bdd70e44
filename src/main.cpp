#include "s3backup/backup_config.hpp"
#include "s3backup/backup_runner.hpp"
#include "s3backup/core/log.hpp"
#include "s3backup/metrics.hpp"
#include "s3backup/run_lock.hpp"
#include "s3backup/storage/client.hpp"

#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    using namespace s3backup;

    auto options = CliOptions::from_args(argc, argv);
    if (!options) {
        CliOptions::print_usage(std::cerr);
        return 1;
    }
    if (options->show_help) {
        CliOptions::print_usage(std::cout);
        return 0;
    }

    auto config_opt = options->load_run_config();
    if (!config_opt) {
        return 1;
    }
    const RunConfig config = std::move(*config_opt);

    set_log_verbose(config.verbose);

    // Redirect log output if log file specified
    if (!config.log_file.empty() && !redirect_log_output(config.log_file)) {
        log_warn("Cannot open log file %s, logging to terminal", config.log_file.c_str());
    }

    // A peer closing mid-PUT must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    RunLock lock(config.lock_file);
    if (!config.lock_file.empty() && !lock.try_acquire()) {
        log_error("Not starting: %s", lock.error().c_str());
        return 1;
    }

    try {
        if (config.verbose) {
            log_debug("Effective configuration:\n%s", config.masked_dump().c_str());
        }

        auto store = make_storage_client(config.store, config.transfer());

        std::unique_ptr<MetricsExporter> metrics;
        if (!config.metrics_file.empty() && !options->dry_run) {
            std::map<std::string, std::string> labels = {{"store", config.store.type}};
            if (!config.store.bucket.empty()) labels["bucket"] = config.store.bucket;
            metrics = std::make_unique<MetricsExporter>(config.metrics_file, labels);
        }

        BackupRunner runner(*store, RunnerOptions::from_config(config, options->dry_run),
                            metrics.get());
        auto stats = runner.run();

        if (metrics && !metrics->write_file()) {
            log_warn("Metrics for this run were not exported");
        }
        return stats.success() ? 0 : 1;
    } catch (const std::exception& e) {
        log_error("Fatal error: %s", e.what());
        return 1;
    }
}
