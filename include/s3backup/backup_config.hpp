#pragma once

#include "s3backup/core/constants.hpp"
#include "s3backup/storage/client.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>

namespace s3backup {

/// Configuration for one backup run. Loaded from JSON, then overlaid with
/// command-line flags and environment credentials.
struct RunConfig {
    // Directory holding the backup archives
    std::filesystem::path backup_dir;

    // Accepted file suffixes, each starting with '.'
    std::set<std::string> extensions;

    // Only files created within the last day_delta days are candidates
    int day_delta = constants::DEFAULT_DAY_DELTA;

    bool delete_after_upload = true;

    // Concurrent file uploads
    int max_workers = static_cast<int>(constants::DEFAULT_MAX_WORKERS);

    // Transfer tuning
    int64_t multipart_threshold = static_cast<int64_t>(constants::DEFAULT_MULTIPART_THRESHOLD);
    int64_t multipart_chunk_size = static_cast<int64_t>(constants::DEFAULT_MULTIPART_CHUNK_SIZE);
    int max_retries = static_cast<int>(constants::DEFAULT_MAX_RETRIES);

    // Remote store
    StoreConfig store;

    // Daemon-style outputs
    std::filesystem::path log_file;
    std::filesystem::path metrics_file;  // e.g. /var/lib/node_exporter/textfile/s3backup.prom
    std::filesystem::path lock_file;
    bool verbose = false;

    /// Load configuration from a JSON file, overlaying onto current values.
    /// Prints the reason to stderr and returns false on error.
    bool load_json(const std::filesystem::path& path);

    /// Fill missing S3 credentials from AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY.
    void apply_env_credentials();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    TransferSettings transfer() const;

    /// Pretty JSON of the effective settings with credentials masked.
    std::string masked_dump() const;
};

/// Parse a comma-separated extension list (".7z, .gz,.zip").
std::set<std::string> parse_extension_list(const std::string& list);

/// Command-line options.
struct CliOptions {
    std::filesystem::path config_path = constants::DEFAULT_CONFIG_PATH;
    bool dry_run = false;
    bool verbose = false;
    std::filesystem::path log_file;
    std::filesystem::path metrics_file;
    bool show_help = false;

    /// Parse command line arguments.
    /// Returns empty optional on error (message on stderr).
    static std::optional<CliOptions> from_args(int argc, char* argv[]);

    static void print_usage(std::ostream& out);

    /// Load the config file, apply these flags and the environment, then validate.
    /// Returns empty optional on any configuration error (message on stderr).
    std::optional<RunConfig> load_run_config() const;
};

}  // namespace s3backup
