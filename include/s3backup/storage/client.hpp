#pragma once

#include "s3backup/core/constants.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace s3backup {

// Failure of a remote store operation. status() is the HTTP status when the
// store answered, 0 for transport or local I/O failures.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

struct ExistsResult {
    bool found = false;
    std::optional<std::string> etag;
};

// Metadata about a stored object
struct ObjectMetadata {
    std::string etag;  // As returned by the store, possibly quoted
    uint64_t content_length = 0;
    std::string storage_class;
    std::map<std::string, std::string> user_metadata;
};

// Options for upload operations
struct UploadOptions {
    std::map<std::string, std::string> metadata;  // Sent as x-amz-meta-<name>
    std::string storage_class;
};

/// Connection settings for the remote store ("s3" section of the config).
struct StoreConfig {
    std::string type = "s3";  // "s3" or "local"
    std::string endpoint;     // Empty for AWS, custom for MinIO/Ceph/etc
    std::string bucket;
    std::string region = constants::DEFAULT_REGION;
    std::string access_key;
    std::string secret_key;
    bool verify_ssl = true;
    bool use_path_style = false;
    std::string storage_class = constants::DEFAULT_STORAGE_CLASS;
    std::string path_prefix;  // Prepended verbatim to every key
    std::filesystem::path path;  // Root directory for the local store

    /// Validate required fields for this store type.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// Human-readable target for log headers, e.g. "https://host bucket=backup".
    std::string describe() const;
};

/// Transfer tuning shared by all store implementations.
struct TransferSettings {
    uint64_t multipart_threshold = constants::DEFAULT_MULTIPART_THRESHOLD;
    uint64_t multipart_chunk_size = constants::DEFAULT_MULTIPART_CHUNK_SIZE;
    uint32_t max_retries = constants::DEFAULT_MAX_RETRIES;
    size_t part_concurrency = constants::DEFAULT_PART_CONCURRENCY;
};

// One part of a multipart upload: a byte range of the local file.
struct PartRange {
    int number = 0;  // 1-based
    uint64_t offset = 0;
    uint64_t size = 0;
};

/// Part size used for a file: chunk_size, raised when needed so the file
/// fits in MAX_MULTIPART_PARTS parts.
uint64_t effective_part_size(uint64_t file_size, uint64_t chunk_size);

/// Consecutive part ranges covering [0, file_size).
std::vector<PartRange> plan_multipart_parts(uint64_t file_size, uint64_t chunk_size);

// Abstract object-store boundary used by the upload pipeline.
// Implementations must be safe for concurrent use from many workers.
class StorageClient {
public:
    virtual ~StorageClient() = default;

    // Get the store type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // "Not found" is a normal negative result; any other failure throws StoreError.
    virtual ExistsResult exists(const std::string& key) const = 0;

    // Upload a local file. Objects larger than multipart_threshold go through
    // multipart upload. Throws StoreError on failure.
    virtual void upload(const std::filesystem::path& local_path,
                        const std::string& key,
                        const UploadOptions& options) = 0;

    // Throws StoreError when the object is absent or the request fails.
    virtual ObjectMetadata head_metadata(const std::string& key) const = 0;

    // Throws StoreError on failure. Removing an absent key is not an error.
    virtual void remove(const std::string& key) = 0;
};

/// Create a store client from configuration. Throws StoreError for an
/// unknown store type.
std::unique_ptr<StorageClient> make_storage_client(const StoreConfig& config,
                                                   const TransferSettings& transfer);

std::unique_ptr<StorageClient> make_local_storage_client(const std::filesystem::path& root,
                                                         const TransferSettings& transfer,
                                                         const std::string& path_prefix = "");

}  // namespace s3backup
