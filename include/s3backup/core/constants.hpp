#pragma once

#include <cstddef>
#include <cstdint>

namespace s3backup::constants {

// Selection defaults
constexpr int DEFAULT_DAY_DELTA = 3;
constexpr int MAX_DAY_DELTA = 36500;
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/backup/s3-config.json";

// Worker defaults
constexpr size_t DEFAULT_MAX_WORKERS = 3;
constexpr size_t MAX_WORKERS_LIMIT = 64;
constexpr uint32_t DEFAULT_MAX_RETRIES = 3;

// Storage defaults
constexpr uint64_t DEFAULT_MULTIPART_THRESHOLD = 100ULL * 1024 * 1024;  // 100MB
constexpr uint64_t DEFAULT_MULTIPART_CHUNK_SIZE = 8ULL * 1024 * 1024;   // 8MB
constexpr uint64_t MIN_MULTIPART_PART_SIZE = 5ULL * 1024 * 1024;        // S3 minimum part size
constexpr size_t DEFAULT_PART_CONCURRENCY = 4;
constexpr uint64_t MAX_MULTIPART_PARTS = 10000;                        // S3 part number limit
constexpr const char* DEFAULT_REGION = "us-east-1";
constexpr const char* DEFAULT_STORAGE_CLASS = "STANDARD";

// Verification
constexpr size_t HASH_CHUNK_SIZE = 8192;  // 8KB

}  // namespace s3backup::constants
