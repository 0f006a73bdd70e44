#pragma once

#include "s3backup/file_selector.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace s3backup {

class StorageClient;

enum class OutcomeKind {
    Uploaded,            // Transferred and verified
    SkippedExisting,     // Key already present remotely
    WouldUpload,         // Dry run: would have been transferred
    VerificationFailed,  // Transferred but did not verify; remote copy removed
    TransferFailed       // Existence check or transfer failed
};

const char* outcome_kind_name(OutcomeKind kind);

/// Result of processing one candidate file.
struct UploadOutcome {
    OutcomeKind kind = OutcomeKind::TransferFailed;
    std::string key;
    std::filesystem::path path;
    uint64_t bytes = 0;    // Bytes transferred (Uploaded only)
    bool deleted = false;  // Local file removed after a verified upload
    std::string error;
    double duration_seconds = 0;  // Transfer plus verification

    bool is_failure() const {
        return kind == OutcomeKind::VerificationFailed || kind == OutcomeKind::TransferFailed;
    }
    bool is_skip() const {
        return kind == OutcomeKind::SkippedExisting || kind == OutcomeKind::WouldUpload;
    }
};

struct WorkerOptions {
    bool dry_run = false;
    bool delete_after_upload = true;
    std::string storage_class;
};

/// Per-file pipeline: exists -> upload -> verify -> optional local delete.
/// Steps for one file run strictly in sequence. Store failures are classified
/// into the outcome and never thrown.
class UploadWorker {
public:
    UploadWorker(StorageClient& store, WorkerOptions options)
        : store_(store), options_(std::move(options)) {}

    UploadOutcome process(const CandidateFile& file) const;

private:
    StorageClient& store_;
    WorkerOptions options_;
};

/// Local time as "YYYY-MM-DDTHH:MM:SS".
std::string iso8601_local_now();

}  // namespace s3backup
