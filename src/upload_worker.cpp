#include "s3backup/upload_worker.hpp"
#include "s3backup/core/log.hpp"
#include "s3backup/storage/client.hpp"
#include "s3backup/upload_verifier.hpp"

#include <chrono>
#include <ctime>
#include <system_error>

namespace s3backup {

const char* outcome_kind_name(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Uploaded: return "uploaded";
        case OutcomeKind::SkippedExisting: return "skipped_existing";
        case OutcomeKind::WouldUpload: return "would_upload";
        case OutcomeKind::VerificationFailed: return "verification_failed";
        case OutcomeKind::TransferFailed: return "transfer_failed";
    }
    return "unknown";
}

std::string iso8601_local_now() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm;
    localtime_r(&now, &tm);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

UploadOutcome UploadWorker::process(const CandidateFile& file) const {
    UploadOutcome outcome;
    outcome.key = file.path.filename().string();
    outcome.path = file.path;
    const char* key = outcome.key.c_str();
    double size_mb = static_cast<double>(file.size) / (1024.0 * 1024.0);

    // 1. Idempotency check
    try {
        if (store_.exists(outcome.key).found) {
            log_info("Skipped %s: already exists in store", key);
            outcome.kind = OutcomeKind::SkippedExisting;
            return outcome;
        }
    } catch (const StoreError& e) {
        log_error("Existence check failed for %s: %s", key, e.what());
        outcome.kind = OutcomeKind::TransferFailed;
        outcome.error = e.what();
        return outcome;
    }

    if (options_.dry_run) {
        log_info("[DRY-RUN] Would upload: %s (%.2f MB)", key, size_mb);
        outcome.kind = OutcomeKind::WouldUpload;
        return outcome;
    }

    // 2. Transfer
    auto start = std::chrono::steady_clock::now();
    log_info("Uploading %s (%.2f MB)...", key, size_mb);

    UploadOptions upload_options;
    upload_options.metadata["original-path"] = file.path.string();
    upload_options.metadata["upload-date"] = iso8601_local_now();
    upload_options.storage_class = options_.storage_class;

    try {
        store_.upload(file.path, outcome.key, upload_options);
    } catch (const StoreError& e) {
        log_error("Upload failed for %s: %s", key, e.what());
        outcome.kind = OutcomeKind::TransferFailed;
        outcome.error = e.what();
        return outcome;
    }

    // 3. Verification; a failed check removes the remote copy
    bool verified = false;
    try {
        verified = UploadVerifier(store_).verify(file.path, outcome.key);
        if (!verified) outcome.error = "verification mismatch";
    } catch (const StoreError& e) {
        log_error("Verification of %s could not complete: %s", key, e.what());
        outcome.error = e.what();
    }
    outcome.duration_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (!verified) {
        log_error("Verification failed for %s, removing remote object", key);
        try {
            store_.remove(outcome.key);
        } catch (const StoreError& e) {
            log_error("Cleanup of %s failed: %s", key, e.what());
        }
        outcome.kind = OutcomeKind::VerificationFailed;
        return outcome;
    }

    log_info("Uploaded: %s", key);
    outcome.kind = OutcomeKind::Uploaded;
    outcome.bytes = file.size;

    // 4. Local deletion only after a verified upload
    if (options_.delete_after_upload) {
        std::error_code ec;
        if (std::filesystem::remove(file.path, ec)) {
            outcome.deleted = true;
            log_info("Deleted local file: %s", file.path.c_str());
        } else {
            log_error("Failed to delete local file %s: %s", file.path.c_str(),
                      ec ? ec.message().c_str() : "file not found");
        }
    }

    return outcome;
}

}  // namespace s3backup
