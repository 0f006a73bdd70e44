#pragma once

#include <filesystem>
#include <string>

namespace s3backup {

/// Exclusive advisory lock (flock) held for the lifetime of the object.
/// Keeps overlapping scheduled runs from uploading the same files twice.
class RunLock {
public:
    explicit RunLock(std::filesystem::path path);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    /// Non-blocking. Returns false if another process holds the lock or the
    /// file cannot be opened; error() then says which.
    bool try_acquire();

    void release();

    bool held() const { return fd_ >= 0; }
    const std::string& error() const { return error_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    std::string error_;
};

}  // namespace s3backup
