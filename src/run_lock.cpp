#include "s3backup/run_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace s3backup {

RunLock::RunLock(std::filesystem::path path)
    : path_(std::move(path)) {}

RunLock::~RunLock() {
    release();
}

bool RunLock::try_acquire() {
    if (fd_ >= 0) return true;

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        error_ = "cannot open lock file " + path_.string() + ": " + std::strerror(errno);
        return false;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        error_ = (err == EWOULDBLOCK)
            ? "another run holds " + path_.string()
            : "cannot lock " + path_.string() + ": " + std::strerror(err);
        return false;
    }

    // Record the holder for operators; the lock itself is the flock
    std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) == 0) {
        ssize_t written = ::write(fd, pid.data(), pid.size());
        (void)written;
    }

    fd_ = fd;
    error_.clear();
    return true;
}

void RunLock::release() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

}  // namespace s3backup
