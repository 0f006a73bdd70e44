#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace s3backup {

/// A backup archive chosen for upload.
struct CandidateFile {
    std::filesystem::path path;  // Absolute
    uint64_t size = 0;
    std::chrono::system_clock::time_point created;  // Inode change time (st_ctime)
};

/// Scans the backup directory (non-recursive) for regular files whose
/// extension is accepted and whose creation time lies within
/// [now - day_delta days, now]. Read-only.
class FileSelector {
public:
    FileSelector(std::filesystem::path directory,
                 std::set<std::string> extensions,
                 int day_delta);

    /// Candidates ordered by ascending creation time, ties by path.
    /// Returns empty optional when the directory does not exist.
    std::optional<std::vector<CandidateFile>> select(
        std::chrono::system_clock::time_point now) const;

    std::optional<std::vector<CandidateFile>> select() const {
        return select(std::chrono::system_clock::now());
    }

    /// Case-sensitive match of the last ".xxx" component.
    bool matches_extension(const std::filesystem::path& path) const;

private:
    std::filesystem::path directory_;
    std::set<std::string> extensions_;
    int day_delta_;
};

/// Lower bound of the selection window, now - day_delta days. Windows too
/// wide for the clock start at the earliest representable time.
std::chrono::system_clock::time_point window_start(
    std::chrono::system_clock::time_point now, int day_delta);

/// st_ctime of a path, or nullopt if it cannot be stat'ed.
std::optional<std::chrono::system_clock::time_point> creation_time(
    const std::filesystem::path& path);

}  // namespace s3backup
