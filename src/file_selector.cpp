#include "s3backup/file_selector.hpp"
#include "s3backup/core/log.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <system_error>

namespace s3backup {

namespace fs = std::filesystem;

std::optional<std::chrono::system_clock::time_point> creation_time(const fs::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    auto since_epoch = std::chrono::seconds(st.st_ctim.tv_sec) +
                       std::chrono::nanoseconds(st.st_ctim.tv_nsec);
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch));
}

std::chrono::system_clock::time_point window_start(
    std::chrono::system_clock::time_point now, int day_delta) {
    using Clock = std::chrono::system_clock;
    // Half the clock's range keeps now - window representable for any
    // present-day now.
    constexpr auto max_window =
        std::chrono::duration_cast<std::chrono::hours>(Clock::duration::max()) / 2;

    auto window = std::chrono::hours(24) * static_cast<int64_t>(std::max(day_delta, 0));
    if (window >= max_window) {
        return Clock::time_point::min();
    }
    return now - std::chrono::duration_cast<Clock::duration>(window);
}

FileSelector::FileSelector(fs::path directory,
                           std::set<std::string> extensions,
                           int day_delta)
    : directory_(std::move(directory))
    , extensions_(std::move(extensions))
    , day_delta_(day_delta) {}

bool FileSelector::matches_extension(const fs::path& path) const {
    auto ext = path.extension().string();
    return !ext.empty() && extensions_.count(ext) > 0;
}

std::optional<std::vector<CandidateFile>> FileSelector::select(
    std::chrono::system_clock::time_point now) const {
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        log_error("Backup directory does not exist: %s", directory_.c_str());
        return std::nullopt;
    }

    auto cutoff = window_start(now, day_delta_);
    std::vector<CandidateFile> candidates;

    fs::directory_iterator it(directory_, ec);
    if (ec) {
        log_error("Cannot read backup directory %s: %s", directory_.c_str(), ec.message().c_str());
        return std::nullopt;
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !matches_extension(entry.path())) {
            continue;
        }

        auto created = creation_time(entry.path());
        if (!created) {
            log_warn("Cannot stat %s, skipping", entry.path().c_str());
            continue;
        }
        if (*created < cutoff || *created > now) {
            continue;
        }

        auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            log_warn("Cannot read size of %s, skipping", entry.path().c_str());
            continue;
        }

        candidates.push_back({fs::absolute(entry.path()), size, *created});
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const CandidateFile& a, const CandidateFile& b) {
                  if (a.created != b.created) return a.created < b.created;
                  return a.path < b.path;
              });

    log_debug("Selected %zu candidate(s) from %s", candidates.size(), directory_.c_str());
    return candidates;
}

}  // namespace s3backup
