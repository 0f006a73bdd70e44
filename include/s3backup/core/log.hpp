#pragma once

#include <filesystem>

namespace s3backup {

// printf-style log lines: "[YYYY-MM-DD HH:MM:SS] LEVEL: message".
// INFO goes to stdout, WARN and ERROR to stderr.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Verbose-only INFO line.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void set_log_verbose(bool verbose);

/// Append stdout and stderr to the given file. Creates parent directories.
/// Returns false if the file cannot be opened (output stays on the terminal).
bool redirect_log_output(const std::filesystem::path& path);

}  // namespace s3backup
