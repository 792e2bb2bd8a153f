// logger.h - spdlog setup for the ksboot host
#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ksboot::logger {

/// Where and how much the host logs.
struct LogSettings {
    spdlog::level::level_enum level{spdlog::level::info};
    /// Directory for the daily JSON-lines files; empty disables file logging.
    std::filesystem::path dir;
    int retention_days{7};
};

// trace|debug|info|warn|error|critical|off, case-insensitive. Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& text);

/// Reads KSBOOT_LOG_LEVEL, KSBOOT_LOG_DIR (default ~/.ksboot/logs) and
/// KSBOOT_LOG_RETENTION_DAYS (1-364, default 7).
LogSettings settings_from_env();

// <dir>/ksboot.jsonl.YYYY-MM-DD for the local date of `day`.
std::filesystem::path daily_log_file(const std::filesystem::path& dir,
                                     std::chrono::system_clock::time_point day);

// Removes ksboot.jsonl.* files dated before today - retention_days.
void prune_daily_logs(const std::filesystem::path& dir, int retention_days);

/// Installs the "ksboot" default logger: coloured stderr plus today's file.
/// `console_sinks` replace the stderr sink when given.
/// Returns the file in use, or an empty path when file logging is off or the
/// directory cannot be written.
std::filesystem::path install(const LogSettings& settings,
                              std::vector<spdlog::sink_ptr> console_sinks = {});

// Stderr at warn and no file, for the one-shot probe and locate commands.
void install_quiet();

}  // namespace ksboot::logger
