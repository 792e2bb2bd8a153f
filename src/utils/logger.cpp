#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace ksboot::logger {

namespace {

constexpr const char* kLoggerName = "ksboot";
constexpr const char* kFilePrefix = "ksboot.jsonl.";
constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","pid":%P,"msg":"%v"})";

std::string localDate(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
#ifdef _WIN32
    localtime_s(&tm_value, &t);
#else
    localtime_r(&t, &tm_value);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%d");
    return oss.str();
}

fs::path defaultLogDir() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    return fs::path(home ? home : "/tmp") / ".ksboot" / "logs";
}

// Opens today's file sink, or returns nullptr when the directory is unusable.
spdlog::sink_ptr openFileSink(const LogSettings& settings, fs::path& opened) {
    std::error_code ec;
    fs::create_directories(settings.dir, ec);
    if (ec) return nullptr;

    prune_daily_logs(settings.dir, settings.retention_days);
    auto path = daily_log_file(settings.dir, std::chrono::system_clock::now());
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
        sink->set_pattern(kFilePattern);
        opened = path;
        return sink;
    } catch (const spdlog::spdlog_ex&) {
        return nullptr;
    }
}

void installLogger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(2));
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") return spdlog::level::warn;
    if (lower == "fatal") return spdlog::level::critical;
    auto level = spdlog::level::from_str(lower);
    // from_str maps unknown names to off; only the literal "off" may do that.
    if (level == spdlog::level::off && lower != "off") return spdlog::level::info;
    return level;
}

LogSettings settings_from_env() {
    LogSettings settings;
    if (const char* level = std::getenv("KSBOOT_LOG_LEVEL")) {
        settings.level = parse_level(level);
    }
    const char* dir = std::getenv("KSBOOT_LOG_DIR");
    settings.dir = (dir && *dir) ? fs::path(dir) : defaultLogDir();
    if (const char* days = std::getenv("KSBOOT_LOG_RETENTION_DAYS")) {
        char* end = nullptr;
        long n = std::strtol(days, &end, 10);
        if (end != days && *end == '\0' && n > 0 && n < 365) {
            settings.retention_days = static_cast<int>(n);
        }
    }
    return settings;
}

fs::path daily_log_file(const fs::path& dir, std::chrono::system_clock::time_point day) {
    return dir / (kFilePrefix + localDate(day));
}

void prune_daily_logs(const fs::path& dir, int retention_days) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return;

    const std::string prefix = kFilePrefix;
    const std::string cutoff = localDate(std::chrono::system_clock::now() -
                                         std::chrono::hours(24 * retention_days));
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) != 0 || !entry.is_regular_file(ec)) continue;
        if (name.substr(prefix.size()) < cutoff) {
            std::error_code remove_ec;
            fs::remove(entry.path(), remove_ec);
        }
    }
}

fs::path install(const LogSettings& settings, std::vector<spdlog::sink_ptr> console_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(console_sinks);
    if (sinks.empty()) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(console);
    }

    fs::path opened;
    if (!settings.dir.empty()) {
        if (auto file = openFileSink(settings, opened)) {
            sinks.push_back(file);
        }
    }
    installLogger(std::move(sinks), settings.level);

    if (!settings.dir.empty() && opened.empty()) {
        spdlog::warn("File logging disabled: cannot write to {}", settings.dir.string());
    } else if (!opened.empty()) {
        spdlog::debug("Logging to {} (keeping {} days)", opened.string(), settings.retention_days);
    }
    return opened;
}

void install_quiet() {
    LogSettings settings;
    settings.level = spdlog::level::warn;
    install(settings);
}

}  // namespace ksboot::logger
