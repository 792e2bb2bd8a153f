#include "utils/config.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>

namespace ksboot {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<long long> parseInteger(const std::string& text) {
    try {
        size_t consumed = 0;
        long long v = std::stoll(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool isValidPort(long long v) { return v > 0 && v <= 65535; }

std::filesystem::path defaultConfigPath() {
    auto home = getEnvValue("HOME");
    if (!home || home->empty()) {
        home = getEnvValue("USERPROFILE");
    }
    if (home && !home->empty()) {
        return std::filesystem::path(*home) / ".ksboot" / "config.json";
    }
    return std::filesystem::path();
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    try {
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config file {}: {}", path.string(), e.what());
        return false;
    }
}

void applyJson(const nlohmann::json& j, BootstrapConfig& cfg) {
    auto millis = [&](const char* key, std::chrono::milliseconds& field) {
        if (j.contains(key) && j[key].is_number_integer() && j[key].get<long long>() >= 0) {
            field = std::chrono::milliseconds(j[key].get<long long>());
        }
    };
    auto text = [&](const char* key, std::string& field) {
        if (j.contains(key) && j[key].is_string()) {
            field = j[key].get<std::string>();
        }
    };
    auto port = [&](const char* key, uint16_t& field, bool allow_zero) {
        if (j.contains(key) && j[key].is_number_integer()) {
            long long v = j[key].get<long long>();
            if (isValidPort(v) || (allow_zero && v == 0)) {
                field = static_cast<uint16_t>(v);
            }
        }
    };

    text("host", cfg.host);
    port("port", cfg.port, false);
    text("bind_hostname", cfg.bind_hostname);
    text("resource_dir", cfg.resource_dir);
    text("runtime_command", cfg.runtime_command);
    text("manifest_file", cfg.manifest_file);
    text("health_path", cfg.health_path);
    port("status_port", cfg.status_port, true);
    millis("probe_timeout_ms", cfg.probe_timeout);
    if (cfg.probe_timeout.count() > kMaxProbeTimeoutMs) {
        cfg.probe_timeout = std::chrono::milliseconds(kMaxProbeTimeoutMs);
    }
    millis("poll_interval_ms", cfg.poll_interval);
    millis("startup_delay_ms", cfg.startup_delay);
    millis("terminate_grace_ms", cfg.terminate_grace);

    if (j.contains("max_poll_attempts") && j["max_poll_attempts"].is_number_integer()) {
        int v = j["max_poll_attempts"].get<int>();
        if (v > 0) cfg.max_poll_attempts = v;
    }
    if (j.contains("open_browser") && j["open_browser"].is_boolean()) {
        cfg.open_browser = j["open_browser"].get<bool>();
    }
    if (j.contains("dev_tools") && j["dev_tools"].is_array()) {
        std::vector<std::string> tools;
        for (const auto& item : j["dev_tools"]) {
            if (item.is_string() && !item.get<std::string>().empty()) {
                tools.push_back(item.get<std::string>());
            }
        }
        cfg.dev_tools = std::move(tools);
    }
}

}  // namespace

std::pair<BootstrapConfig, std::string> loadBootstrapConfigWithLog() {
    BootstrapConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("KSBOOT_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j) && j.is_object()) {
            applyJson(j, cfg);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        }
    }

    if (auto v = getEnvValue("KSBOOT_HOST")) {
        if (!v->empty()) {
            cfg.host = *v;
            log << "env:HOST=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("KSBOOT_PORT")) {
        auto n = parseInteger(*v);
        if (n && isValidPort(*n)) {
            cfg.port = static_cast<uint16_t>(*n);
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("KSBOOT_RESOURCE_DIR")) {
        cfg.resource_dir = *v;
        log << "env:RESOURCE_DIR=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("KSBOOT_PROBE_TIMEOUT_MS")) {
        auto n = parseInteger(*v);
        if (n && *n > 0) {
            cfg.probe_timeout = std::chrono::milliseconds(std::min(*n, kMaxProbeTimeoutMs));
            log << "env:PROBE_TIMEOUT_MS=" << *n << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("KSBOOT_POLL_INTERVAL_MS")) {
        auto n = parseInteger(*v);
        if (n && *n >= 0) {
            cfg.poll_interval = std::chrono::milliseconds(*n);
            log << "env:POLL_INTERVAL_MS=" << *n << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("KSBOOT_POLL_ATTEMPTS")) {
        auto n = parseInteger(*v);
        if (n && *n > 0 && *n <= 100000) {
            cfg.max_poll_attempts = static_cast<int>(*n);
            log << "env:POLL_ATTEMPTS=" << *n << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("KSBOOT_HEALTH_PATH")) {
        cfg.health_path = *v;
        log << "env:HEALTH_PATH=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("KSBOOT_STATUS_PORT")) {
        auto n = parseInteger(*v);
        if (n && (*n == 0 || isValidPort(*n))) {
            cfg.status_port = static_cast<uint16_t>(*n);
            log << "env:STATUS_PORT=" << *n << " ";
            used_env = true;
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

BootstrapConfig loadBootstrapConfig() {
    return loadBootstrapConfigWithLog().first;
}

}  // namespace ksboot
