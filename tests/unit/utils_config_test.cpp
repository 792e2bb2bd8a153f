#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <unordered_map>

#include "utils/config.h"

using namespace ksboot;
namespace fs = std::filesystem;

class EnvGuard {
public:
    EnvGuard(const std::vector<std::string>& keys) : keys_(keys) {
        for (const auto& k : keys_) {
            const char* v = std::getenv(k.c_str());
            if (v) saved_[k] = v;
        }
    }
    ~EnvGuard() {
        for (const auto& k : keys_) {
            if (auto it = saved_.find(k); it != saved_.end()) {
                setenv(k.c_str(), it->second.c_str(), 1);
            } else {
                unsetenv(k.c_str());
            }
        }
    }
private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::string> saved_;
};

namespace {
const std::vector<std::string> kAllKeys = {
    "KSBOOT_CONFIG", "KSBOOT_HOST", "KSBOOT_PORT", "KSBOOT_RESOURCE_DIR",
    "KSBOOT_PROBE_TIMEOUT_MS", "KSBOOT_POLL_INTERVAL_MS", "KSBOOT_POLL_ATTEMPTS",
    "KSBOOT_HEALTH_PATH", "KSBOOT_STATUS_PORT"};

void clearAll() {
    for (const auto& k : kAllKeys) unsetenv(k.c_str());
    // Point at a file that does not exist so ~/.ksboot/config.json is not read.
    setenv("KSBOOT_CONFIG", "/nonexistent/ksboot-config.json", 1);
}
}  // namespace

TEST(UtilsConfigTest, DefaultsMatchBootstrapContract) {
    EnvGuard guard(kAllKeys);
    clearAll();

    auto [cfg, log] = loadBootstrapConfigWithLog();
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.bind_hostname, "0.0.0.0");
    EXPECT_EQ(cfg.probe_timeout.count(), 1000);
    EXPECT_EQ(cfg.poll_interval.count(), 500);
    EXPECT_EQ(cfg.max_poll_attempts, 120);
    EXPECT_EQ(cfg.startup_delay.count(), 500);
    EXPECT_EQ(cfg.manifest_file, "package.json");
    EXPECT_EQ(cfg.dev_tools, (std::vector<std::string>{"bun", "npm"}));
    EXPECT_EQ(cfg.status_port, 0);
    EXPECT_TRUE(cfg.health_path.empty());
    EXPECT_TRUE(cfg.open_browser);
    EXPECT_NE(log.find("sources=default"), std::string::npos);
}

TEST(UtilsConfigTest, LoadsConfigFromFile) {
    EnvGuard guard(kAllKeys);
    clearAll();

    fs::path tmp = fs::temp_directory_path() / "ksboot-cfg-test.json";
    std::ofstream(tmp) << R"({
        "port": 3100,
        "resource_dir": "/opt/karaoke",
        "poll_interval_ms": 250,
        "max_poll_attempts": 10,
        "dev_tools": ["pnpm"],
        "open_browser": false
    })";
    setenv("KSBOOT_CONFIG", tmp.string().c_str(), 1);

    auto [cfg, log] = loadBootstrapConfigWithLog();
    EXPECT_EQ(cfg.port, 3100);
    EXPECT_EQ(cfg.resource_dir, "/opt/karaoke");
    EXPECT_EQ(cfg.poll_interval.count(), 250);
    EXPECT_EQ(cfg.max_poll_attempts, 10);
    EXPECT_EQ(cfg.dev_tools, (std::vector<std::string>{"pnpm"}));
    EXPECT_FALSE(cfg.open_browser);
    EXPECT_NE(log.find("file="), std::string::npos);
    EXPECT_NE(log.find("sources=file"), std::string::npos);

    fs::remove(tmp);
}

TEST(UtilsConfigTest, EnvOverridesFile) {
    EnvGuard guard(kAllKeys);
    clearAll();

    fs::path tmp = fs::temp_directory_path() / "ksboot-cfg-env-test.json";
    std::ofstream(tmp) << R"({"port": 3100, "health_path": "/from-file"})";
    setenv("KSBOOT_CONFIG", tmp.string().c_str(), 1);
    setenv("KSBOOT_PORT", "3200", 1);
    setenv("KSBOOT_HEALTH_PATH", "/api/health", 1);
    setenv("KSBOOT_POLL_ATTEMPTS", "5", 1);

    auto [cfg, log] = loadBootstrapConfigWithLog();
    EXPECT_EQ(cfg.port, 3200);
    EXPECT_EQ(cfg.health_path, "/api/health");
    EXPECT_EQ(cfg.max_poll_attempts, 5);
    EXPECT_NE(log.find("sources=env,file"), std::string::npos);

    fs::remove(tmp);
}

TEST(UtilsConfigTest, InvalidEnvValuesAreIgnored) {
    EnvGuard guard(kAllKeys);
    clearAll();

    setenv("KSBOOT_PORT", "99999", 1);
    setenv("KSBOOT_POLL_ATTEMPTS", "0", 1);
    setenv("KSBOOT_PROBE_TIMEOUT_MS", "fast", 1);
    setenv("KSBOOT_STATUS_PORT", "-1", 1);

    auto cfg = loadBootstrapConfig();
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.max_poll_attempts, 120);
    EXPECT_EQ(cfg.probe_timeout.count(), 1000);
    EXPECT_EQ(cfg.status_port, 0);
}

TEST(UtilsConfigTest, MalformedFileFallsBackToDefaults) {
    EnvGuard guard(kAllKeys);
    clearAll();

    fs::path tmp = fs::temp_directory_path() / "ksboot-cfg-bad.json";
    std::ofstream(tmp) << "{ not json";
    setenv("KSBOOT_CONFIG", tmp.string().c_str(), 1);

    auto [cfg, log] = loadBootstrapConfigWithLog();
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_NE(log.find("sources=default"), std::string::npos);

    fs::remove(tmp);
}

TEST(UtilsConfigTest, ProbeTimeoutIsCappedFromEnvAndFile) {
    EnvGuard guard(kAllKeys);
    clearAll();

    setenv("KSBOOT_PROBE_TIMEOUT_MS", "5000000000", 1);
    auto cfg = loadBootstrapConfig();
    EXPECT_EQ(cfg.probe_timeout.count(), kMaxProbeTimeoutMs);

    unsetenv("KSBOOT_PROBE_TIMEOUT_MS");
    fs::path tmp = fs::temp_directory_path() / "ksboot-cfg-timeout.json";
    std::ofstream(tmp) << R"({"probe_timeout_ms": 4294968296})";
    setenv("KSBOOT_CONFIG", tmp.string().c_str(), 1);
    cfg = loadBootstrapConfig();
    EXPECT_EQ(cfg.probe_timeout.count(), kMaxProbeTimeoutMs);

    fs::remove(tmp);
}
