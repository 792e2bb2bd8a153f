#pragma once

#include "core/resource_locator.h"
#include "system/process_launcher.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ksboot {

enum class LaunchMethod {
    BundledRuntime,     // bundled runtime binary + bundled script
    SystemRuntime,      // runtime found on PATH + bundled script
    PackageManagerDev,  // "<tool> run dev" in the project directory
};

std::string launchMethodToString(LaunchMethod method);

/// One row of the launch table.
struct LaunchAttempt {
    LaunchMethod method{LaunchMethod::BundledRuntime};
    std::string tool;  // package manager name for PackageManagerDev
    LaunchSpec spec;
};

/// Inputs from which the ordered launch table is derived.
struct LaunchPlanInput {
    std::vector<std::filesystem::path> bases;   // resource, exe, cwd
    std::filesystem::path current_dir;          // where the manifest is looked up
    Platform platform{currentPlatform()};
    uint16_t port{3000};
    std::string bind_hostname{"0.0.0.0"};
    std::string runtime_command;                // empty = platform default
    std::string manifest_file{"package.json"};
    std::vector<std::string> dev_tools{"bun", "npm"};
};

/// Build the ordered launch table. Rows whose prerequisites are missing
/// (runtime, script or manifest not found) are left out.
std::vector<LaunchAttempt> planLaunchAttempts(const LaunchPlanInput& input);

struct LaunchedServer {
    std::unique_ptr<ChildProcess> process;
    LaunchAttempt attempt;
};

/// Tries launch attempts in order until one spawns a process.
class LaunchStrategyChain {
public:
    explicit LaunchStrategyChain(ProcessLauncher& launcher);

    /// First attempt that yields a live process, or nullopt when every spawn failed.
    std::optional<LaunchedServer> launch(const std::vector<LaunchAttempt>& attempts);

    /// Spawn errors collected by the last launch() call, one per failed attempt.
    const std::vector<std::string>& failures() const { return failures_; }

private:
    ProcessLauncher& launcher_;
    std::vector<std::string> failures_;
};

}  // namespace ksboot
