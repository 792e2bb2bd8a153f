#include "core/launch_chain.h"

#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace ksboot {

std::string launchMethodToString(LaunchMethod method) {
    switch (method) {
        case LaunchMethod::BundledRuntime: return "bundled-runtime";
        case LaunchMethod::SystemRuntime: return "system-runtime";
        case LaunchMethod::PackageManagerDev: return "package-manager-dev";
        default: return "unknown";
    }
}

std::vector<LaunchAttempt> planLaunchAttempts(const LaunchPlanInput& input) {
    std::vector<LaunchAttempt> attempts;
    const auto& layout = platformLayout(input.platform);
    const std::string port = std::to_string(input.port);

    const std::map<std::string, std::string> server_env{
        {"PORT", port},
        {"HOSTNAME", input.bind_hostname},
        {"NODE_ENV", "production"},
    };

    auto bundle = locateBundle(input.bases, input.platform);

    if (auto pair = bundle.pair()) {
        LaunchAttempt attempt;
        attempt.method = LaunchMethod::BundledRuntime;
        attempt.spec.program = pair->runtime_path.string();
        attempt.spec.args = {pair->script_path.string()};
        attempt.spec.working_directory = pair->script_path.parent_path();
        attempt.spec.environment = server_env;
        attempts.push_back(std::move(attempt));
    } else {
        spdlog::debug("Skipping {}: runtime {}, script {}",
                      launchMethodToString(LaunchMethod::BundledRuntime),
                      bundle.runtime ? "found" : "missing",
                      bundle.script ? "found" : "missing");
    }

    if (bundle.script) {
        LaunchAttempt attempt;
        attempt.method = LaunchMethod::SystemRuntime;
        attempt.spec.program = input.runtime_command.empty() ? layout.runtime_command
                                                             : input.runtime_command;
        attempt.spec.args = {bundle.script->string()};
        attempt.spec.working_directory = bundle.script->parent_path();
        attempt.spec.environment = server_env;
        attempts.push_back(std::move(attempt));
    }

    std::error_code ec;
    const bool has_manifest = !input.current_dir.empty() && !input.manifest_file.empty() &&
                              fs::is_regular_file(input.current_dir / input.manifest_file, ec);
    if (has_manifest) {
        for (const auto& tool : input.dev_tools) {
            LaunchAttempt attempt;
            attempt.method = LaunchMethod::PackageManagerDev;
            attempt.tool = tool;
            attempt.spec.program = tool;
            attempt.spec.args = {"run", "dev"};
            attempt.spec.working_directory = input.current_dir;
            attempt.spec.environment = {{"PORT", port}};
            attempts.push_back(std::move(attempt));
        }
    } else {
        spdlog::debug("Skipping {}: no {} in {}",
                      launchMethodToString(LaunchMethod::PackageManagerDev),
                      input.manifest_file, input.current_dir.string());
    }

    return attempts;
}

LaunchStrategyChain::LaunchStrategyChain(ProcessLauncher& launcher) : launcher_(launcher) {}

std::optional<LaunchedServer> LaunchStrategyChain::launch(const std::vector<LaunchAttempt>& attempts) {
    failures_.clear();

    for (const auto& attempt : attempts) {
        const std::string label = attempt.tool.empty()
                                      ? launchMethodToString(attempt.method)
                                      : launchMethodToString(attempt.method) + "(" + attempt.tool + ")";
        spdlog::info("Starting server via {}: {} (cwd={})", label, describeCommand(attempt.spec),
                     attempt.spec.working_directory.string());

        auto result = launcher_.launch(attempt.spec);
        if (result.ok()) {
            spdlog::info("Server process {} started via {}", result.process->pid(), label);
            return LaunchedServer{std::move(result.process), attempt};
        }

        spdlog::warn("Failed to start server via {}: {}", label, result.error);
        failures_.push_back(label + ": " + result.error);
    }
    return std::nullopt;
}

}  // namespace ksboot
