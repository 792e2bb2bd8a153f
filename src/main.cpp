#include <iostream>
#include <memory>
#include <signal.h>
#include <thread>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "api/status_server.h"
#include "core/bootstrap_supervisor.h"
#include "core/health_probe.h"
#include "core/launch_chain.h"
#include "core/process_handle.h"
#include "core/resource_locator.h"
#include "runtime/state.h"
#include "system/process_launcher.h"
#include "ui/window_handle.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

ksboot::LaunchPlanInput makePlanInput(const ksboot::BootstrapConfig& cfg,
                                      const ksboot::BaseDirectories& dirs) {
    ksboot::LaunchPlanInput plan;
    plan.bases = dirs.ordered();
    plan.current_dir = dirs.current_dir.value_or(std::filesystem::path());
    plan.port = cfg.port;
    plan.bind_hostname = cfg.bind_hostname;
    plan.runtime_command = cfg.runtime_command;
    plan.manifest_file = cfg.manifest_file;
    plan.dev_tools = cfg.dev_tools;
    return plan;
}

void applyRunOptions(const ksboot::RunOptions& opts, ksboot::BootstrapConfig& cfg) {
    if (opts.port) cfg.port = *opts.port;
    if (opts.resource_dir) cfg.resource_dir = *opts.resource_dir;
    if (opts.status_port) cfg.status_port = *opts.status_port;
    if (opts.health_path) cfg.health_path = *opts.health_path;
    if (opts.no_browser) cfg.open_browser = false;
}

int run_host(const ksboot::BootstrapConfig& cfg) {
    std::cout << "ksboot v" << KSBOOT_VERSION << " starting..." << std::endl;

    auto dirs = ksboot::BaseDirectories::discover(cfg.resource_dir);
    for (const auto& base : dirs.ordered()) {
        spdlog::info("Lookup base: {}", base.string());
    }

    ksboot::SystemProcessLauncher launcher;
    auto probe = ksboot::makeHealthProbe(cfg);

    std::unique_ptr<ksboot::WindowHandle> window;
    if (cfg.open_browser) {
        window = std::make_unique<ksboot::BrowserWindow>(
            launcher, ksboot::platformLayout(ksboot::currentPlatform()).url_opener);
    } else {
        window = std::make_unique<ksboot::ConsoleWindow>();
    }

    ksboot::ReadinessTracker readiness;
    ksboot::ProcessHandle process(cfg.terminate_grace);
    ksboot::BootstrapSupervisor supervisor(ksboot::SupervisorOptions::fromConfig(cfg),
                                           makePlanInput(cfg, dirs), *probe, launcher,
                                           *window, readiness, process);

    std::unique_ptr<ksboot::StatusServer> status;
    if (cfg.status_port != 0) {
        status = std::make_unique<ksboot::StatusServer>(cfg.status_port, supervisor);
        status->setLogger([](const httplib::Request& req, const httplib::Response& res) {
            spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
        });
        if (!status->start()) {
            spdlog::warn("Continuing without status server");
            status.reset();
        }
    }

    supervisor.start();

    while (ksboot::is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down..." << std::endl;
    if (status) {
        status->stop();
    }
    supervisor.shutdown();
    std::cout << "Shutdown complete" << std::endl;
    return 0;
}

int run_probe(const ksboot::ProbeOptions& opts, const ksboot::BootstrapConfig& cfg) {
    const std::string host = opts.host.value_or(cfg.host);
    const uint16_t port = opts.port.value_or(cfg.port);
    const auto timeout = opts.timeout_ms ? std::chrono::milliseconds(*opts.timeout_ms)
                                         : cfg.probe_timeout;

    auto probe = ksboot::makeHealthProbe(cfg);
    const bool listening = probe->probe(host, port, timeout);
    std::cout << host << ":" << port << (listening ? " is accepting connections"
                                                   : " is not accepting connections")
              << std::endl;
    return listening ? 0 : 1;
}

int run_locate(const ksboot::LocateOptions& opts, ksboot::BootstrapConfig cfg) {
    if (opts.resource_dir) cfg.resource_dir = *opts.resource_dir;

    const auto platform = ksboot::currentPlatform();
    auto dirs = ksboot::BaseDirectories::discover(cfg.resource_dir, platform);
    auto show = [](const char* label, const std::optional<std::filesystem::path>& p) {
        std::cout << "  " << label << (p ? p->string() : std::string("(unknown)")) << "\n";
    };

    std::cout << "Platform: " << ksboot::platformToString(platform) << "\n";
    std::cout << "Base directories (in lookup order):\n";
    show("resources:  ", dirs.resource_dir);
    show("executable: ", dirs.exe_dir);
    show("current:    ", dirs.current_dir);

    auto bundle = ksboot::locateBundle(dirs.ordered(), platform);
    std::cout << "Runtime: " << (bundle.runtime ? bundle.runtime->string() : "not found") << "\n";
    std::cout << "Script:  " << (bundle.script ? bundle.script->string() : "not found") << "\n";

    auto attempts = ksboot::planLaunchAttempts(makePlanInput(cfg, dirs));
    if (attempts.empty()) {
        std::cout << "Launch plan: nothing to launch\n";
        return 1;
    }
    std::cout << "Launch plan:\n";
    int index = 1;
    for (const auto& attempt : attempts) {
        std::cout << "  " << index++ << ". " << ksboot::launchMethodToString(attempt.method)
                  << ": " << ksboot::describeCommand(attempt.spec)
                  << " (cwd " << attempt.spec.working_directory.string() << ")\n";
    }
    return 0;
}

}  // namespace

void signalHandler(int) {
    ksboot::request_shutdown();
}

int main(int argc, char* argv[]) {
    auto cli_result = ksboot::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        std::cout << cli_result.output;
        return cli_result.exit_code;
    }

    if (cli_result.subcommand == ksboot::Subcommand::Probe ||
        cli_result.subcommand == ksboot::Subcommand::Locate) {
        ksboot::logger::install_quiet();
    } else {
        auto log_file = ksboot::logger::install(ksboot::logger::settings_from_env());
        if (!log_file.empty()) {
            spdlog::info("Logs initialized: {}", log_file.string());
        }
    }

    auto [cfg, config_log] = ksboot::loadBootstrapConfigWithLog();
    spdlog::info("Config: {}", config_log);

    switch (cli_result.subcommand) {
        case ksboot::Subcommand::Probe:
            return run_probe(cli_result.probe_options, cfg);

        case ksboot::Subcommand::Locate:
            return run_locate(cli_result.locate_options, cfg);

        case ksboot::Subcommand::Run:
        case ksboot::Subcommand::None:
        default:
            signal(SIGINT, signalHandler);
            signal(SIGTERM, signalHandler);
            applyRunOptions(cli_result.run_options, cfg);
            return run_host(cfg);
    }
}
