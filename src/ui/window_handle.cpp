#include "ui/window_handle.h"

#include "system/process_launcher.h"

#include <spdlog/spdlog.h>
#include <iostream>

namespace ksboot {

void ConsoleWindow::navigate(const std::string& url) {
    std::cout << "Server ready: " << url << std::endl;
}

void ConsoleWindow::showFailure(const std::string& reason) {
    std::cerr << "Server unavailable: " << reason << std::endl;
}

BrowserWindow::BrowserWindow(ProcessLauncher& launcher, std::vector<std::string> opener)
    : launcher_(launcher), opener_(std::move(opener)) {}

BrowserWindow::~BrowserWindow() {
    if (opener_process_) {
        opener_process_->isRunning();
    }
}

void BrowserWindow::navigate(const std::string& url) {
    if (opener_.empty()) {
        console_.navigate(url);
        return;
    }

    LaunchSpec spec;
    spec.program = opener_.front();
    spec.args.assign(opener_.begin() + 1, opener_.end());
    spec.args.push_back(url);

    auto result = launcher_.launch(spec);
    if (!result.ok()) {
        spdlog::warn("Cannot open browser ({}), printing URL instead", result.error);
        console_.navigate(url);
        return;
    }
    // The opener hands off to the browser and exits on its own; kept only to be reaped.
    opener_process_ = std::move(result.process);
    spdlog::info("Opened {} in the default browser", url);
}

void BrowserWindow::showFailure(const std::string& reason) {
    console_.showFailure(reason);
}

}  // namespace ksboot
