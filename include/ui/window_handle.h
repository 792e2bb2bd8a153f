#pragma once

#include <memory>
#include <string>
#include <vector>

namespace ksboot {

class ChildProcess;
class ProcessLauncher;

/// Host window seen from the supervisor: it can be pointed at a URL and told
/// that the bootstrap gave up.
class WindowHandle {
public:
    virtual ~WindowHandle() = default;

    virtual void navigate(const std::string& url) = 0;

    virtual void showFailure(const std::string& reason) = 0;
};

/// Prints the outcome to stdout. Used with --no-browser and when no opener exists.
class ConsoleWindow : public WindowHandle {
public:
    void navigate(const std::string& url) override;
    void showFailure(const std::string& reason) override;
};

/// Hands the URL to the desktop's default browser through the platform opener
/// (xdg-open, open, start). Falls back to the console when the opener cannot run.
class BrowserWindow : public WindowHandle {
public:
    BrowserWindow(ProcessLauncher& launcher, std::vector<std::string> opener);
    ~BrowserWindow() override;

    void navigate(const std::string& url) override;
    void showFailure(const std::string& reason) override;

private:
    ProcessLauncher& launcher_;
    std::vector<std::string> opener_;
    ConsoleWindow console_;
    std::unique_ptr<ChildProcess> opener_process_;
};

}  // namespace ksboot
