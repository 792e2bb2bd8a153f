#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ksboot {

/// What to start: a program (absolute path or a command name looked up on PATH),
/// its arguments, working directory and environment overrides.
struct LaunchSpec {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_directory;      // empty = inherit
    std::map<std::string, std::string> environment;  // merged over the inherited environment
};

/// A started OS process.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual long pid() const = 0;

    /// Non-blocking liveness check. Reaps the process if it has exited.
    virtual bool isRunning() = 0;

    /// Exit code once the process has been reaped (128 + signal when killed).
    virtual std::optional<int> exitCode() const = 0;

    /// Ask the process (and its process group) to stop, escalating to a hard kill
    /// after `grace`. Safe to call repeatedly and on an already-exited process.
    virtual void terminate(std::chrono::milliseconds grace) noexcept = 0;
};

struct LaunchResult {
    std::unique_ptr<ChildProcess> process;
    std::string error;

    bool ok() const { return process != nullptr; }
};

/// Process spawn capability. Abstracted so launch strategies can be exercised
/// without starting real OS processes.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /// Start the process. A refused spawn (missing binary, permissions, bad
    /// working directory) yields a result without a process and a message.
    virtual LaunchResult launch(const LaunchSpec& spec) = 0;
};

/// Launcher backed by the host OS (fork/exec on POSIX, CreateProcess on Windows).
class SystemProcessLauncher : public ProcessLauncher {
public:
    LaunchResult launch(const LaunchSpec& spec) override;
};

/// Resolve a command name against a PATH-style search list. Names containing a
/// directory separator are only checked for being executable.
std::optional<std::filesystem::path> findExecutable(const std::string& program,
                                                    const std::string& search_path);

/// Render a LaunchSpec as a shell-like command line for logs.
std::string describeCommand(const LaunchSpec& spec);

}  // namespace ksboot
