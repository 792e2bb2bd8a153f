#include "system/process_launcher.h"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
extern char** environ;
#endif

namespace fs = std::filesystem;

namespace ksboot {

namespace {

#ifdef _WIN32
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

std::map<std::string, std::string> inheritedEnvironment() {
    std::map<std::string, std::string> env;
#ifdef _WIN32
    LPCH block = GetEnvironmentStringsA();
    if (!block) return env;
    for (LPCH p = block; *p; p += std::strlen(p) + 1) {
        std::string entry(p);
        auto eq = entry.find('=', 1);  // skip the leading '=' of per-drive entries
        if (eq == std::string::npos) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    FreeEnvironmentStringsA(block);
#else
    for (char** p = environ; p && *p; ++p) {
        std::string entry(*p);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
#endif
    return env;
}

bool isExecutableFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}

#ifndef _WIN32

class PosixChildProcess : public ChildProcess {
public:
    explicit PosixChildProcess(pid_t pid) : pid_(pid) {}

    long pid() const override { return static_cast<long>(pid_); }

    bool isRunning() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pollLocked();
    }

    std::optional<int> exitCode() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return exit_code_;
    }

    void terminate(std::chrono::milliseconds grace) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pollLocked()) {
            return;
        }

        signalGroup(SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (!pollLocked()) {
                spdlog::debug("Process {} exited after SIGTERM", pid_);
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        spdlog::debug("Process {} still running after {}ms, sending SIGKILL", pid_, grace.count());
        signalGroup(SIGKILL);
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, 0);
        } while (r == -1 && errno == EINTR);
        record(r, status);
    }

private:
    // Returns true while the process is alive; records the exit status otherwise.
    bool pollLocked() {
        if (exit_code_) return false;
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == 0) return true;
        record(r, status);
        return false;
    }

    void record(pid_t r, int status) {
        if (r == pid_) {
            if (WIFEXITED(status)) {
                exit_code_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code_ = 128 + WTERMSIG(status);
            } else {
                exit_code_ = -1;
            }
        } else {
            // ECHILD: already reaped elsewhere
            exit_code_ = -1;
        }
    }

    // The child leads its own process group so dev tools take their children down too.
    void signalGroup(int sig) {
        if (::kill(-pid_, sig) != 0 && errno == ESRCH) {
            ::kill(pid_, sig);
        }
    }

    pid_t pid_;
    mutable std::mutex mutex_;
    std::optional<int> exit_code_;
};

void writeErrno(int fd, int err) {
    ssize_t n;
    do {
        n = ::write(fd, &err, sizeof(err));
    } while (n == -1 && errno == EINTR);
}

#else  // _WIN32

class WindowsChildProcess : public ChildProcess {
public:
    WindowsChildProcess(HANDLE process, DWORD pid) : process_(process), pid_(pid) {}
    ~WindowsChildProcess() override {
        if (process_) CloseHandle(process_);
    }

    long pid() const override { return static_cast<long>(pid_); }

    bool isRunning() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pollLocked();
    }

    std::optional<int> exitCode() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return exit_code_;
    }

    void terminate(std::chrono::milliseconds grace) noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!pollLocked()) return;
        if (!TerminateProcess(process_, 1)) {
            spdlog::debug("TerminateProcess({}) failed: {}", pid_, GetLastError());
        }
        WaitForSingleObject(process_, static_cast<DWORD>(grace.count()));
        pollLocked();
    }

private:
    bool pollLocked() {
        if (exit_code_) return false;
        if (WaitForSingleObject(process_, 0) == WAIT_TIMEOUT) return true;
        DWORD code = 0;
        exit_code_ = GetExitCodeProcess(process_, &code) ? static_cast<int>(code) : -1;
        return false;
    }

    HANDLE process_;
    DWORD pid_;
    mutable std::mutex mutex_;
    std::optional<int> exit_code_;
};

std::string quoteWindowsArg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

#endif

}  // namespace

std::optional<fs::path> findExecutable(const std::string& program, const std::string& search_path) {
    if (program.empty()) return std::nullopt;

    fs::path as_path(program);
    if (as_path.has_parent_path()) {
        if (isExecutableFile(as_path)) return as_path;
        return std::nullopt;
    }

    std::vector<std::string> names{program};
#ifdef _WIN32
    if (!as_path.has_extension()) {
        names = {program + ".exe", program + ".cmd", program + ".bat", program};
    }
#endif

    std::istringstream dirs(search_path);
    std::string dir;
    while (std::getline(dirs, dir, kPathListSeparator)) {
        fs::path base = dir.empty() ? fs::path(".") : fs::path(dir);
        for (const auto& name : names) {
            fs::path candidate = base / name;
            if (isExecutableFile(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::string describeCommand(const LaunchSpec& spec) {
    std::ostringstream oss;
    oss << spec.program;
    for (const auto& arg : spec.args) {
        if (arg.find(' ') != std::string::npos) {
            oss << " \"" << arg << "\"";
        } else {
            oss << " " << arg;
        }
    }
    return oss.str();
}

LaunchResult SystemProcessLauncher::launch(const LaunchSpec& spec) {
    LaunchResult result;
    if (spec.program.empty()) {
        result.error = "no program given";
        return result;
    }

    auto env = inheritedEnvironment();
    for (const auto& [key, value] : spec.environment) {
        env[key] = value;
    }

    auto path_it = env.find("PATH");
    std::string search_path = path_it != env.end() ? path_it->second : "/usr/local/bin:/usr/bin:/bin";
    auto resolved = findExecutable(spec.program, search_path);
    if (!resolved) {
        result.error = spec.program + ": not found or not executable";
        return result;
    }
    // The child changes directory before exec, so a relative program must be
    // pinned to the current directory first.
    {
        std::error_code ec;
        auto absolute = fs::absolute(*resolved, ec);
        if (!ec) resolved = absolute;
    }

    if (!spec.working_directory.empty()) {
        std::error_code ec;
        if (!fs::is_directory(spec.working_directory, ec)) {
            result.error = "working directory does not exist: " + spec.working_directory.string();
            return result;
        }
    }

#ifndef _WIN32
    // Everything the child touches is prepared before fork().
    std::vector<std::string> arg_storage;
    arg_storage.reserve(spec.args.size() + 1);
    arg_storage.push_back(spec.program);
    arg_storage.insert(arg_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    argv.reserve(arg_storage.size() + 1);
    for (auto& a : arg_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    env_storage.reserve(env.size());
    for (const auto& [key, value] : env) env_storage.push_back(key + "=" + value);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    const std::string exe = resolved->string();
    const std::string cwd = spec.working_directory.string();

    // Exec failures are reported back through a close-on-exec pipe.
    int fds[2];
    if (::pipe(fds) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        result.error = std::string("fork failed: ") + std::strerror(err);
        return result;
    }

    if (pid == 0) {
        ::close(fds[0]);
        ::setpgid(0, 0);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            writeErrno(fds[1], errno);
            ::_exit(127);
        }
        ::execve(exe.c_str(), argv.data(), envp.data());
        writeErrno(fds[1], errno);
        ::_exit(127);
    }

    ::setpgid(pid, pid);  // may race with the child's own call; either wins
    ::close(fds[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(fds[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    ::close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        result.error = exe + ": " + std::strerror(child_errno);
        return result;
    }

    spdlog::debug("Spawned pid {}: {}", pid, describeCommand(spec));
    result.process = std::make_unique<PosixChildProcess>(pid);
    return result;
#else
    std::string command_line = quoteWindowsArg(resolved->string());
    for (const auto& arg : spec.args) {
        command_line += " " + quoteWindowsArg(arg);
    }
    std::vector<char> cmd(command_line.begin(), command_line.end());
    cmd.push_back('\0');

    std::string env_block;
    for (const auto& [key, value] : env) {
        env_block += key + "=" + value;
        env_block.push_back('\0');
    }
    env_block.push_back('\0');

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    const std::string cwd = spec.working_directory.string();
    BOOL ok = CreateProcessA(nullptr, cmd.data(), nullptr, nullptr, FALSE,
                             CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP,
                             env_block.data(), cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
    if (!ok) {
        result.error = resolved->string() + ": CreateProcess failed with error " +
                       std::to_string(GetLastError());
        return result;
    }
    CloseHandle(pi.hThread);
    spdlog::debug("Spawned pid {}: {}", pi.dwProcessId, describeCommand(spec));
    result.process = std::make_unique<WindowsChildProcess>(pi.hProcess, pi.dwProcessId);
    return result;
#endif
}

}  // namespace ksboot
