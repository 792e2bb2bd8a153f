#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ksboot {

enum class Platform {
    Linux,
    MacOS,
    Windows,
};

/// Platform the binary was compiled for.
Platform currentPlatform();

std::string platformToString(Platform platform);

/// Per-platform filesystem conventions for the bundled runtime and server.
struct PlatformLayout {
    std::vector<std::string> runtime_subpaths;   // relative to a base directory, tried in order
    std::string script_subpath;
    std::string runtime_command;                 // name looked up on PATH for the system runtime
    std::string resource_dir_from_exe;           // bundled resource dir relative to the exe dir
    std::vector<std::string> url_opener;         // command prefix that opens a URL
};

const PlatformLayout& platformLayout(Platform platform);

/// Candidate base directories, in lookup priority order.
struct BaseDirectories {
    std::optional<std::filesystem::path> resource_dir;
    std::optional<std::filesystem::path> exe_dir;
    std::optional<std::filesystem::path> current_dir;

    /// Present directories in priority order: resource, executable, current.
    std::vector<std::filesystem::path> ordered() const;

    /// Resolve the three bases for this process. An empty override selects the
    /// platform default resource directory next to the executable.
    static BaseDirectories discover(const std::string& resource_override,
                                    Platform platform = currentPlatform());
};

struct CandidatePair {
    std::filesystem::path runtime_path;
    std::filesystem::path script_path;
};

struct LocatedBundle {
    std::optional<std::filesystem::path> runtime;
    std::optional<std::filesystem::path> script;

    /// Both halves found: the bundled runtime can run the bundled script.
    std::optional<CandidatePair> pair() const;
};

/// First existing runtime binary across bases, or nullopt.
std::optional<std::filesystem::path> locateRuntime(
    const std::vector<std::filesystem::path>& bases, Platform platform = currentPlatform());

/// First existing server entry script across bases, or nullopt.
std::optional<std::filesystem::path> locateScript(
    const std::vector<std::filesystem::path>& bases, Platform platform = currentPlatform());

LocatedBundle locateBundle(const std::vector<std::filesystem::path>& bases,
                           Platform platform = currentPlatform());

/// Directory containing the running executable, if it can be determined.
std::optional<std::filesystem::path> executableDirectory();

}  // namespace ksboot
