#include "core/resource_locator.h"

#include <spdlog/spdlog.h>
#include <array>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <climits>
#endif

namespace fs = std::filesystem;

namespace ksboot {

namespace {

const PlatformLayout kLinuxLayout{
    {"bundled/node/node", "bundled/node/bin/node"},
    "bundled/server/server.js",
    "node",
    "../lib/karaoke-successor",
    {"xdg-open"},
};

const PlatformLayout kMacLayout{
    {"bundled/node/node", "bundled/node/bin/node"},
    "bundled/server/server.js",
    "node",
    "../Resources",
    {"open"},
};

const PlatformLayout kWindowsLayout{
    {"bundled/node/node.exe"},
    "bundled/server/server.js",
    "node.exe",
    ".",
    {"cmd", "/c", "start", ""},
};

// Existence check that treats any filesystem error as "not there".
bool isExistingFile(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) return false;
    return fs::exists(status) && !fs::is_directory(status);
}

std::optional<fs::path> firstExisting(const std::vector<fs::path>& bases,
                                      const std::vector<std::string>& subpaths,
                                      const char* what) {
    for (const auto& base : bases) {
        for (const auto& sub : subpaths) {
            fs::path candidate = base / fs::path(sub).make_preferred();
            if (isExistingFile(candidate)) {
                std::error_code ec;
                auto absolute = fs::absolute(candidate, ec);
                if (!ec) candidate = absolute.lexically_normal();
                spdlog::debug("Found {} at {}", what, candidate.string());
                return candidate;
            }
            spdlog::debug("No {} at {}", what, candidate.string());
        }
    }
    return std::nullopt;
}

}  // namespace

Platform currentPlatform() {
#ifdef _WIN32
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

std::string platformToString(Platform platform) {
    switch (platform) {
        case Platform::Linux: return "linux";
        case Platform::MacOS: return "macos";
        case Platform::Windows: return "windows";
        default: return "unknown";
    }
}

const PlatformLayout& platformLayout(Platform platform) {
    switch (platform) {
        case Platform::MacOS: return kMacLayout;
        case Platform::Windows: return kWindowsLayout;
        case Platform::Linux:
        default: return kLinuxLayout;
    }
}

std::vector<fs::path> BaseDirectories::ordered() const {
    std::vector<fs::path> out;
    for (const auto* dir : {&resource_dir, &exe_dir, &current_dir}) {
        if (*dir && !(*dir)->empty()) {
            out.push_back(**dir);
        }
    }
    return out;
}

BaseDirectories BaseDirectories::discover(const std::string& resource_override,
                                          Platform platform) {
    BaseDirectories dirs;
    dirs.exe_dir = executableDirectory();

    if (!resource_override.empty()) {
        std::error_code ec;
        auto absolute = fs::absolute(resource_override, ec);
        dirs.resource_dir = ec ? fs::path(resource_override) : absolute.lexically_normal();
    } else if (dirs.exe_dir) {
        std::error_code ec;
        fs::path resources = *dirs.exe_dir / platformLayout(platform).resource_dir_from_exe;
        auto normalized = fs::weakly_canonical(resources, ec);
        dirs.resource_dir = ec ? resources.lexically_normal() : normalized;
    }

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (!ec) {
        dirs.current_dir = cwd;
    }
    return dirs;
}

std::optional<CandidatePair> LocatedBundle::pair() const {
    if (!runtime || !script) return std::nullopt;
    return CandidatePair{*runtime, *script};
}

std::optional<fs::path> locateRuntime(const std::vector<fs::path>& bases, Platform platform) {
    return firstExisting(bases, platformLayout(platform).runtime_subpaths, "runtime");
}

std::optional<fs::path> locateScript(const std::vector<fs::path>& bases, Platform platform) {
    return firstExisting(bases, {platformLayout(platform).script_subpath}, "server script");
}

LocatedBundle locateBundle(const std::vector<fs::path>& bases, Platform platform) {
    LocatedBundle bundle;
    bundle.runtime = locateRuntime(bases, platform);
    bundle.script = locateScript(bases, platform);
    return bundle;
}

std::optional<fs::path> executableDirectory() {
#ifdef _WIN32
    std::array<char, MAX_PATH> buffer{};
    DWORD len = GetModuleFileNameA(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
    if (len == 0 || len >= buffer.size()) {
        return std::nullopt;
    }
    return fs::path(std::string(buffer.data(), len)).parent_path();
#elif defined(__APPLE__)
    std::array<char, PATH_MAX> buffer{};
    uint32_t size = static_cast<uint32_t>(buffer.size());
    if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
        return std::nullopt;
    }
    std::error_code ec;
    auto resolved = fs::canonical(buffer.data(), ec);
    if (ec) return fs::path(buffer.data()).parent_path();
    return resolved.parent_path();
#else
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::nullopt;
    }
    return exe.parent_path();
#endif
}

}  // namespace ksboot
