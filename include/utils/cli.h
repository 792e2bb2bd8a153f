#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ksboot {

/// Subcommand types for the ksboot CLI
enum class Subcommand {
    None,    // No subcommand (same as run)
    Run,     // run
    Probe,   // probe
    Locate,  // locate
};

/// Options for run command. Unset fields keep the configured value.
struct RunOptions {
    std::optional<uint16_t> port;
    std::optional<std::string> resource_dir;
    std::optional<uint16_t> status_port;
    std::optional<std::string> health_path;
    bool no_browser{false};
};

/// Options for probe command
struct ProbeOptions {
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<int> timeout_ms;
};

/// Options for locate command
struct LocateOptions {
    std::optional<std::string> resource_dir;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};

    RunOptions run_options;
    ProbeOptions probe_options;
    LocateOptions locate_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getVersionMessage();

std::string subcommandToString(Subcommand cmd);

}  // namespace ksboot
