#include "utils/cli.h"
#include "utils/config.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>

namespace ksboot {

std::string getRunHelpMessage();
std::string getProbeHelpMessage();
std::string getLocateHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "ksboot " << KSBOOT_VERSION << " - local server bootstrap for Karaoke Successor\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ksboot [COMMAND] [OPTIONS]\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    run        Start the local server and open it when ready (default)\n";
    oss << "    probe      Check whether a server is listening on the local port\n";
    oss << "    locate     Show where the runtime and server script are looked up\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'ksboot <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getRunHelpMessage() {
    std::ostringstream oss;
    oss << "ksboot run - Start the local server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ksboot run [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>           Server port (default: 3000, or KSBOOT_PORT)\n";
    oss << "    --resource-dir <DIR>    Bundled resource directory\n";
    oss << "    --status-port <PORT>    Serve readiness status over HTTP on this port\n";
    oss << "    --health-path <PATH>    Probe with HTTP GET instead of a TCP connect\n";
    oss << "    --no-browser            Print the URL instead of opening a browser\n";
    oss << "    -h, --help              Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    KSBOOT_CONFIG               Config file path (default: ~/.ksboot/config.json)\n";
    oss << "    KSBOOT_HOST                 Probe host (default: 127.0.0.1)\n";
    oss << "    KSBOOT_PORT                 Server port\n";
    oss << "    KSBOOT_RESOURCE_DIR         Bundled resource directory\n";
    oss << "    KSBOOT_PROBE_TIMEOUT_MS     Connection timeout per probe (default: 1000)\n";
    oss << "    KSBOOT_POLL_INTERVAL_MS     Delay between probes (default: 500)\n";
    oss << "    KSBOOT_POLL_ATTEMPTS        Probes before giving up (default: 120)\n";
    oss << "    KSBOOT_HEALTH_PATH          HTTP health path (default: TCP probe)\n";
    oss << "    KSBOOT_STATUS_PORT          Status server port (default: disabled)\n";
    oss << "    KSBOOT_LOG_LEVEL            Log level (trace|debug|info|warn|error)\n";
    oss << "    KSBOOT_LOG_DIR              Log directory (default: ~/.ksboot/logs)\n";
    oss << "    KSBOOT_LOG_RETENTION_DAYS   Log retention days (default: 7)\n";
    return oss.str();
}

std::string getProbeHelpMessage() {
    std::ostringstream oss;
    oss << "ksboot probe - Check for a listening server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ksboot probe [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --host <HOST>      Host to connect to (default: 127.0.0.1)\n";
    oss << "    --port <PORT>      Port to connect to (default: 3000)\n";
    oss << "    --timeout <MS>     Connection timeout in milliseconds\n";
    oss << "    -h, --help         Print help\n";
    oss << "\n";
    oss << "Exits with 0 when the port accepts connections, 1 otherwise.\n";
    return oss.str();
}

std::string getLocateHelpMessage() {
    std::ostringstream oss;
    oss << "ksboot locate - Show runtime and server lookup\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    ksboot locate [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --resource-dir <DIR>    Bundled resource directory\n";
    oss << "    -h, --help              Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "ksboot " << KSBOOT_VERSION << "\n";
    return oss.str();
}

namespace {

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

std::optional<long long> parseNumber(const char* text) {
    try {
        size_t consumed = 0;
        std::string s(text);
        long long v = std::stoll(s, &consumed);
        if (consumed != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

CliResult usageError(CliResult result, const std::string& message, const std::string& help) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\n" + help;
    return result;
}

// Fetch the value following option argv[i]; nullptr when it is missing.
const char* optionValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) return nullptr;
    return argv[++i];
}

bool parsePort(const char* text, uint16_t& out, bool allow_zero) {
    auto v = parseNumber(text);
    if (!v || *v < (allow_zero ? 0 : 1) || *v > 65535) return false;
    out = static_cast<uint16_t>(*v);
    return true;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        result.should_exit = false;
        result.subcommand = Subcommand::None;
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "run") == 0) {
        result.subcommand = Subcommand::Run;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getRunHelpMessage();
            return result;
        }

        auto& opts = result.run_options;
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--no-browser") {
                opts.no_browser = true;
                continue;
            }
            if (arg != "--port" && arg != "--resource-dir" && arg != "--status-port" &&
                arg != "--health-path") {
                return usageError(result, "unknown option: " + arg, getRunHelpMessage());
            }
            const char* value = optionValue(argc, argv, i);
            if (!value) {
                return usageError(result, arg + " requires a value", getRunHelpMessage());
            }
            if (arg == "--port") {
                uint16_t port = 0;
                if (!parsePort(value, port, false)) {
                    return usageError(result, std::string("invalid port: ") + value, getRunHelpMessage());
                }
                opts.port = port;
            } else if (arg == "--status-port") {
                uint16_t port = 0;
                if (!parsePort(value, port, true)) {
                    return usageError(result, std::string("invalid port: ") + value, getRunHelpMessage());
                }
                opts.status_port = port;
            } else if (arg == "--resource-dir") {
                opts.resource_dir = value;
            } else {
                opts.health_path = value;
            }
        }
        return result;
    }

    if (std::strcmp(command, "probe") == 0) {
        result.subcommand = Subcommand::Probe;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getProbeHelpMessage();
            return result;
        }

        auto& opts = result.probe_options;
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg != "--host" && arg != "--port" && arg != "--timeout") {
                return usageError(result, "unknown option: " + arg, getProbeHelpMessage());
            }
            const char* value = optionValue(argc, argv, i);
            if (!value) {
                return usageError(result, arg + " requires a value", getProbeHelpMessage());
            }
            if (arg == "--host") {
                opts.host = value;
            } else if (arg == "--port") {
                uint16_t port = 0;
                if (!parsePort(value, port, false)) {
                    return usageError(result, std::string("invalid port: ") + value, getProbeHelpMessage());
                }
                opts.port = port;
            } else {
                auto ms = parseNumber(value);
                if (!ms || *ms <= 0 || *ms > kMaxProbeTimeoutMs) {
                    return usageError(result, std::string("invalid timeout: ") + value, getProbeHelpMessage());
                }
                opts.timeout_ms = static_cast<int>(*ms);
            }
        }
        return result;
    }

    if (std::strcmp(command, "locate") == 0) {
        result.subcommand = Subcommand::Locate;

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getLocateHelpMessage();
            return result;
        }

        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg != "--resource-dir") {
                return usageError(result, "unknown option: " + arg, getLocateHelpMessage());
            }
            const char* value = optionValue(argc, argv, i);
            if (!value) {
                return usageError(result, arg + " requires a value", getLocateHelpMessage());
            }
            result.locate_options.resource_dir = value;
        }
        return result;
    }

    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Run: return "run";
        case Subcommand::Probe: return "probe";
        case Subcommand::Locate: return "locate";
        default: return "unknown";
    }
}

}  // namespace ksboot
