// ─────────────────────────────────────────────────────────────────────────────
// supex-cli - command-line client for the Supex runtime
// ─────────────────────────────────────────────────────────────────────────────
// Talks to the runtime inside the host application over the local socket.
//
// Usage:
//   supex-cli status
//   supex-cli call get_layers
//   supex-cli call eval_ruby '{"code": "1 + 1"}' --json
//   supex-cli resources -H 127.0.0.1 -p 9876
//
// Connection settings come from SUPEX_* environment variables and may be
// overridden with flags. Diagnostics go to $SUPEX_LOG_DIR/supex-cli.log
// (default $SUPEX_WORKSPACE/.tmp/logs); --verbose mirrors them to stderr.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "supex/client/connection_registry.hpp"
#include "supex/log/spdlog_logger.hpp"
#include "supex/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

using namespace supex;

namespace {

constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

constexpr const char* kConnectionHint = "Make sure the host application is running with the Supex runtime.";

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset = "\033[0m";
    const char* bold  = "\033[1m";
    const char* dim   = "\033[2m";
    const char* red   = "\033[31m";
    const char* green = "\033[32m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_dim(const std::string& msg) {
    std::cerr << color::c(color::dim) << msg << color::c(color::reset) << "\n";
}

void print_json(const Json& j, bool compact) {
    std::cout << (compact ? j.dump() : j.dump(2)) << "\n";
}

void print_bridge_error(const BridgeError& error) {
    if (error.code == BridgeErrorCode::Remote && error.remote.has_value()) {
        const RemoteErrorInfo& remote = *error.remote;
        print_error(std::format("Host error [{}]: {}", remote.code, remote.message));
        if (auto file = remote.file()) {
            print_dim("File: " + *file);
        }
        if (auto line = remote.line()) {
            print_dim("Line: " + std::to_string(*line));
        }
        if (auto hint = remote.hint()) {
            print_dim("Hint: " + *hint);
        }
        return;
    }

    if (error.code == BridgeErrorCode::Connection || error.code == BridgeErrorCode::Timeout) {
        print_error(std::format("{} error: {}", to_string(error.code), error.message));
        print_dim(kConnectionHint);
        return;
    }

    print_error(std::format("{} error: {}", to_string(error.code), error.message));
}

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : fallback;
}

std::filesystem::path log_directory() {
    const char* home = std::getenv("HOME");
    const std::filesystem::path default_workspace =
        std::filesystem::path(home != nullptr ? home : ".") / ".supex" / "tmp-workspace";

    const std::filesystem::path workspace = env_or("SUPEX_WORKSPACE", default_workspace.string());
    return env_or("SUPEX_LOG_DIR", (workspace / ".tmp" / "logs").string());
}

/// File logging when the directory is usable; stderr too with --verbose.
/// Without a usable directory (and no --verbose) logging stays disabled.
void setup_logging(bool verbose) {
    const std::filesystem::path dir = log_directory();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    const LogLevel level = verbose ? LogLevel::Debug : LogLevel::Info;
    if (ec) {
        if (verbose) {
            set_logger(make_spdlog_console_logger(level));
        }
        return;
    }

    const std::string file = (dir / "supex-cli.log").string();
    try {
        if (verbose) {
            set_logger(make_spdlog_console_file_logger(file, level));
        } else {
            set_logger(make_spdlog_file_logger(file, LogLevel::Debug));
        }
    } catch (const spdlog::spdlog_ex& e) {
        if (verbose) {
            print_dim(std::string("Logging to stderr only: ") + e.what());
            set_logger(make_spdlog_console_logger(level));
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

std::string reported_version(const Json& result) {
    if (result.is_object() == false || result.contains("version") == false) {
        return "unknown";
    }
    const Json& version = result.at("version");
    return version.is_string() ? version.get<std::string>() : version.dump();
}

int cmd_status(Connection& conn, bool json_output) {
    auto result = conn.send_command("ping");

    if (json_output) {
        Json output = {{"connected", result.has_value()}};
        if (result) {
            output["version"] = reported_version(*result);
        } else {
            output["error"] = result.error().message;
        }
        print_json(output, true);
        return result ? 0 : kExitError;
    }

    if (!result) {
        std::cout << color::c(color::bold) << color::c(color::red) << "Disconnected"
                  << color::c(color::reset) << "\n" << result.error().message << "\n";
        print_dim(kConnectionHint);
        return kExitError;
    }

    std::cout << color::c(color::bold) << color::c(color::green) << "Connected"
              << color::c(color::reset) << "\n"
              << "Version: " << reported_version(*result) << "\n";
    return 0;
}

int cmd_call(Connection& conn, const std::string& method, const Json& args, bool json_output) {
    auto result = conn.send_command(method, args);
    if (!result) {
        print_bridge_error(result.error());
        return kExitError;
    }

    // Commands report soft failures as {"success": false, "error": ...}
    const bool reports_failure = result->is_object() && result->contains("success") &&
                                 result->at("success") == false;
    if (json_output == false && reports_failure) {
        const Json& err = result->contains("error") ? result->at("error") : Json("Unknown error");
        print_error("Failed: " + (err.is_string() ? err.get<std::string>() : err.dump()));
        return kExitError;
    }

    print_json(*result, json_output);
    return 0;
}

int cmd_resources(Connection& conn, bool json_output) {
    return cmd_call(conn, std::string(kResourcesListMethod), Json::object(), json_output);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("supex-cli", "Command-line client for the Supex runtime");

    options.add_options()
        ("H,host", "Host application address (default: SUPEX_HOST or localhost)", cxxopts::value<std::string>())
        ("p,port", "Host application port (default: SUPEX_PORT or 9876)", cxxopts::value<int>())
        ("agent", "Agent identity (default: SUPEX_AGENT or user)", cxxopts::value<std::string>())
        ("timeout", "Request timeout in seconds (default: SUPEX_TIMEOUT or 15)", cxxopts::value<double>())
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("v,verbose", "Log diagnostics to stderr as well")
        ("version", "Print version")
        ("h,help", "Print usage")
        ("command", "status | call | resources", cxxopts::value<std::string>())
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>()->default_value(""));

    options.parse_positional({"command", "args"});
    options.positional_help("<status|call|resources> [method] [json-arguments]");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n";
            std::cout << "    supex-cli status\n";
            std::cout << "    supex-cli call get_layers\n";
            std::cout << "    supex-cli call eval_ruby '{\"code\": \"Sketchup.version\"}' --json\n";
            std::cout << "    supex-cli resources\n";
            return 0;
        }

        if (result.count("version")) {
            std::cout << "supex-cli " << SUPEX_VERSION_STRING << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        if (result.count("command") == 0) {
            print_error("No command given");
            std::cout << "\n" << options.help() << "\n";
            return kExitUsage;
        }
        const std::string command = result["command"].as<std::string>();

        std::vector<std::string> args;
        for (const auto& arg : result["args"].as<std::vector<std::string>>()) {
            if (!arg.empty()) {
                args.push_back(arg);
            }
        }

        // ─────────────────────────────────────────────────────────────────────
        // Connection settings: environment first, then flags
        // ─────────────────────────────────────────────────────────────────────

        auto config = ConnectionConfig::from_environment();
        if (!config) {
            print_error(config.error().message);
            return kExitUsage;
        }
        config->with_agent(env_or("SUPEX_AGENT", "user"));

        if (result.count("host")) {
            config->with_host(result["host"].as<std::string>());
        }
        if (result.count("port")) {
            const int port = result["port"].as<int>();
            if (port < 1 || port > 65535) {
                print_error("--port must be between 1 and 65535");
                return kExitUsage;
            }
            config->with_port(static_cast<std::uint16_t>(port));
        }
        if (result.count("agent")) {
            config->with_agent(result["agent"].as<std::string>());
        }
        if (result.count("timeout")) {
            const double seconds = result["timeout"].as<double>();
            if (!(seconds > 0.0) || seconds > 86400.0) {
                print_error("--timeout must be between 0 and 86400 seconds");
                return kExitUsage;
            }
            config->with_timeout(std::chrono::milliseconds{static_cast<std::int64_t>(seconds * 1000.0)});
        }

        setup_logging(result.count("verbose") > 0);

        ConnectionRegistry registry(std::move(*config));
        auto conn = registry.acquire();

        if (command == "status") {
            return cmd_status(*conn, json_output);
        }

        if (command == "resources") {
            return cmd_resources(*conn, json_output);
        }

        if (command == "call") {
            if (args.empty()) {
                print_error("call requires a method name");
                return kExitUsage;
            }

            Json call_args = Json::object();
            if (args.size() > 1) {
                try {
                    call_args = Json::parse(args[1]);
                } catch (const Json::parse_error& e) {
                    print_error(std::string("Invalid JSON arguments: ") + e.what());
                    return kExitUsage;
                }
                if (call_args.is_object() == false) {
                    print_error("JSON arguments must be an object");
                    return kExitUsage;
                }
            }
            return cmd_call(*conn, args[0], call_args, json_output);
        }

        print_error("Unknown command: " + command);
        return kExitUsage;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return kExitUsage;
    }
}
