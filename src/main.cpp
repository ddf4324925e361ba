/**
 * pyremote — command line entry point.
 *
 * Loads settings (JSON config file, a .uproject's DefaultEngine.ini, or the
 * built-in defaults), finds a running editor node on the multicast group,
 * runs one python command on it and prints the rendered result.
 *
 * Exit codes: 0 success, 1 usage error or failed command, 2 connection
 * error, 3 configuration error.
 */

#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config/remote_execution_config.h"
#include "errors.h"
#include "pipe/json_output_pipe.h"
#include "session/remote_connection.h"

using json = nlohmann::json;

namespace {

constexpr int kExitCommandFailed = 1;
constexpr int kExitConnection = 2;
constexpr int kExitConfig = 3;

struct Options {
    std::string config_path;
    std::string uproject_path;
    std::string project_name;
    pyremote::ExecMode exec_mode = pyremote::ExecMode::EvaluateStatement;
    std::chrono::milliseconds timeout = pyremote::RemoteConnection::kDefaultCommandTimeout;
    bool raise_on_failure = false;
    std::string pipe_path;
    std::string pipe_key;
    bool verbose = false;
    std::string command;
};

void print_usage() {
    std::cerr << "Usage: pyremote [options] <command>\n"
                 "  --config <file.json>      settings file\n"
                 "  --uproject <file>         read settings from the project's DefaultEngine.ini\n"
                 "  --project <name>          only connect to this project\n"
                 "  --mode file|statement|evaluate (default evaluate)\n"
                 "  --timeout <seconds>       wait for the result this long (default 5)\n"
                 "  --raise                   treat a failed command as an error\n"
                 "  --pipe <path>             attach a JSON output pipe\n"
                 "  --pipe-key <key>          print this pipe entry after the command\n"
                 "  --verbose                 debug logging\n";
}

std::optional<pyremote::ExecMode> parse_mode(const std::string& text) {
    if (text == "file")
        return pyremote::ExecMode::ExecuteFile;
    if (text == "statement")
        return pyremote::ExecMode::ExecuteStatement;
    if (text == "evaluate")
        return pyremote::ExecMode::EvaluateStatement;
    return pyremote::exec_mode_from_string(text);
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--uproject" && has_value) {
            options.uproject_path = argv[++i];
        } else if (arg == "--project" && has_value) {
            options.project_name = argv[++i];
        } else if (arg == "--mode" && has_value) {
            const auto mode = parse_mode(argv[++i]);
            if (!mode) {
                spdlog::error("Unknown exec mode: {}", argv[i]);
                return std::nullopt;
            }
            options.exec_mode = *mode;
        } else if (arg == "--timeout" && has_value) {
            const auto timeout = pyremote::timeout_from_seconds(argv[++i]);
            if (!timeout) {
                spdlog::error("Invalid timeout: {}", argv[i]);
                return std::nullopt;
            }
            options.timeout = *timeout;
        } else if (arg == "--pipe" && has_value) {
            options.pipe_path = argv[++i];
        } else if (arg == "--pipe-key" && has_value) {
            options.pipe_key = argv[++i];
        } else if (arg == "--raise") {
            options.raise_on_failure = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.command += " " + arg;
        }
    }
    if (options.command.empty())
        return std::nullopt;
    return options;
}

json load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw pyremote::InvalidConfigError("Cannot open config file: " + path);
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw pyremote::InvalidConfigError("Cannot parse " + path + ": " + e.what());
    }
}

pyremote::RemoteExecutionConfig build_config(const Options& options) {
    auto config = [&options] {
        if (!options.uproject_path.empty())
            return pyremote::RemoteExecutionConfig::from_uproject_path(options.uproject_path);
        if (!options.config_path.empty()) {
            spdlog::debug("Loading config from {}", options.config_path);
            return pyremote::RemoteExecutionConfig::from_json(load_config(options.config_path));
        }
        return pyremote::RemoteExecutionConfig();
    }();

    if (!options.project_name.empty())
        return config.with_target_name(options.project_name);
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    const auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return kExitCommandFailed;
    }
    if (options->verbose)
        spdlog::set_level(spdlog::level::debug);

    try {
        std::optional<pyremote::JsonOutputPipe> pipe;
        if (!options->pipe_path.empty())
            pipe.emplace(options->pipe_path);

        pyremote::RemoteConnection connection(build_config(*options), pipe ? &*pipe : nullptr);
        connection.open();

        const auto result = connection.execute(options->command, options->exec_mode,
                                               /*unattended=*/true, options->timeout,
                                               options->raise_on_failure);
        std::cout << result.to_string() << std::endl;

        if (pipe && !options->pipe_key.empty())
            std::cout << pipe->read(options->pipe_key).dump() << std::endl;

        connection.close();
        return result.success() ? 0 : kExitCommandFailed;
    } catch (const pyremote::InvalidConfigError& e) {
        spdlog::error("{}", e.what());
        return kExitConfig;
    } catch (const pyremote::InvalidUprojectPathError& e) {
        spdlog::error("Invalid uproject path: {}", e.what());
        return kExitConfig;
    } catch (const pyremote::ConnectionError& e) {
        spdlog::error("{}", e.what());
        return kExitConnection;
    } catch (const pyremote::CommandError& e) {
        spdlog::error("Command failed: {}", e.what());
        return kExitCommandFailed;
    } catch (const pyremote::Error& e) {
        spdlog::error("{}", e.what());
        return kExitCommandFailed;
    } catch (const std::system_error& e) {
        spdlog::error("Socket error: {}", e.what());
        return kExitConnection;
    }
}
