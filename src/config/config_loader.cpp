#include <file_editor/config/config_loader.hpp>

#include <file_editor/core/log.hpp>
#include <file_editor/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace file_editor {

namespace {

std::string MakeConfigError(const std::string& message) {
    return "Config: " + message;
}

// Copy a scalar from `node[key]` into `out` when present.
template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

Result<void, std::string> CheckRange(const char* name, int value, int min, int max) {
    if (value < min || value > max) {
        return Result<void, std::string>::Err(MakeConfigError(
            std::string(name) + " must be between " + std::to_string(min) +
            " and " + std::to_string(max) + ", got " + std::to_string(value)));
    }
    return Result<void, std::string>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, std::string> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (root.IsNull()) {
            return Result<AppConfig, std::string>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, std::string>::Err(
                MakeConfigError("top level of '" + std::string(file_path) +
                                "' must be a mapping"));
        }

        ReadScalar(root, "dir", config.working_directory);
        ReadScalar(root, "transport", config.transport);

        // -- HTTP --
        if (const auto http = root["http"]) {
            ReadScalar(http, "port", config.port);
            ReadScalar(http, "bind", config.bind_address);
            ReadScalar(http, "max_request_size_mb", config.max_request_size_mb);
            ReadScalar(http, "max_concurrent", config.max_concurrent);
        }

        // -- Limits --
        if (const auto limits = root["limits"]) {
            ReadScalar(limits, "max_file_size_mb", config.max_file_size_mb);
            ReadScalar(limits, "operation_timeout_sec", config.operation_timeout_sec);
        }

        // -- Logging --
        if (const auto logging = root["logging"]) {
            ReadScalar(logging, "level", config.log_level);
            ReadScalar(logging, "json", config.log_json);
            if (logging["file"]) {
                config.log_file = logging["file"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, std::string>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, std::string>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<ConfigOverrides, std::string> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("file-editor", kVersion);
    program.add_description("File editing server for AI agents (MCP over HTTP or stdio).");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-d", "--dir")
        .help("Working directory to serve files from");
    program.add_argument("--transport")
        .help("Transport: http or stdio");

    // HTTP
    program.add_argument("-p", "--port")
        .help("HTTP port")
        .scan<'i', int>();
    program.add_argument("--bind")
        .help("HTTP bind address");
    program.add_argument("--max-request-size")
        .help("Maximum HTTP request body in MB")
        .scan<'i', int>();
    program.add_argument("--max-concurrent")
        .help("Maximum concurrent HTTP requests")
        .scan<'i', int>();

    // Limits
    program.add_argument("--max-size")
        .help("Maximum file size in MB")
        .scan<'i', int>();
    program.add_argument("--timeout")
        .help("Operation timeout in seconds")
        .scan<'i', int>();

    // Logging
    program.add_argument("--log-level")
        .help("Log level: debug, info, warn or error");
    program.add_argument("--log-json")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ConfigOverrides, std::string>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ConfigOverrides overrides;
    overrides.config_file = program.present("--config");
    overrides.working_directory = program.present("--dir");
    overrides.transport = program.present("--transport");
    overrides.port = program.present<int>("--port");
    overrides.bind_address = program.present("--bind");
    overrides.max_request_size_mb = program.present<int>("--max-request-size");
    overrides.max_concurrent = program.present<int>("--max-concurrent");
    overrides.max_file_size_mb = program.present<int>("--max-size");
    overrides.operation_timeout_sec = program.present<int>("--timeout");
    overrides.log_level = program.present("--log-level");
    overrides.log_json = program.get<bool>("--log-json");
    overrides.log_file = program.present("--log-file");

    return Result<ConfigOverrides, std::string>::Ok(std::move(overrides));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides) {
    AppConfig merged = base;

    if (overrides.working_directory) {
        merged.working_directory = *overrides.working_directory;
    }
    if (overrides.transport) {
        merged.transport = *overrides.transport;
    }
    if (overrides.port) {
        merged.port = *overrides.port;
    }
    if (overrides.bind_address) {
        merged.bind_address = *overrides.bind_address;
    }
    if (overrides.max_request_size_mb) {
        merged.max_request_size_mb = *overrides.max_request_size_mb;
    }
    if (overrides.max_concurrent) {
        merged.max_concurrent = *overrides.max_concurrent;
    }
    if (overrides.max_file_size_mb) {
        merged.max_file_size_mb = *overrides.max_file_size_mb;
    }
    if (overrides.operation_timeout_sec) {
        merged.operation_timeout_sec = *overrides.operation_timeout_sec;
    }
    if (overrides.log_level) {
        merged.log_level = *overrides.log_level;
    }
    if (overrides.log_json) {
        merged.log_json = true;
    }
    if (overrides.log_file) {
        merged.log_file = overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, std::string> ValidateConfig(const AppConfig& config) {
    using R = Result<void, std::string>;

    if (config.working_directory.empty()) {
        return R::Err(MakeConfigError("Missing required field: dir"));
    }
    if (config.transport != "http" && config.transport != "stdio") {
        return R::Err(MakeConfigError("transport must be 'http' or 'stdio', got '" +
                                      config.transport + "'"));
    }
    if (config.transport == "http") {
        auto port = CheckRange("port", config.port, 1024, 65535);
        if (port.IsErr()) {
            return port;
        }
        if (config.bind_address.empty()) {
            return R::Err(MakeConfigError("bind address must not be empty"));
        }
    }

    auto check = CheckRange("max_request_size_mb", config.max_request_size_mb, 1, 100);
    if (check.IsErr()) {
        return check;
    }
    check = CheckRange("max_concurrent", config.max_concurrent, 1, 100);
    if (check.IsErr()) {
        return check;
    }
    check = CheckRange("max_file_size_mb", config.max_file_size_mb, 1, 100);
    if (check.IsErr()) {
        return check;
    }
    check = CheckRange("operation_timeout_sec", config.operation_timeout_sec, 1, 30);
    if (check.IsErr()) {
        return check;
    }

    auto level = ParseLogLevel(config.log_level);
    if (level.IsErr()) {
        return R::Err(MakeConfigError(level.Error()));
    }
    return R::Ok();
}

} // namespace file_editor
