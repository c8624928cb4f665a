#pragma once

#include <optional>
#include <string>

namespace file_editor {

// Fully resolved server settings. Defaults apply when neither the YAML
// file nor the command line sets a field.
struct AppConfig {
    std::string working_directory;
    std::string transport = "http";  // "http" or "stdio"

    // HTTP transport
    int port = 8080;
    std::string bind_address = "0.0.0.0";
    int max_request_size_mb = 10;
    int max_concurrent = 10;

    // File service limits
    int max_file_size_mb = 10;
    int operation_timeout_sec = 10;

    // Logging
    std::string log_level = "info";
    bool log_json = false;
    std::optional<std::string> log_file;
};

// Values given on the command line. Only present fields override.
struct ConfigOverrides {
    std::optional<std::string> config_file;
    std::optional<std::string> working_directory;
    std::optional<std::string> transport;
    std::optional<int> port;
    std::optional<std::string> bind_address;
    std::optional<int> max_request_size_mb;
    std::optional<int> max_concurrent;
    std::optional<int> max_file_size_mb;
    std::optional<int> operation_timeout_sec;
    std::optional<std::string> log_level;
    bool log_json = false;
    std::optional<std::string> log_file;
};

} // namespace file_editor
