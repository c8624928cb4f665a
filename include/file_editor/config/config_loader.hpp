#pragma once

#include <file_editor/config/app_config.hpp>
#include <file_editor/core/result.hpp>

#include <string>
#include <string_view>

namespace file_editor {

// Parse a YAML config file on top of the defaults.
//
//   dir: /srv/files
//   transport: http | stdio
//   http:    { port, bind, max_request_size_mb, max_concurrent }
//   limits:  { max_file_size_mb, operation_timeout_sec }
//   logging: { level, json, file }
Result<AppConfig, std::string> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments. --help and --version print and exit.
Result<ConfigOverrides, std::string> LoadFromCli(int argc, const char* const* argv);

// Fields present in `overrides` replace those in `base`.
AppConfig MergeConfigs(const AppConfig& base, const ConfigOverrides& overrides);

// Validate required fields and value ranges.
Result<void, std::string> ValidateConfig(const AppConfig& config);

} // namespace file_editor
