#pragma once

#include <comicinfo/config/tool_config.hpp>
#include <comicinfo/core/result.hpp>

#include <string>
#include <string_view>

namespace comicinfo {

// Parse a YAML config file into a ToolConfig. Missing keys keep defaults.
Result<ToolConfig, Error> LoadConfigFromYaml(std::string_view file_path);

// Parse CLI arguments: global flags, then validate|convert|info <input>.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// cli_overrides take precedence over the YAML base.
ToolConfig MergeConfigs(const ToolConfig& yaml_base, const CliOptions& cli_overrides);

// "debug", "info", "warn"/"warning", "error" (case-insensitive).
Result<LogLevel, Error> ParseLogLevel(std::string_view text);

// "json" or "xml" (case-insensitive).
Result<OutputFormat, Error> ParseOutputFormat(std::string_view text);

// Timeouts must be positive and the user agent non-empty.
Result<void, Error> ValidateConfig(const ToolConfig& config);

} // namespace comicinfo
