#pragma once

#include <comicinfo/core/log.hpp>
#include <comicinfo/loader/content_fetcher.hpp>

#include <optional>
#include <string>

namespace comicinfo {

enum class OutputFormat {
    Json,
    Xml,
};

// Settings for the comicinfo tool, from YAML and/or the command line.
struct ToolConfig {
    FetchOptions fetch;
    LogLevel log_level = LogLevel::Warn;
    bool json_log = false;
    OutputFormat output = OutputFormat::Json;
    bool pretty = true;
};

enum class Command {
    Validate,
    Convert,
    Info,
};

// Parsed command line. Unset optionals leave the YAML/default value alone.
struct CliOptions {
    Command command = Command::Validate;
    std::string input;
    std::optional<std::string> config_path;
    std::optional<OutputFormat> output;
    bool compact = false;
    bool verbose = false;
    bool json_log = false;
};

} // namespace comicinfo
