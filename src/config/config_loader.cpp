#include <comicinfo/config/config_loader.hpp>

#include <comicinfo/core/strings.hpp>
#include <comicinfo/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <utility>

namespace comicinfo {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Parse("Config: " + message);
}

Result<ToolConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    using R = Result<ToolConfig, Error>;
    ToolConfig config;

    // -- Fetch --
    if (const auto fetch = root["fetch"]) {
        if (fetch["connect_timeout"]) {
            config.fetch.connect_timeout =
                std::chrono::seconds(fetch["connect_timeout"].as<int>());
        }
        if (fetch["read_timeout"]) {
            config.fetch.read_timeout = std::chrono::seconds(fetch["read_timeout"].as<int>());
        }
        if (fetch["user_agent"]) {
            config.fetch.user_agent = fetch["user_agent"].as<std::string>();
        }
        if (fetch["follow_redirects"]) {
            config.fetch.follow_redirects = fetch["follow_redirects"].as<bool>();
        }
    }

    // -- Log --
    if (const auto log = root["log"]) {
        if (log["level"]) {
            auto level = ParseLogLevel(log["level"].as<std::string>());
            if (level.IsErr()) {
                return R::Err(std::move(level).Error());
            }
            config.log_level = level.Value();
        }
        if (log["json"]) {
            config.json_log = log["json"].as<bool>();
        }
    }

    // -- Output --
    if (const auto output = root["output"]) {
        if (output["format"]) {
            auto format = ParseOutputFormat(output["format"].as<std::string>());
            if (format.IsErr()) {
                return R::Err(std::move(format).Error());
            }
            config.output = format.Value();
        }
        if (output["pretty"]) {
            config.pretty = output["pretty"].as<bool>();
        }
    }

    return R::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadConfigFromYaml
// ---------------------------------------------------------------------------
Result<ToolConfig, Error> LoadConfigFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::BadFile&) {
        return Result<ToolConfig, Error>::Err(
            Error::File("Cannot open config file '" + std::string(file_path) + "'"));
    } catch (const YAML::Exception& e) {
        return Result<ToolConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    if (root.IsNull()) {
        return Result<ToolConfig, Error>::Ok(ToolConfig{});
    }
    if (!root.IsMap()) {
        return Result<ToolConfig, Error>::Err(
            MakeConfigError("Top level of the config file must be a mapping"));
    }

    try {
        return ParseYamlRoot(root);
    } catch (const YAML::Exception& e) {
        return Result<ToolConfig, Error>::Err(
            MakeConfigError("Invalid value in config file: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("comicinfo", kVersion,
                                     argparse::default_arguments::help);
    program.add_description("Validate, inspect and convert ComicInfo.xml metadata.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json-log")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser validate_cmd("validate", kVersion,
                                          argparse::default_arguments::help);
    validate_cmd.add_description("Load and validate a ComicInfo document");
    validate_cmd.add_argument("input")
        .help("XML string, file path or URL");

    argparse::ArgumentParser convert_cmd("convert", kVersion,
                                         argparse::default_arguments::help);
    convert_cmd.add_description("Print a ComicInfo document as JSON or XML");
    convert_cmd.add_argument("input")
        .help("XML string, file path or URL");
    convert_cmd.add_argument("--to")
        .help("Output format: json or xml");
    convert_cmd.add_argument("--compact")
        .help("Compact JSON output")
        .default_value(false)
        .implicit_value(true);

    argparse::ArgumentParser info_cmd("info", kVersion,
                                      argparse::default_arguments::help);
    info_cmd.add_description("Print a short summary of a ComicInfo document");
    info_cmd.add_argument("input")
        .help("XML string, file path or URL");

    program.add_subparser(validate_cmd);
    program.add_subparser(convert_cmd);
    program.add_subparser(info_cmd);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }
    options.verbose = program.get<bool>("--verbose");
    options.json_log = program.get<bool>("--json-log");

    if (program.is_subcommand_used(validate_cmd)) {
        options.command = Command::Validate;
        options.input = validate_cmd.get<std::string>("input");
    } else if (program.is_subcommand_used(convert_cmd)) {
        options.command = Command::Convert;
        options.input = convert_cmd.get<std::string>("input");
        if (auto val = convert_cmd.present("--to")) {
            auto format = ParseOutputFormat(*val);
            if (format.IsErr()) {
                return Result<CliOptions, Error>::Err(std::move(format).Error());
            }
            options.output = format.Value();
        }
        options.compact = convert_cmd.get<bool>("--compact");
    } else if (program.is_subcommand_used(info_cmd)) {
        options.command = Command::Info;
        options.input = info_cmd.get<std::string>("input");
    } else {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("Missing command: expected validate, convert or info"));
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
ToolConfig MergeConfigs(const ToolConfig& yaml_base, const CliOptions& cli_overrides) {
    ToolConfig merged = yaml_base;
    if (cli_overrides.verbose) {
        merged.log_level = LogLevel::Debug;
    }
    if (cli_overrides.json_log) {
        merged.json_log = true;
    }
    if (cli_overrides.output.has_value()) {
        merged.output = *cli_overrides.output;
    }
    if (cli_overrides.compact) {
        merged.pretty = false;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// Value parsers
// ---------------------------------------------------------------------------
Result<LogLevel, Error> ParseLogLevel(std::string_view text) {
    const auto value = strings::Trim(text);
    if (strings::IEquals(value, "debug")) return Result<LogLevel, Error>::Ok(LogLevel::Debug);
    if (strings::IEquals(value, "info")) return Result<LogLevel, Error>::Ok(LogLevel::Info);
    if (strings::IEquals(value, "warn") || strings::IEquals(value, "warning")) {
        return Result<LogLevel, Error>::Ok(LogLevel::Warn);
    }
    if (strings::IEquals(value, "error")) return Result<LogLevel, Error>::Ok(LogLevel::Error);
    return Result<LogLevel, Error>::Err(
        MakeConfigError("Invalid log level '" + std::string(value) +
                        "' (expected debug, info, warn or error)"));
}

Result<OutputFormat, Error> ParseOutputFormat(std::string_view text) {
    const auto value = strings::Trim(text);
    if (strings::IEquals(value, "json")) return Result<OutputFormat, Error>::Ok(OutputFormat::Json);
    if (strings::IEquals(value, "xml")) return Result<OutputFormat, Error>::Ok(OutputFormat::Xml);
    return Result<OutputFormat, Error>::Err(
        MakeConfigError("Invalid output format '" + std::string(value) +
                        "' (expected json or xml)"));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ToolConfig& config) {
    if (config.fetch.connect_timeout.count() <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "fetch.connect_timeout must be positive, got " +
            std::to_string(config.fetch.connect_timeout.count())));
    }
    if (config.fetch.read_timeout.count() <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "fetch.read_timeout must be positive, got " +
            std::to_string(config.fetch.read_timeout.count())));
    }
    if (strings::IsBlank(config.fetch.user_agent)) {
        return Result<void, Error>::Err(MakeConfigError("fetch.user_agent must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace comicinfo
