#include <comicinfo/cli/issue_printer.hpp>
#include <comicinfo/config/config_loader.hpp>
#include <comicinfo/core/log.hpp>
#include <comicinfo/loader/content_fetcher.hpp>
#include <comicinfo/loader/loader.hpp>
#include <comicinfo/xml/xml_codec.hpp>

#include <iostream>
#include <memory>

namespace {

using namespace comicinfo;

Result<Issue, Error> LoadInput(const IXmlCodec& codec,
                               const ToolConfig& config,
                               const std::string& input) {
    if (IsLoadableUrl(input)) {
        HttpContentFetcher fetcher(config.fetch);
        return LoadFromUrl(codec, fetcher, input);
    }
    return Load(codec, input);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace comicinfo;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false, std::cerr);
        return kExitUsageError;
    }
    const auto cli = std::move(cli_result).Value();

    ToolConfig base;
    if (cli.config_path.has_value()) {
        auto yaml_result = LoadConfigFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error(), cli.json_log, std::cerr);
            return kExitUsageError;
        }
        base = std::move(yaml_result).Value();
    }
    const auto config = MergeConfigs(base, cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), config.json_log, std::cerr);
        return kExitUsageError;
    }

    if (config.json_log) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log_level);
    } else {
        InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), config.log_level);
    }

    XmlCodec codec;
    auto issue = LoadInput(codec, config, cli.input);
    if (issue.IsErr()) {
        PrintError(issue.Error(), config.json_log, std::cerr);
        return kExitLoadError;
    }

    switch (cli.command) {
        case Command::Validate:
            std::cout << "OK\n";
            return kExitSuccess;
        case Command::Info:
            std::cout << FormatIssueSummary(issue.Value());
            return kExitSuccess;
        case Command::Convert: {
            auto rendered = RenderIssue(codec, issue.Value(), config.output, config.pretty);
            if (rendered.IsErr()) {
                PrintError(rendered.Error(), config.json_log, std::cerr);
                return kExitLoadError;
            }
            std::cout << rendered.Value();
            if (rendered.Value().empty() || rendered.Value().back() != '\n') {
                std::cout << "\n";
            }
            return kExitSuccess;
        }
    }
    return kExitSuccess;
}
