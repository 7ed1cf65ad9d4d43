#include <comicinfo/loader/loader.hpp>

#include <comicinfo/core/log.hpp>
#include <comicinfo/core/strings.hpp>
#include <comicinfo/core/url.hpp>
#include <comicinfo/xml/xml_codec.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace comicinfo {

namespace {

namespace fs = std::filesystem;

const IXmlCodec& DefaultCodec() {
    static const XmlCodec codec;
    return codec;
}

// Digits only, or no path-like character at all.
bool LooksLikePath(std::string_view input) {
    const bool all_digits = std::all_of(input.begin(), input.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (all_digits) {
        return false;
    }
    return input.find_first_of("./\\") != std::string_view::npos;
}

Result<std::string, Error> ReadFileContents(const std::string& path) {
    using R = Result<std::string, Error>;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return R::Err(Error::File("Cannot open file '" + path + "'"));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return R::Err(Error::File("Failed to read file '" + path + "'"));
    }
    return R::Ok(buffer.str());
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string PercentDecode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = HexValue(text[i + 1]);
            const int lo = HexValue(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

Error WrapUrlFailure(const std::string& url, const Error& cause) {
    return Error::File("Failed to read from URL '" + url + "': " + cause.message);
}

Result<std::string, Error> ReadUrlContents(const IContentFetcher& fetcher,
                                           const std::string& url_text) {
    using R = Result<std::string, Error>;

    auto url = Url::Create(url_text);
    if (url.IsErr()) {
        return R::Err(Error::File("Failed to read from URL '" + url_text + "': " + url.Error()));
    }

    if (url.Value().Scheme() == "file") {
        const auto path = PercentDecode(url.Value().Path());
        LogDebug("loader", "Reading file URL from " + path);
        return ReadFileContents(path).MapError(
            [&](Error e) { return WrapUrlFailure(url_text, e); });
    }

    LogDebug("loader", "Fetching " + url_text);
    return fetcher.Fetch(url_text).MapError(
        [&](Error e) { return WrapUrlFailure(url_text, e); });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromXml
// ---------------------------------------------------------------------------
Result<Issue, Error> LoadFromXml(const IXmlCodec& codec, std::string_view xml) {
    LogDebug("loader", "Parsing XML input (" + std::to_string(xml.size()) + " bytes)");
    auto issue = codec.ParseIssue(xml);
    if (issue.IsErr()) {
        LogWarn("loader", issue.Error().ToString());
    }
    return issue;
}

Result<Issue, Error> LoadFromXml(std::string_view xml) {
    return LoadFromXml(DefaultCodec(), xml);
}

// ---------------------------------------------------------------------------
// Load — smart detection
// ---------------------------------------------------------------------------
Result<Issue, Error> Load(const IXmlCodec& codec, std::string_view input) {
    if (input.empty()) {
        return Result<Issue, Error>::Err(Error::Parse("Input cannot be empty"));
    }
    const auto trimmed = strings::Trim(input);
    if (strings::StartsWith(trimmed, "<")) {
        return LoadFromXml(codec, input);
    }
    return LoadFromFile(codec, trimmed);
}

Result<Issue, Error> Load(std::string_view input) {
    return Load(DefaultCodec(), input);
}

// ---------------------------------------------------------------------------
// LoadFromFile
// ---------------------------------------------------------------------------
Result<Issue, Error> LoadFromFile(const IXmlCodec& codec, std::string_view path_view) {
    using R = Result<Issue, Error>;
    const std::string path(path_view);

    if (!LooksLikePath(path)) {
        return R::Err(Error::Parse("Input '" + path +
                                   "' does not appear to be valid XML or a file path"));
    }

    std::error_code ec;
    if (!fs::exists(path, ec) || ec) {
        LogWarn("loader", "File does not exist: '" + path + "'");
        return R::Err(Error::File("File does not exist: '" + path + "'"));
    }
    if (fs::is_directory(path, ec)) {
        return R::Err(Error::File("Path is a directory: '" + path + "'"));
    }

    LogDebug("loader", "Reading " + path);
    auto contents = ReadFileContents(path);
    if (contents.IsErr()) {
        LogWarn("loader", contents.Error().ToString());
        return R::Err(std::move(contents).Error());
    }
    return LoadFromXml(codec, contents.Value());
}

Result<Issue, Error> LoadFromFile(std::string_view path) {
    return LoadFromFile(DefaultCodec(), path);
}

// ---------------------------------------------------------------------------
// LoadFromUrl
// ---------------------------------------------------------------------------
Result<Issue, Error> LoadFromUrl(const IXmlCodec& codec,
                                 const IContentFetcher& fetcher,
                                 std::string_view url) {
    auto contents = ReadUrlContents(fetcher, std::string(url));
    if (contents.IsErr()) {
        LogWarn("loader", contents.Error().ToString());
        return Result<Issue, Error>::Err(std::move(contents).Error());
    }
    return LoadFromXml(codec, contents.Value());
}

Result<Issue, Error> LoadFromUrl(const IContentFetcher& fetcher, std::string_view url) {
    return LoadFromUrl(DefaultCodec(), fetcher, url);
}

std::future<Result<Issue, Error>> LoadFromUrlAsync(
    std::shared_ptr<const IContentFetcher> fetcher, std::string url) {
    return std::async(std::launch::async,
                      [fetcher = std::move(fetcher), url = std::move(url)]() {
                          return LoadFromUrl(*fetcher, url);
                      });
}

bool IsLoadableUrl(std::string_view input) {
    auto url = Url::Create(strings::Trim(input));
    if (url.IsErr()) {
        return false;
    }
    const auto& scheme = url.Value().Scheme();
    return scheme == "http" || scheme == "https" || scheme == "file";
}

} // namespace comicinfo
