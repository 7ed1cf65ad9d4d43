#include <catch2/catch_test_macros.hpp>

#include <comicinfo/loader/loader.hpp>
#include "mocks/mock_content_fetcher.hpp"
#include "mocks/mock_xml_codec.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace comicinfo;
using comicinfo::testing::MockContentFetcher;
using comicinfo::testing::MockXmlCodec;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    return test_root + "/testdata/" + filename;
}

std::string LoadFixture(const std::string& filename) {
    std::ifstream in(TestDataPath(filename));
    REQUIRE(in.good());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string FileUrl(const std::string& path) {
    std::string url = "file://";
    for (char c : path) {
        if (c == ' ') {
            url += "%20";
        } else {
            url += c;
        }
    }
    return url;
}

const char* kMinimalXml =
    "<ComicInfo><Title>Minimal Comic</Title><Series>Test Series</Series>"
    "<Number>1</Number></ComicInfo>";

} // anonymous namespace

// ===========================================================================
// LoadFromXml / Load
// ===========================================================================

TEST_CASE("Load: XML string", "[loader]") {
    auto result = Load(kMinimalXml);
    REQUIRE(result.IsOk());
    CHECK(result.Value().Title() == std::optional<std::string>("Minimal Comic"));
}

TEST_CASE("Load: leading whitespace before XML", "[loader]") {
    auto result = Load(std::string("\n   ") + kMinimalXml);
    REQUIRE(result.IsOk());
    CHECK(result.Value().Number() == std::optional<std::string>("1"));
}

TEST_CASE("Load: file path", "[loader]") {
    auto result = Load(TestDataPath("valid_complete.xml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().Pages().size() == 5);
}

TEST_CASE("Load: empty input", "[loader][errors]") {
    auto result = Load("");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Parse);
}

TEST_CASE("Load: digits are neither XML nor a path", "[loader][errors]") {
    auto result = Load("12345");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Parse);
    CHECK(result.Error().message.find("12345") != std::string::npos);

    CHECK(Load("hello").Error().kind == ErrorKind::Parse);
}

TEST_CASE("Load: nonexistent file", "[loader][errors]") {
    auto result = Load("/nonexistent/path/ComicInfo.xml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::File);
    CHECK(result.Error().message.find("/nonexistent/path/ComicInfo.xml") != std::string::npos);
}

TEST_CASE("LoadFromFile: directory is a file error", "[loader][errors]") {
    auto dir = std::filesystem::temp_directory_path().string();
    auto result = LoadFromFile(dir);
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::File);
}

TEST_CASE("LoadFromFile: XML errors pass through unchanged", "[loader][errors]") {
    auto result = LoadFromFile(TestDataPath("invalid_month.xml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Range);
    CHECK(result.Error().field == "Month");
}

TEST_CASE("LoadFromXml: delegates to the given codec", "[loader][mock]") {
    MockXmlCodec codec;
    auto canned = IssueBuilder().Title("From mock").Build().Value();
    codec.SetParseIssueResponse(Result<Issue, Error>::Ok(canned));

    auto result = Load(codec, "<ComicInfo/>");
    REQUIRE(result.IsOk());
    CHECK(result.Value() == canned);
    REQUIRE(codec.CallCount("ParseIssue") == 1);
    CHECK(codec.Calls()[0].arg == "<ComicInfo/>");
}

TEST_CASE("LoadFromFile: file contents reach the codec", "[loader][mock]") {
    MockXmlCodec codec;
    codec.SetParseIssueResponse(Result<Issue, Error>::Err(Error::Schema("nope")));

    auto result = LoadFromFile(codec, TestDataPath("valid_minimal.xml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Schema);
    REQUIRE(codec.CallCount("ParseIssue") == 1);
    CHECK(codec.Calls()[0].arg == LoadFixture("valid_minimal.xml"));
}

// ===========================================================================
// LoadFromUrl
// ===========================================================================

TEST_CASE("LoadFromUrl: http body is parsed", "[loader][url]") {
    MockContentFetcher fetcher;
    fetcher.SetBody("https://example.com/ComicInfo.xml", kMinimalXml);

    auto result = LoadFromUrl(fetcher, "https://example.com/ComicInfo.xml");
    REQUIRE(result.IsOk());
    CHECK(result.Value().Series() == std::optional<std::string>("Test Series"));
    CHECK(fetcher.Requests() == std::vector<std::string>{"https://example.com/ComicInfo.xml"});
}

TEST_CASE("LoadFromUrl: fetch failure is wrapped as file error", "[loader][url]") {
    MockContentFetcher fetcher;
    auto result = LoadFromUrl(fetcher, "https://example.com/missing.xml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::File);
    CHECK(result.Error().message ==
          "Failed to read from URL 'https://example.com/missing.xml': HTTP status 404");
}

TEST_CASE("LoadFromUrl: malformed body keeps its parse error", "[loader][url]") {
    MockContentFetcher fetcher;
    fetcher.SetBody("https://example.com/bad.xml", "<ComicInfo><Title>Test</ComicInfo>");
    auto result = LoadFromUrl(fetcher, "https://example.com/bad.xml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Parse);
}

TEST_CASE("LoadFromUrl: invalid URL", "[loader][url]") {
    MockContentFetcher fetcher;
    auto result = LoadFromUrl(fetcher, "https://");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::File);
    CHECK(result.Error().message.rfind("Failed to read from URL", 0) == 0);
    CHECK(fetcher.RequestCount() == 0);
}

TEST_CASE("LoadFromUrl: file URL reads from disk", "[loader][url]") {
    MockContentFetcher fetcher;
    auto result = LoadFromUrl(fetcher, FileUrl(TestDataPath("valid_complete.xml")));
    REQUIRE(result.IsOk());
    CHECK(result.Value().Year() == 2018);
    CHECK(fetcher.RequestCount() == 0);
}

TEST_CASE("LoadFromUrl: missing file URL", "[loader][url]") {
    MockContentFetcher fetcher;
    auto result = LoadFromUrl(fetcher, "file:///nonexistent/ComicInfo.xml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::File);
    CHECK(result.Error().message.find("Failed to read from URL") != std::string::npos);
}

TEST_CASE("LoadFromUrlAsync: resolves on a worker thread", "[loader][url]") {
    auto fetcher = std::make_shared<MockContentFetcher>();
    fetcher->SetBody("https://example.com/a.xml", kMinimalXml);

    auto future = LoadFromUrlAsync(fetcher, "https://example.com/a.xml");
    REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    auto result = future.get();
    REQUIRE(result.IsOk());
    CHECK(result.Value().Title() == std::optional<std::string>("Minimal Comic"));
    CHECK(fetcher->RequestCount() == 1);
}

TEST_CASE("IsLoadableUrl", "[loader][url]") {
    CHECK(IsLoadableUrl("https://example.com/x.xml"));
    CHECK(IsLoadableUrl("http://example.com"));
    CHECK(IsLoadableUrl("file:///tmp/x.xml"));
    CHECK_FALSE(IsLoadableUrl("ftp://example.com/x.xml"));
    CHECK_FALSE(IsLoadableUrl("/tmp/x.xml"));
    CHECK_FALSE(IsLoadableUrl("<ComicInfo/>"));
    CHECK_FALSE(IsLoadableUrl(""));
}

// ===========================================================================
// HttpContentFetcher (offline paths only)
// ===========================================================================

TEST_CASE("HttpContentFetcher: keeps its options", "[loader][http]") {
    FetchOptions options;
    options.connect_timeout = std::chrono::seconds(3);
    options.user_agent = "test-agent";
    HttpContentFetcher fetcher(options);
    CHECK(fetcher.Options().connect_timeout == std::chrono::seconds(3));
    CHECK(fetcher.Options().user_agent == "test-agent");
    CHECK(fetcher.Options().follow_redirects);
}

TEST_CASE("HttpContentFetcher: rejects non-http schemes", "[loader][http]") {
    HttpContentFetcher fetcher;
    auto ftp = fetcher.Fetch("ftp://example.com/ComicInfo.xml");
    REQUIRE(ftp.IsErr());
    CHECK(ftp.Error().kind == ErrorKind::File);
    CHECK(ftp.Error().message.find("ftp") != std::string::npos);

    auto bad = fetcher.Fetch("not a url");
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().kind == ErrorKind::File);
}
