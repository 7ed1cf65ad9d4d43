#include <catch2/catch_test_macros.hpp>

#include <comicinfo/cli/issue_printer.hpp>
#include <comicinfo/xml/xml_codec.hpp>
#include "mocks/mock_xml_codec.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace comicinfo;
using comicinfo::testing::MockXmlCodec;

namespace {

Issue SampleIssue() {
    return IssueBuilder()
        .Title("Brand New Day")
        .Series("The Amazing Spider-Man")
        .Number("546")
        .Count(600)
        .Volume(3)
        .Year(2008)
        .Month(1)
        .Writer("Dan Slott")
        .Genre("Superhero, Action")
        .AgeRating(AgeRating::Teen)
        .CommunityRating(4.5)
        .Web("https://marvel.com/a not-a-url")
        .AddPage(Page(0, PageType::FrontCover))
        .AddPage(Page(1))
        .AddPage(Page(2))
        .Build()
        .Value();
}

} // anonymous namespace

// ===========================================================================
// FormatIssueSummary
// ===========================================================================

TEST_CASE("FormatIssueSummary: populated issue", "[cli][summary]") {
    auto text = FormatIssueSummary(SampleIssue());

    CHECK(text.find("Title: Brand New Day\n") != std::string::npos);
    CHECK(text.find("Series: The Amazing Spider-Man #546 of 600 (vol. 3)\n") !=
          std::string::npos);
    CHECK(text.find("Published: 2008-01-01\n") != std::string::npos);
    CHECK(text.find("Writer: Dan Slott\n") != std::string::npos);
    CHECK(text.find("Genres: Superhero, Action\n") != std::string::npos);
    CHECK(text.find("Age rating: Teen\n") != std::string::npos);
    CHECK(text.find("Rating: 4.5\n") != std::string::npos);
    CHECK(text.find("Web: https://marvel.com/a\n") != std::string::npos);
    CHECK(text.find("Pages: 3 (1 cover, 2 story)\n") != std::string::npos);
    CHECK(text.find("Publisher") == std::string::npos);
    CHECK(text.find("Manga") == std::string::npos);
}

TEST_CASE("FormatIssueSummary: manga reading direction", "[cli][summary]") {
    auto issue = IssueBuilder()
                     .Manga(Manga::YesAndRightToLeft)
                     .BlackAndWhite(BlackAndWhite::Yes)
                     .Build()
                     .Value();
    auto text = FormatIssueSummary(issue);
    CHECK(text.find("Manga: YesAndRightToLeft (right to left)\n") != std::string::npos);
    CHECK(text.find("Black and white: yes\n") != std::string::npos);
}

TEST_CASE("FormatIssueSummary: empty issue prints nothing", "[cli][summary]") {
    CHECK(FormatIssueSummary(Issue()).empty());
}

// ===========================================================================
// RenderIssue
// ===========================================================================

TEST_CASE("RenderIssue: JSON pretty and compact", "[cli][render]") {
    XmlCodec codec;
    auto pretty = RenderIssue(codec, SampleIssue(), OutputFormat::Json, true);
    REQUIRE(pretty.IsOk());
    CHECK(pretty.Value().find('\n') != std::string::npos);

    auto compact = RenderIssue(codec, SampleIssue(), OutputFormat::Json, false);
    REQUIRE(compact.IsOk());
    CHECK(compact.Value().find('\n') == std::string::npos);
    CHECK(nlohmann::json::parse(compact.Value())["number"] == "546");
}

TEST_CASE("RenderIssue: XML goes through the codec", "[cli][render]") {
    MockXmlCodec codec;
    codec.SetBuildIssueXmlResponse(Result<std::string, Error>::Ok("<ComicInfo/>"));

    auto result = RenderIssue(codec, SampleIssue(), OutputFormat::Xml, true);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "<ComicInfo/>");
    REQUIRE(codec.CallCount("BuildIssueXml") == 1);
    CHECK(codec.Calls()[0].arg == "Brand New Day");
}

TEST_CASE("RenderIssue: codec failure is returned", "[cli][render]") {
    MockXmlCodec codec;
    auto result = RenderIssue(codec, SampleIssue(), OutputFormat::Xml, true);
    REQUIRE(result.IsErr());
    CHECK(codec.CallCount("BuildIssueXml") == 1);
}

// ===========================================================================
// PrintError
// ===========================================================================

TEST_CASE("PrintError: text form", "[cli][errors]") {
    std::ostringstream out;
    PrintError(Error::Range("Month", "13", "1", "12"), false, out);
    CHECK(out.str() == "Error: Value '13' for field 'Month' is out of range (1..12)\n");
}

TEST_CASE("PrintError: JSON envelope", "[cli][errors]") {
    std::ostringstream out;
    PrintError(Error::File("File does not exist: 'x.xml'"), true, out);
    auto j = nlohmann::json::parse(out.str());
    CHECK(j["error"]["kind"] == "file");
    CHECK(j["error"]["message"] == "File error: File does not exist: 'x.xml'");
}
