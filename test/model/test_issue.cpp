#include <catch2/catch_test_macros.hpp>

#include <comicinfo/model/issue.hpp>

using namespace comicinfo;

// ===========================================================================
// IssueBuilder
// ===========================================================================

TEST_CASE("Issue: default is empty", "[model][issue]") {
    Issue issue;
    CHECK_FALSE(issue.Title().has_value());
    CHECK_FALSE(issue.Year().has_value());
    CHECK_FALSE(issue.HasPages());
    CHECK(issue.Characters().empty());
    CHECK_FALSE(issue.PublicationDate().has_value());
}

TEST_CASE("IssueBuilder: trims text and drops blanks", "[model][issue]") {
    auto issue = IssueBuilder()
                     .Title("  Saga  ")
                     .Series("\n")
                     .Writer("")
                     .Build();
    REQUIRE(issue.IsOk());
    CHECK(issue.Value().Title() == std::optional<std::string>("Saga"));
    CHECK_FALSE(issue.Value().Series().has_value());
    CHECK_FALSE(issue.Value().Writer().has_value());
}

TEST_CASE("IssueBuilder: range boundaries", "[model][issue]") {
    CHECK(IssueBuilder().Year(1000).Build().IsOk());
    CHECK(IssueBuilder().Year(9999).Build().IsOk());
    CHECK(IssueBuilder().Month(1).Day(31).Build().IsOk());
    CHECK(IssueBuilder().CommunityRating(5.0).Build().IsOk());
    CHECK(IssueBuilder().CommunityRating(0.0).Build().IsOk());

    auto year = IssueBuilder().Year(999).Build();
    REQUIRE(year.IsErr());
    CHECK(year.Error().kind == ErrorKind::Range);
    CHECK(year.Error().field == "Year");
    CHECK(year.Error().value == "999");

    CHECK(IssueBuilder().Year(10000).Build().Error().kind == ErrorKind::Range);
    CHECK(IssueBuilder().Month(0).Build().Error().field == "Month");
    CHECK(IssueBuilder().Month(13).Build().Error().field == "Month");
    CHECK(IssueBuilder().Day(0).Build().Error().field == "Day");
    CHECK(IssueBuilder().Day(32).Build().Error().field == "Day");

    auto rating = IssueBuilder().CommunityRating(5.1).Build();
    REQUIRE(rating.IsErr());
    CHECK(rating.Error().field == "CommunityRating");
    CHECK(rating.Error().value == "5.1");
    CHECK(rating.Error().min == "0.0");
    CHECK(rating.Error().max == "5.0");
}

TEST_CASE("IssueBuilder: copy-and-modify from an existing issue", "[model][issue]") {
    auto base = IssueBuilder().Title("One").Year(2020).AddPage(Page(0)).Build().Value();
    auto changed = IssueBuilder(base).Title("Two").Build();
    REQUIRE(changed.IsOk());
    CHECK(changed.Value().Title() == std::optional<std::string>("Two"));
    CHECK(changed.Value().Year() == 2020);
    CHECK(changed.Value().Pages().size() == 1);
    CHECK(base.Title() == std::optional<std::string>("One"));
}

// ===========================================================================
// Multi-value views
// ===========================================================================

TEST_CASE("Issue: comma-separated views", "[model][issue]") {
    auto issue = IssueBuilder()
                     .Characters("Spider-Man, Mary Jane Watson , ,J. Jonah Jameson")
                     .Genre("Superhero,Action")
                     .Teams("Avengers")
                     .Locations("New York")
                     .StoryArc("Arc One, Arc Two")
                     .StoryArcNumber("1, 2")
                     .Build()
                     .Value();

    CHECK(issue.CharactersRawData() ==
          std::optional<std::string>("Spider-Man, Mary Jane Watson , ,J. Jonah Jameson"));
    CHECK(issue.Characters() ==
          std::vector<std::string>{"Spider-Man", "Mary Jane Watson", "J. Jonah Jameson"});
    CHECK(issue.Genres() == std::vector<std::string>{"Superhero", "Action"});
    CHECK(issue.Teams() == std::vector<std::string>{"Avengers"});
    CHECK(issue.Locations() == std::vector<std::string>{"New York"});
    CHECK(issue.StoryArcs() == std::vector<std::string>{"Arc One", "Arc Two"});
    CHECK(issue.StoryArcNumbers() == std::vector<std::string>{"1", "2"});
}

TEST_CASE("Issue: web URLs split on whitespace", "[model][issue]") {
    auto issue = IssueBuilder().Web("https://a.com https://b.com/x").Build().Value();
    auto urls = issue.WebUrls();
    REQUIRE(urls.size() == 2);
    CHECK(urls[0].Value() == "https://a.com");
    CHECK(urls[1].Value() == "https://b.com/x");
    CHECK(urls[1].Host() == "b.com");
}

TEST_CASE("Issue: invalid web tokens are dropped", "[model][issue]") {
    auto issue = IssueBuilder().Web("https://ok.com not-a-url https://").Build().Value();
    auto urls = issue.WebUrls();
    REQUIRE(urls.size() == 1);
    CHECK(urls[0].Value() == "https://ok.com");
}

// ===========================================================================
// Derived
// ===========================================================================

TEST_CASE("Issue: page filters", "[model][issue]") {
    auto issue = IssueBuilder()
                     .AddPage(Page(0, PageType::FrontCover))
                     .AddPage(Page(1))
                     .AddPage(Page(2))
                     .AddPage(Page(3, PageType::BackCover))
                     .AddPage(Page(4, PageType::Advertisement))
                     .Build()
                     .Value();
    CHECK(issue.HasPages());
    CHECK(issue.CoverPages().size() == 2);
    CHECK(issue.StoryPages().size() == 2);
    CHECK(issue.StoryPages()[0].Image() == 1);
}

TEST_CASE("Issue: manga and black-and-white flags", "[model][issue]") {
    auto rtl = IssueBuilder().Manga(Manga::YesAndRightToLeft).Build().Value();
    CHECK(rtl.IsManga());
    CHECK(rtl.IsRightToLeft());

    auto plain = IssueBuilder().Manga(Manga::No).BlackAndWhite(BlackAndWhite::Yes)
                     .Build().Value();
    CHECK_FALSE(plain.IsManga());
    CHECK(plain.IsBlackAndWhite());

    CHECK_FALSE(Issue().IsManga());
    CHECK_FALSE(Issue().IsBlackAndWhite());
}

TEST_CASE("Issue: publication date defaults month and day", "[model][issue]") {
    auto full = IssueBuilder().Year(2018).Month(3).Day(15).Build().Value();
    REQUIRE(full.PublicationDate().has_value());
    CHECK(full.PublicationDate()->ToIsoString() == "2018-03-15");

    auto year_only = IssueBuilder().Year(2018).Build().Value();
    CHECK(year_only.PublicationDate()->ToIsoString() == "2018-01-01");

    CHECK_FALSE(IssueBuilder().Month(3).Build().Value().PublicationDate().has_value());
}

TEST_CASE("Issue: publication date normalizes impossible days", "[model][issue]") {
    auto feb = IssueBuilder().Year(2021).Month(2).Day(31).Build().Value();
    CHECK(feb.PublicationDate()->ToIsoString() == "2021-03-03");

    auto leap = IssueBuilder().Year(2020).Month(2).Day(30).Build().Value();
    CHECK(leap.PublicationDate()->ToIsoString() == "2020-03-01");
}

TEST_CASE("CalendarDate: epoch arithmetic", "[model][issue]") {
    CHECK(CalendarDate::FromComponents(1970, 1, 1).DaysSinceEpoch() == 0);
    CHECK(CalendarDate::FromComponents(1970, 1, 2).DaysSinceEpoch() == 1);
    CHECK(CalendarDate::FromComponents(2000, 3, 1).DaysSinceEpoch() == 11017);
    CHECK(CalendarDate::FromComponents(2020, 13, 1) == CalendarDate{2021, 1, 1});
}

TEST_CASE("Issue: equality covers fields and pages", "[model][issue]") {
    auto a = IssueBuilder().Title("X").AddPage(Page(0)).Build().Value();
    auto b = IssueBuilder().Title("X").AddPage(Page(0)).Build().Value();
    auto c = IssueBuilder().Title("X").AddPage(Page(1)).Build().Value();
    CHECK(a == b);
    CHECK(a != c);
}
