#include <catch2/catch_test_macros.hpp>

#include <comicinfo/model/enums.hpp>

using namespace comicinfo;

// ===========================================================================
// Canonical strings
// ===========================================================================

TEST_CASE("Manga: canonical strings", "[model][enums]") {
    CHECK(ToString(Manga::Unknown) == "Unknown");
    CHECK(ToString(Manga::YesAndRightToLeft) == "YesAndRightToLeft");
    CHECK(AllMangaValues() ==
          std::vector<std::string>{"Unknown", "No", "Yes", "YesAndRightToLeft"});
}

TEST_CASE("AgeRating: canonical strings contain spaces and plus signs", "[model][enums]") {
    CHECK(ToString(AgeRating::AdultsOnly18Plus) == "Adults Only 18+");
    CHECK(ToString(AgeRating::Everyone10Plus) == "Everyone 10+");
    CHECK(ToString(AgeRating::KidsToAdults) == "Kids to Adults");
    CHECK(ToString(AgeRating::MA15Plus) == "MA15+");
    CHECK(ToString(AgeRating::RatingPending) == "Rating Pending");
    CHECK(AllAgeRatingValues().size() == 15);
    CHECK(AllAgeRatingValues().front() == "Unknown");
    CHECK(AllAgeRatingValues().back() == "X18+");
}

TEST_CASE("PageType: eleven values, FrontCover first", "[model][enums]") {
    REQUIRE(AllPageTypeValues().size() == 11);
    CHECK(AllPageTypeValues().front() == "FrontCover");
    CHECK(AllPageTypeValues().back() == "Deleted");
}

TEST_CASE("Enums: every canonical string parses back", "[model][enums]") {
    for (const auto& name : AllAgeRatingValues()) {
        auto parsed = AgeRatingFromStringStrict(name);
        REQUIRE(parsed.IsOk());
        CHECK(ToString(parsed.Value()) == name);
    }
    for (const auto& name : AllPageTypeValues()) {
        REQUIRE(PageTypeFromStringStrict(name).IsOk());
    }
    for (const auto& name : AllBlackAndWhiteValues()) {
        REQUIRE(BlackAndWhiteFromStringStrict(name).IsOk());
    }
}

// ===========================================================================
// Lenient vs strict
// ===========================================================================

TEST_CASE("Lenient parsers fall back to the default", "[model][enums]") {
    CHECK(MangaFromStringLenient("Maybe") == Manga::Unknown);
    CHECK(MangaFromStringLenient("") == Manga::Unknown);
    CHECK(AgeRatingFromStringLenient("teen") == AgeRating::Unknown);
    CHECK(BlackAndWhiteFromStringLenient("true") == BlackAndWhite::Unknown);
    CHECK(PageTypeFromStringLenient("Cover") == PageType::Story);
    CHECK(PageTypeFromStringLenient("BackCover") == PageType::BackCover);
}

TEST_CASE("Strict parser reports field, value and valid values", "[model][enums]") {
    auto r = MangaFromStringStrict("InvalidValue");
    REQUIRE(r.IsErr());
    const auto& e = r.Error();
    CHECK(e.kind == ErrorKind::InvalidEnum);
    CHECK(e.field == "Manga");
    CHECK(e.value == "InvalidValue");
    CHECK(e.valid_values ==
          std::vector<std::string>{"Unknown", "No", "Yes", "YesAndRightToLeft"});
}

TEST_CASE("Strict parsers are case-sensitive", "[model][enums]") {
    CHECK(AgeRatingFromStringStrict("teen").IsErr());
    CHECK(PageTypeFromStringStrict("frontcover").Error().field == "PageType");
    CHECK(BlackAndWhiteFromStringStrict("YES").Error().field == "BlackAndWhite");
}

// ===========================================================================
// Predicates
// ===========================================================================

TEST_CASE("Enum predicates", "[model][enums]") {
    CHECK(IsManga(Manga::Yes));
    CHECK(IsManga(Manga::YesAndRightToLeft));
    CHECK_FALSE(IsManga(Manga::No));
    CHECK(IsRightToLeft(Manga::YesAndRightToLeft));
    CHECK_FALSE(IsRightToLeft(Manga::Yes));

    CHECK(IsBlackAndWhite(BlackAndWhite::Yes));
    CHECK_FALSE(IsBlackAndWhite(BlackAndWhite::Unknown));

    CHECK(IsCover(PageType::FrontCover));
    CHECK(IsCover(PageType::InnerCover));
    CHECK(IsCover(PageType::BackCover));
    CHECK_FALSE(IsCover(PageType::Story));
    CHECK(IsStory(PageType::Story));
    CHECK(IsDeleted(PageType::Deleted));
}
