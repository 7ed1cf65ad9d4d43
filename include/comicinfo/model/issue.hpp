#pragma once

#include <comicinfo/core/result.hpp>
#include <comicinfo/core/url.hpp>
#include <comicinfo/model/enums.hpp>
#include <comicinfo/model/page.hpp>

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace comicinfo {

// Closed ranges enforced on parse and on Build().
constexpr int kMinYear = 1000;
constexpr int kMaxYear = 9999;
constexpr int kMinMonth = 1;
constexpr int kMaxMonth = 12;
constexpr int kMinDay = 1;
constexpr int kMaxDay = 31;
constexpr double kMinCommunityRating = 0.0;
constexpr double kMaxCommunityRating = 5.0;

// ---------------------------------------------------------------------------
// CalendarDate — proleptic Gregorian date, always normalized (2021-02-31 is
// stored as 2021-03-03).
// ---------------------------------------------------------------------------
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    /// Normalizing constructor; month and day may overflow their ranges.
    static CalendarDate FromComponents(int year, int month, int day);

    /// Days relative to 1970-01-01.
    [[nodiscard]] long long DaysSinceEpoch() const;

    /// "YYYY-MM-DD".
    [[nodiscard]] std::string ToIsoString() const;

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// IssueFields — every stored field of an Issue. Absent is nullopt; there is
// no empty-string state for optional text fields once built.
// ---------------------------------------------------------------------------
struct IssueFields {
    std::optional<comicinfo::AgeRating> age_rating;
    std::optional<int> alternate_count;
    std::optional<std::string> alternate_number;
    std::optional<std::string> alternate_series;
    std::optional<comicinfo::BlackAndWhite> black_and_white;
    std::optional<std::string> characters;
    std::optional<std::string> colorist;
    std::optional<double> community_rating;
    std::optional<int> count;
    std::optional<std::string> cover_artist;
    std::optional<int> day;
    std::optional<std::string> editor;
    std::optional<std::string> format;
    std::optional<std::string> genre;
    std::optional<std::string> imprint;
    std::optional<std::string> inker;
    std::optional<std::string> language_iso;
    std::optional<std::string> letterer;
    std::optional<std::string> locations;
    std::optional<std::string> main_character_or_team;
    std::optional<comicinfo::Manga> manga;
    std::optional<int> month;
    std::optional<std::string> notes;
    std::optional<std::string> number;
    std::optional<int> page_count;
    std::optional<std::string> penciller;
    std::optional<std::string> publisher;
    std::optional<std::string> review;
    std::optional<std::string> scan_information;
    std::optional<std::string> series;
    std::optional<std::string> series_group;
    std::optional<std::string> story_arc;
    std::optional<std::string> story_arc_number;
    std::optional<std::string> summary;
    std::optional<std::string> teams;
    std::optional<std::string> title;
    std::optional<std::string> translator;
    std::optional<int> volume;
    std::optional<std::string> web;
    std::optional<std::string> writer;
    std::optional<int> year;
    std::vector<comicinfo::Page> pages;

    [[nodiscard]] auto Tie() const {
        return std::tie(age_rating, alternate_count, alternate_number, alternate_series,
                        black_and_white, characters, colorist, community_rating, count,
                        cover_artist, day, editor, format, genre, imprint, inker,
                        language_iso, letterer, locations, main_character_or_team, manga,
                        month, notes, number, page_count, penciller, publisher, review,
                        scan_information, series, series_group, story_arc,
                        story_arc_number, summary, teams, title, translator, volume, web,
                        writer, year, pages);
    }
};

class IssueBuilder;

// ---------------------------------------------------------------------------
// Issue — one comic book's ComicInfo metadata.
//
// Immutable value, produced by the XML/JSON codecs or IssueBuilder::Build().
// Multi-value fields (Characters, Teams, Locations, Genre, StoryArc,
// StoryArcNumber, Web) are stored once as the raw delimited string; the
// array views are computed on each call.
// ---------------------------------------------------------------------------
class Issue {
public:
    /// Empty issue: every field absent, no pages.
    Issue() = default;

    // -- Stored fields ------------------------------------------------------

    [[nodiscard]] const std::optional<comicinfo::AgeRating>& AgeRating() const noexcept { return f_.age_rating; }
    [[nodiscard]] const std::optional<int>& AlternateCount() const noexcept { return f_.alternate_count; }
    [[nodiscard]] const std::optional<std::string>& AlternateNumber() const noexcept { return f_.alternate_number; }
    [[nodiscard]] const std::optional<std::string>& AlternateSeries() const noexcept { return f_.alternate_series; }
    [[nodiscard]] const std::optional<comicinfo::BlackAndWhite>& BlackAndWhite() const noexcept { return f_.black_and_white; }
    [[nodiscard]] const std::optional<std::string>& CharactersRawData() const noexcept { return f_.characters; }
    [[nodiscard]] const std::optional<std::string>& Colorist() const noexcept { return f_.colorist; }
    [[nodiscard]] const std::optional<double>& CommunityRating() const noexcept { return f_.community_rating; }
    [[nodiscard]] const std::optional<int>& Count() const noexcept { return f_.count; }
    [[nodiscard]] const std::optional<std::string>& CoverArtist() const noexcept { return f_.cover_artist; }
    [[nodiscard]] const std::optional<int>& Day() const noexcept { return f_.day; }
    [[nodiscard]] const std::optional<std::string>& Editor() const noexcept { return f_.editor; }
    [[nodiscard]] const std::optional<std::string>& Format() const noexcept { return f_.format; }
    [[nodiscard]] const std::optional<std::string>& GenreRawData() const noexcept { return f_.genre; }
    [[nodiscard]] const std::optional<std::string>& Imprint() const noexcept { return f_.imprint; }
    [[nodiscard]] const std::optional<std::string>& Inker() const noexcept { return f_.inker; }
    [[nodiscard]] const std::optional<std::string>& LanguageIso() const noexcept { return f_.language_iso; }
    [[nodiscard]] const std::optional<std::string>& Letterer() const noexcept { return f_.letterer; }
    [[nodiscard]] const std::optional<std::string>& LocationsRawData() const noexcept { return f_.locations; }
    [[nodiscard]] const std::optional<std::string>& MainCharacterOrTeam() const noexcept { return f_.main_character_or_team; }
    [[nodiscard]] const std::optional<comicinfo::Manga>& Manga() const noexcept { return f_.manga; }
    [[nodiscard]] const std::optional<int>& Month() const noexcept { return f_.month; }
    [[nodiscard]] const std::optional<std::string>& Notes() const noexcept { return f_.notes; }
    [[nodiscard]] const std::optional<std::string>& Number() const noexcept { return f_.number; }
    [[nodiscard]] const std::optional<int>& PageCount() const noexcept { return f_.page_count; }
    [[nodiscard]] const std::optional<std::string>& Penciller() const noexcept { return f_.penciller; }
    [[nodiscard]] const std::optional<std::string>& Publisher() const noexcept { return f_.publisher; }
    [[nodiscard]] const std::optional<std::string>& Review() const noexcept { return f_.review; }
    [[nodiscard]] const std::optional<std::string>& ScanInformation() const noexcept { return f_.scan_information; }
    [[nodiscard]] const std::optional<std::string>& Series() const noexcept { return f_.series; }
    [[nodiscard]] const std::optional<std::string>& SeriesGroup() const noexcept { return f_.series_group; }
    [[nodiscard]] const std::optional<std::string>& StoryArcRawData() const noexcept { return f_.story_arc; }
    [[nodiscard]] const std::optional<std::string>& StoryArcNumberRawData() const noexcept { return f_.story_arc_number; }
    [[nodiscard]] const std::optional<std::string>& Summary() const noexcept { return f_.summary; }
    [[nodiscard]] const std::optional<std::string>& TeamsRawData() const noexcept { return f_.teams; }
    [[nodiscard]] const std::optional<std::string>& Title() const noexcept { return f_.title; }
    [[nodiscard]] const std::optional<std::string>& Translator() const noexcept { return f_.translator; }
    [[nodiscard]] const std::optional<int>& Volume() const noexcept { return f_.volume; }
    [[nodiscard]] const std::optional<std::string>& WebRawData() const noexcept { return f_.web; }
    [[nodiscard]] const std::optional<std::string>& Writer() const noexcept { return f_.writer; }
    [[nodiscard]] const std::optional<int>& Year() const noexcept { return f_.year; }
    [[nodiscard]] const std::vector<comicinfo::Page>& Pages() const noexcept { return f_.pages; }

    [[nodiscard]] const IssueFields& Fields() const noexcept { return f_; }

    // -- Multi-value views --------------------------------------------------
    // Comma split, each element trimmed, blank elements dropped.

    [[nodiscard]] std::vector<std::string> Characters() const;
    [[nodiscard]] std::vector<std::string> Teams() const;
    [[nodiscard]] std::vector<std::string> Locations() const;
    [[nodiscard]] std::vector<std::string> Genres() const;
    [[nodiscard]] std::vector<std::string> StoryArcs() const;
    [[nodiscard]] std::vector<std::string> StoryArcNumbers() const;

    /// Whitespace split; tokens that are not valid URLs are dropped.
    [[nodiscard]] std::vector<Url> WebUrls() const;

    // -- Derived ------------------------------------------------------------

    [[nodiscard]] bool HasPages() const noexcept { return !f_.pages.empty(); }
    [[nodiscard]] std::vector<comicinfo::Page> CoverPages() const;
    [[nodiscard]] std::vector<comicinfo::Page> StoryPages() const;

    [[nodiscard]] bool IsManga() const noexcept;
    [[nodiscard]] bool IsRightToLeft() const noexcept;
    [[nodiscard]] bool IsBlackAndWhite() const noexcept;

    /// Year/Month/Day with month and day defaulting to 1. nullopt without a
    /// positive year.
    [[nodiscard]] std::optional<CalendarDate> PublicationDate() const;

    bool operator==(const Issue& other) const { return f_.Tie() == other.f_.Tie(); }
    bool operator!=(const Issue& other) const { return !(*this == other); }

private:
    friend class IssueBuilder;
    explicit Issue(IssueFields fields) : f_(std::move(fields)) {}

    IssueFields f_;
};

// ---------------------------------------------------------------------------
// IssueBuilder — named-field construction of an Issue.
//
//   auto issue = IssueBuilder().Title("Saga").Year(2012).Build();
//
// Build() trims every text field (blank → absent) and enforces the Year,
// Month, Day and CommunityRating ranges (RangeError).
// ---------------------------------------------------------------------------
class IssueBuilder {
public:
    IssueBuilder() = default;
    explicit IssueBuilder(const Issue& issue) : f_(issue.Fields()) {}

    IssueBuilder& AgeRating(std::optional<comicinfo::AgeRating> v) { f_.age_rating = v; return *this; }
    IssueBuilder& AlternateCount(std::optional<int> v) { f_.alternate_count = v; return *this; }
    IssueBuilder& AlternateNumber(std::optional<std::string> v) { f_.alternate_number = std::move(v); return *this; }
    IssueBuilder& AlternateSeries(std::optional<std::string> v) { f_.alternate_series = std::move(v); return *this; }
    IssueBuilder& BlackAndWhite(std::optional<comicinfo::BlackAndWhite> v) { f_.black_and_white = v; return *this; }
    IssueBuilder& Characters(std::optional<std::string> v) { f_.characters = std::move(v); return *this; }
    IssueBuilder& Colorist(std::optional<std::string> v) { f_.colorist = std::move(v); return *this; }
    IssueBuilder& CommunityRating(std::optional<double> v) { f_.community_rating = v; return *this; }
    IssueBuilder& Count(std::optional<int> v) { f_.count = v; return *this; }
    IssueBuilder& CoverArtist(std::optional<std::string> v) { f_.cover_artist = std::move(v); return *this; }
    IssueBuilder& Day(std::optional<int> v) { f_.day = v; return *this; }
    IssueBuilder& Editor(std::optional<std::string> v) { f_.editor = std::move(v); return *this; }
    IssueBuilder& Format(std::optional<std::string> v) { f_.format = std::move(v); return *this; }
    IssueBuilder& Genre(std::optional<std::string> v) { f_.genre = std::move(v); return *this; }
    IssueBuilder& Imprint(std::optional<std::string> v) { f_.imprint = std::move(v); return *this; }
    IssueBuilder& Inker(std::optional<std::string> v) { f_.inker = std::move(v); return *this; }
    IssueBuilder& LanguageIso(std::optional<std::string> v) { f_.language_iso = std::move(v); return *this; }
    IssueBuilder& Letterer(std::optional<std::string> v) { f_.letterer = std::move(v); return *this; }
    IssueBuilder& Locations(std::optional<std::string> v) { f_.locations = std::move(v); return *this; }
    IssueBuilder& MainCharacterOrTeam(std::optional<std::string> v) { f_.main_character_or_team = std::move(v); return *this; }
    IssueBuilder& Manga(std::optional<comicinfo::Manga> v) { f_.manga = v; return *this; }
    IssueBuilder& Month(std::optional<int> v) { f_.month = v; return *this; }
    IssueBuilder& Notes(std::optional<std::string> v) { f_.notes = std::move(v); return *this; }
    IssueBuilder& Number(std::optional<std::string> v) { f_.number = std::move(v); return *this; }
    IssueBuilder& PageCount(std::optional<int> v) { f_.page_count = v; return *this; }
    IssueBuilder& Penciller(std::optional<std::string> v) { f_.penciller = std::move(v); return *this; }
    IssueBuilder& Publisher(std::optional<std::string> v) { f_.publisher = std::move(v); return *this; }
    IssueBuilder& Review(std::optional<std::string> v) { f_.review = std::move(v); return *this; }
    IssueBuilder& ScanInformation(std::optional<std::string> v) { f_.scan_information = std::move(v); return *this; }
    IssueBuilder& Series(std::optional<std::string> v) { f_.series = std::move(v); return *this; }
    IssueBuilder& SeriesGroup(std::optional<std::string> v) { f_.series_group = std::move(v); return *this; }
    IssueBuilder& StoryArc(std::optional<std::string> v) { f_.story_arc = std::move(v); return *this; }
    IssueBuilder& StoryArcNumber(std::optional<std::string> v) { f_.story_arc_number = std::move(v); return *this; }
    IssueBuilder& Summary(std::optional<std::string> v) { f_.summary = std::move(v); return *this; }
    IssueBuilder& Teams(std::optional<std::string> v) { f_.teams = std::move(v); return *this; }
    IssueBuilder& Title(std::optional<std::string> v) { f_.title = std::move(v); return *this; }
    IssueBuilder& Translator(std::optional<std::string> v) { f_.translator = std::move(v); return *this; }
    IssueBuilder& Volume(std::optional<int> v) { f_.volume = v; return *this; }
    IssueBuilder& Web(std::optional<std::string> v) { f_.web = std::move(v); return *this; }
    IssueBuilder& Writer(std::optional<std::string> v) { f_.writer = std::move(v); return *this; }
    IssueBuilder& Year(std::optional<int> v) { f_.year = v; return *this; }
    IssueBuilder& Pages(std::vector<comicinfo::Page> v) { f_.pages = std::move(v); return *this; }
    IssueBuilder& AddPage(comicinfo::Page page) { f_.pages.push_back(std::move(page)); return *this; }

    [[nodiscard]] Result<Issue, Error> Build() const;

private:
    IssueFields f_;
};

} // namespace comicinfo
