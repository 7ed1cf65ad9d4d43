#include <comicinfo/model/issue.hpp>

#include <comicinfo/core/coercion.hpp>
#include <comicinfo/core/strings.hpp>

#include <cstdio>

namespace comicinfo {

namespace {

std::vector<std::string> SplitCommaSeparated(const std::optional<std::string>& raw) {
    if (!raw.has_value() || raw->empty()) {
        return {};
    }
    return strings::SplitAndTrim(*raw, ',');
}

template <typename Pred>
std::vector<Page> FilterPages(const std::vector<Page>& pages, Pred pred) {
    std::vector<Page> out;
    for (const auto& page : pages) {
        if (pred(page)) {
            out.push_back(page);
        }
    }
    return out;
}

// Howard Hinnant's days_from_civil / civil_from_days.
long long DaysFromCivil(long long y, long long m, long long d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CivilFromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    const long long d = doy - (153 * mp + 2) / 5 + 1;
    const long long m = mp + (mp < 10 ? 3 : -9);
    const long long y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    CalendarDate date;
    date.year = static_cast<int>(y);
    date.month = static_cast<int>(m);
    date.day = static_cast<int>(d);
    return date;
}

void NormalizeText(std::optional<std::string>& field) {
    field = strings::TrimmedOrAbsent(field);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// CalendarDate
// ---------------------------------------------------------------------------
CalendarDate CalendarDate::FromComponents(int year, int month, int day) {
    // Fold month overflow into the year before the day arithmetic.
    long long y = year;
    long long m0 = static_cast<long long>(month) - 1;
    y += m0 >= 0 ? m0 / 12 : (m0 - 11) / 12;
    m0 = ((m0 % 12) + 12) % 12;
    const long long first = DaysFromCivil(y, m0 + 1, 1);
    return CivilFromDays(first + static_cast<long long>(day) - 1);
}

long long CalendarDate::DaysSinceEpoch() const {
    return DaysFromCivil(year, month, day);
}

std::string CalendarDate::ToIsoString() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

// ---------------------------------------------------------------------------
// Issue — multi-value views
// ---------------------------------------------------------------------------
std::vector<std::string> Issue::Characters() const { return SplitCommaSeparated(f_.characters); }
std::vector<std::string> Issue::Teams() const { return SplitCommaSeparated(f_.teams); }
std::vector<std::string> Issue::Locations() const { return SplitCommaSeparated(f_.locations); }
std::vector<std::string> Issue::Genres() const { return SplitCommaSeparated(f_.genre); }
std::vector<std::string> Issue::StoryArcs() const { return SplitCommaSeparated(f_.story_arc); }
std::vector<std::string> Issue::StoryArcNumbers() const { return SplitCommaSeparated(f_.story_arc_number); }

std::vector<Url> Issue::WebUrls() const {
    std::vector<Url> urls;
    if (!f_.web.has_value()) {
        return urls;
    }
    for (const auto& token : strings::SplitWhitespace(*f_.web)) {
        auto url = Url::Create(token);
        if (url.IsOk()) {
            urls.push_back(std::move(url).Value());
        }
    }
    return urls;
}

// ---------------------------------------------------------------------------
// Issue — derived
// ---------------------------------------------------------------------------
std::vector<Page> Issue::CoverPages() const {
    return FilterPages(f_.pages, [](const Page& p) { return p.IsCover(); });
}

std::vector<Page> Issue::StoryPages() const {
    return FilterPages(f_.pages, [](const Page& p) { return p.IsStory(); });
}

bool Issue::IsManga() const noexcept {
    return f_.manga.has_value() && comicinfo::IsManga(*f_.manga);
}

bool Issue::IsRightToLeft() const noexcept {
    return f_.manga.has_value() && comicinfo::IsRightToLeft(*f_.manga);
}

bool Issue::IsBlackAndWhite() const noexcept {
    return f_.black_and_white.has_value() && comicinfo::IsBlackAndWhite(*f_.black_and_white);
}

std::optional<CalendarDate> Issue::PublicationDate() const {
    if (!f_.year.has_value() || *f_.year <= 0) {
        return std::nullopt;
    }
    return CalendarDate::FromComponents(*f_.year, f_.month.value_or(1), f_.day.value_or(1));
}

// ---------------------------------------------------------------------------
// IssueBuilder
// ---------------------------------------------------------------------------
Result<Issue, Error> IssueBuilder::Build() const {
    IssueFields fields = f_;

    for (auto* text : {&fields.alternate_number, &fields.alternate_series, &fields.characters,
                       &fields.colorist, &fields.cover_artist, &fields.editor, &fields.format,
                       &fields.genre, &fields.imprint, &fields.inker, &fields.language_iso,
                       &fields.letterer, &fields.locations, &fields.main_character_or_team,
                       &fields.notes, &fields.number, &fields.penciller, &fields.publisher,
                       &fields.review, &fields.scan_information, &fields.series,
                       &fields.series_group, &fields.story_arc, &fields.story_arc_number,
                       &fields.summary, &fields.teams, &fields.title, &fields.translator,
                       &fields.web, &fields.writer}) {
        NormalizeText(*text);
    }

    auto check_int = [](const char* name, const std::optional<int>& v,
                        int min, int max) -> std::optional<Error> {
        if (v.has_value() && (*v < min || *v > max)) {
            return Error::Range(name, std::to_string(*v),
                                std::to_string(min), std::to_string(max));
        }
        return std::nullopt;
    };

    if (auto err = check_int("Year", fields.year, kMinYear, kMaxYear)) {
        return Result<Issue, Error>::Err(std::move(*err));
    }
    if (auto err = check_int("Month", fields.month, kMinMonth, kMaxMonth)) {
        return Result<Issue, Error>::Err(std::move(*err));
    }
    if (auto err = check_int("Day", fields.day, kMinDay, kMaxDay)) {
        return Result<Issue, Error>::Err(std::move(*err));
    }
    if (fields.community_rating.has_value()) {
        const double rating = *fields.community_rating;
        // Negated comparison so NaN is rejected too.
        if (!(rating >= kMinCommunityRating && rating <= kMaxCommunityRating)) {
            return Result<Issue, Error>::Err(Error::Range(
                "CommunityRating", FormatDecimal(rating),
                FormatDecimal(kMinCommunityRating), FormatDecimal(kMaxCommunityRating)));
        }
    }

    return Result<Issue, Error>::Ok(Issue(std::move(fields)));
}

} // namespace comicinfo
