#include <comicinfo/model/enums.hpp>

#include <array>
#include <optional>
#include <utility>

namespace comicinfo {

namespace {

template <typename Enum, size_t N>
using EnumTable = std::array<std::pair<Enum, const char*>, N>;

// Canonical strings in declaration order.
constexpr EnumTable<Manga, 4> kMangaTable = {{
    {Manga::Unknown, "Unknown"},
    {Manga::No, "No"},
    {Manga::Yes, "Yes"},
    {Manga::YesAndRightToLeft, "YesAndRightToLeft"},
}};

constexpr EnumTable<AgeRating, 15> kAgeRatingTable = {{
    {AgeRating::Unknown, "Unknown"},
    {AgeRating::AdultsOnly18Plus, "Adults Only 18+"},
    {AgeRating::EarlyChildhood, "Early Childhood"},
    {AgeRating::Everyone, "Everyone"},
    {AgeRating::Everyone10Plus, "Everyone 10+"},
    {AgeRating::G, "G"},
    {AgeRating::KidsToAdults, "Kids to Adults"},
    {AgeRating::M, "M"},
    {AgeRating::MA15Plus, "MA15+"},
    {AgeRating::Mature17Plus, "Mature 17+"},
    {AgeRating::PG, "PG"},
    {AgeRating::R18Plus, "R18+"},
    {AgeRating::RatingPending, "Rating Pending"},
    {AgeRating::Teen, "Teen"},
    {AgeRating::X18Plus, "X18+"},
}};

constexpr EnumTable<BlackAndWhite, 3> kBlackAndWhiteTable = {{
    {BlackAndWhite::Unknown, "Unknown"},
    {BlackAndWhite::No, "No"},
    {BlackAndWhite::Yes, "Yes"},
}};

constexpr EnumTable<PageType, 11> kPageTypeTable = {{
    {PageType::FrontCover, "FrontCover"},
    {PageType::InnerCover, "InnerCover"},
    {PageType::Roundup, "Roundup"},
    {PageType::Story, "Story"},
    {PageType::Advertisement, "Advertisement"},
    {PageType::Editorial, "Editorial"},
    {PageType::Letters, "Letters"},
    {PageType::Preview, "Preview"},
    {PageType::BackCover, "BackCover"},
    {PageType::Other, "Other"},
    {PageType::Deleted, "Deleted"},
}};

template <typename Enum, size_t N>
std::string NameOf(const EnumTable<Enum, N>& table, Enum value) {
    for (const auto& [e, name] : table) {
        if (e == value) {
            return name;
        }
    }
    return {};
}

template <typename Enum, size_t N>
std::vector<std::string> NamesOf(const EnumTable<Enum, N>& table) {
    std::vector<std::string> names;
    names.reserve(N);
    for (const auto& entry : table) {
        names.emplace_back(entry.second);
    }
    return names;
}

template <typename Enum, size_t N>
std::optional<Enum> Lookup(const EnumTable<Enum, N>& table, std::string_view s) {
    for (const auto& [e, name] : table) {
        if (s == name) {
            return e;
        }
    }
    return std::nullopt;
}

template <typename Enum, size_t N>
Result<Enum, Error> LookupStrict(const EnumTable<Enum, N>& table,
                                 const char* field,
                                 const std::vector<std::string>& valid,
                                 std::string_view s) {
    auto found = Lookup(table, s);
    if (!found.has_value()) {
        return Result<Enum, Error>::Err(
            Error::InvalidEnum(field, std::string(s), valid));
    }
    return Result<Enum, Error>::Ok(*found);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Manga
// ---------------------------------------------------------------------------
std::string ToString(Manga value) {
    return NameOf(kMangaTable, value);
}

const std::vector<std::string>& AllMangaValues() {
    static const auto values = NamesOf(kMangaTable);
    return values;
}

Manga MangaFromStringLenient(std::string_view s) {
    return Lookup(kMangaTable, s).value_or(Manga::Unknown);
}

Result<Manga, Error> MangaFromStringStrict(std::string_view s) {
    return LookupStrict(kMangaTable, "Manga", AllMangaValues(), s);
}

bool IsManga(Manga value) noexcept {
    return value == Manga::Yes || value == Manga::YesAndRightToLeft;
}

bool IsRightToLeft(Manga value) noexcept {
    return value == Manga::YesAndRightToLeft;
}

// ---------------------------------------------------------------------------
// AgeRating
// ---------------------------------------------------------------------------
std::string ToString(AgeRating value) {
    return NameOf(kAgeRatingTable, value);
}

const std::vector<std::string>& AllAgeRatingValues() {
    static const auto values = NamesOf(kAgeRatingTable);
    return values;
}

AgeRating AgeRatingFromStringLenient(std::string_view s) {
    return Lookup(kAgeRatingTable, s).value_or(AgeRating::Unknown);
}

Result<AgeRating, Error> AgeRatingFromStringStrict(std::string_view s) {
    return LookupStrict(kAgeRatingTable, "AgeRating", AllAgeRatingValues(), s);
}

// ---------------------------------------------------------------------------
// BlackAndWhite
// ---------------------------------------------------------------------------
std::string ToString(BlackAndWhite value) {
    return NameOf(kBlackAndWhiteTable, value);
}

const std::vector<std::string>& AllBlackAndWhiteValues() {
    static const auto values = NamesOf(kBlackAndWhiteTable);
    return values;
}

BlackAndWhite BlackAndWhiteFromStringLenient(std::string_view s) {
    return Lookup(kBlackAndWhiteTable, s).value_or(BlackAndWhite::Unknown);
}

Result<BlackAndWhite, Error> BlackAndWhiteFromStringStrict(std::string_view s) {
    return LookupStrict(kBlackAndWhiteTable, "BlackAndWhite",
                        AllBlackAndWhiteValues(), s);
}

bool IsBlackAndWhite(BlackAndWhite value) noexcept {
    return value == BlackAndWhite::Yes;
}

// ---------------------------------------------------------------------------
// PageType
// ---------------------------------------------------------------------------
std::string ToString(PageType value) {
    return NameOf(kPageTypeTable, value);
}

const std::vector<std::string>& AllPageTypeValues() {
    static const auto values = NamesOf(kPageTypeTable);
    return values;
}

PageType PageTypeFromStringLenient(std::string_view s) {
    return Lookup(kPageTypeTable, s).value_or(PageType::Story);
}

Result<PageType, Error> PageTypeFromStringStrict(std::string_view s) {
    return LookupStrict(kPageTypeTable, "PageType", AllPageTypeValues(), s);
}

bool IsCover(PageType value) noexcept {
    return value == PageType::FrontCover ||
           value == PageType::InnerCover ||
           value == PageType::BackCover;
}

bool IsStory(PageType value) noexcept {
    return value == PageType::Story;
}

bool IsDeleted(PageType value) noexcept {
    return value == PageType::Deleted;
}

} // namespace comicinfo
