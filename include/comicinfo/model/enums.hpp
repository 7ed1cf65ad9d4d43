#pragma once

#include <comicinfo/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace comicinfo {

// ---------------------------------------------------------------------------
// Schema enumerations.
//
// Each enum has a fixed canonical XML string per value. String comparison is
// exact and case-sensitive. Two parsers per enum:
//   XFromStringLenient — never fails, unknown or empty input yields the
//                        enum's default value.
//   XFromStringStrict  — InvalidEnum(field, value, AllXValues()) on unknown
//                        input; used while parsing documents.
// ---------------------------------------------------------------------------

enum class Manga {
    Unknown,
    No,
    Yes,
    YesAndRightToLeft,
};

enum class AgeRating {
    Unknown,
    AdultsOnly18Plus,
    EarlyChildhood,
    Everyone,
    Everyone10Plus,
    G,
    KidsToAdults,
    M,
    MA15Plus,
    Mature17Plus,
    PG,
    R18Plus,
    RatingPending,
    Teen,
    X18Plus,
};

enum class BlackAndWhite {
    Unknown,
    No,
    Yes,
};

enum class PageType {
    FrontCover,
    InnerCover,
    Roundup,
    Story,
    Advertisement,
    Editorial,
    Letters,
    Preview,
    BackCover,
    Other,
    Deleted,
};

// -- Manga ------------------------------------------------------------------

[[nodiscard]] std::string ToString(Manga value);
[[nodiscard]] const std::vector<std::string>& AllMangaValues();
[[nodiscard]] Manga MangaFromStringLenient(std::string_view s);
[[nodiscard]] Result<Manga, Error> MangaFromStringStrict(std::string_view s);

/// Yes or YesAndRightToLeft.
[[nodiscard]] bool IsManga(Manga value) noexcept;
[[nodiscard]] bool IsRightToLeft(Manga value) noexcept;

// -- AgeRating --------------------------------------------------------------

[[nodiscard]] std::string ToString(AgeRating value);
[[nodiscard]] const std::vector<std::string>& AllAgeRatingValues();
[[nodiscard]] AgeRating AgeRatingFromStringLenient(std::string_view s);
[[nodiscard]] Result<AgeRating, Error> AgeRatingFromStringStrict(std::string_view s);

// -- BlackAndWhite ----------------------------------------------------------

[[nodiscard]] std::string ToString(BlackAndWhite value);
[[nodiscard]] const std::vector<std::string>& AllBlackAndWhiteValues();
[[nodiscard]] BlackAndWhite BlackAndWhiteFromStringLenient(std::string_view s);
[[nodiscard]] Result<BlackAndWhite, Error> BlackAndWhiteFromStringStrict(std::string_view s);

[[nodiscard]] bool IsBlackAndWhite(BlackAndWhite value) noexcept;

// -- PageType ---------------------------------------------------------------

[[nodiscard]] std::string ToString(PageType value);
[[nodiscard]] const std::vector<std::string>& AllPageTypeValues();
[[nodiscard]] PageType PageTypeFromStringLenient(std::string_view s);
[[nodiscard]] Result<PageType, Error> PageTypeFromStringStrict(std::string_view s);

/// FrontCover, InnerCover or BackCover.
[[nodiscard]] bool IsCover(PageType value) noexcept;
[[nodiscard]] bool IsStory(PageType value) noexcept;
[[nodiscard]] bool IsDeleted(PageType value) noexcept;

} // namespace comicinfo
