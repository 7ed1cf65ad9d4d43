#include <comicinfo/xml/xml_codec.hpp>
#include "xml_fields.hpp"

#include <comicinfo/core/coercion.hpp>
#include <comicinfo/core/log.hpp>
#include <comicinfo/core/strings.hpp>

#include <tinyxml2.h>

#include <string>
#include <utility>
#include <vector>

namespace comicinfo {

namespace {

constexpr const char* kNsXsd = "http://www.w3.org/2001/XMLSchema";
constexpr const char* kNsXsi = "http://www.w3.org/2001/XMLSchema-instance";

using StringSetter = IssueBuilder& (IssueBuilder::*)(std::optional<std::string>);

// Plain text fields: trim + blank-to-absent only, never an error.
const std::vector<std::pair<const char*, StringSetter>>& TextFields() {
    static const std::vector<std::pair<const char*, StringSetter>> fields = {
        {"AlternateNumber", &IssueBuilder::AlternateNumber},
        {"AlternateSeries", &IssueBuilder::AlternateSeries},
        {"Characters", &IssueBuilder::Characters},
        {"Colorist", &IssueBuilder::Colorist},
        {"CoverArtist", &IssueBuilder::CoverArtist},
        {"Editor", &IssueBuilder::Editor},
        {"Format", &IssueBuilder::Format},
        {"Genre", &IssueBuilder::Genre},
        {"Imprint", &IssueBuilder::Imprint},
        {"Inker", &IssueBuilder::Inker},
        {"LanguageISO", &IssueBuilder::LanguageIso},
        {"Letterer", &IssueBuilder::Letterer},
        {"Locations", &IssueBuilder::Locations},
        {"MainCharacterOrTeam", &IssueBuilder::MainCharacterOrTeam},
        {"Notes", &IssueBuilder::Notes},
        {"Number", &IssueBuilder::Number},
        {"Penciller", &IssueBuilder::Penciller},
        {"Publisher", &IssueBuilder::Publisher},
        {"Review", &IssueBuilder::Review},
        {"ScanInformation", &IssueBuilder::ScanInformation},
        {"Series", &IssueBuilder::Series},
        {"SeriesGroup", &IssueBuilder::SeriesGroup},
        {"StoryArc", &IssueBuilder::StoryArc},
        {"StoryArcNumber", &IssueBuilder::StoryArcNumber},
        {"Summary", &IssueBuilder::Summary},
        {"Teams", &IssueBuilder::Teams},
        {"Title", &IssueBuilder::Title},
        {"Translator", &IssueBuilder::Translator},
        {"Web", &IssueBuilder::Web},
        {"Writer", &IssueBuilder::Writer},
    };
    return fields;
}

template <typename E>
Result<std::optional<E>, Error> ParseEnumField(const tinyxml2::XMLElement* root,
                                               const char* name,
                                               Result<E, Error> (*strict)(std::string_view)) {
    using R = Result<std::optional<E>, Error>;
    auto raw = xml_fields::ElementText(root, name);
    if (!raw.has_value()) {
        return R::Ok(std::nullopt);
    }
    auto parsed = strict(*raw);
    if (parsed.IsErr()) {
        return R::Err(std::move(parsed).Error());
    }
    return R::Ok(parsed.Value());
}

// ---------------------------------------------------------------------------
// Pages — every field is an attribute of <Page>.
// ---------------------------------------------------------------------------
Result<Page, Error> ParsePageElement(const tinyxml2::XMLElement* element) {
    auto image_attr = xml_fields::Attr(element, "Image");
    if (!image_attr.has_value()) {
        return Result<Page, Error>::Err(
            Error::Schema("Page element missing required Image attribute"));
    }
    auto image = CoerceInt("Page.Image", strings::Trim(*image_attr));
    if (image.IsErr()) {
        return Result<Page, Error>::Err(std::move(image).Error());
    }

    const auto type_value = xml_fields::AttrOr(element, "Type", "Story");
    auto type = PageTypeFromStringStrict(strings::Trim(type_value));
    if (type.IsErr()) {
        return Result<Page, Error>::Err(std::move(type).Error());
    }

    // Lenient attributes: bad values fall back to the default silently.
    const bool double_page =
        xml_fields::ParseLenientBool(xml_fields::AttrOr(element, "DoublePage", "false"));
    const long long image_size =
        TryParseInt64(strings::Trim(xml_fields::AttrOr(element, "ImageSize", "0"))).value_or(0);
    const int image_width =
        TryParseInt(strings::Trim(xml_fields::AttrOr(element, "ImageWidth", "-1")))
            .value_or(kUnknownDimension);
    const int image_height =
        TryParseInt(strings::Trim(xml_fields::AttrOr(element, "ImageHeight", "-1")))
            .value_or(kUnknownDimension);

    return Result<Page, Error>::Ok(Page(image.Value(),
                                        type.Value(),
                                        double_page,
                                        image_size,
                                        xml_fields::AttrOr(element, "Key", ""),
                                        xml_fields::AttrOr(element, "Bookmark", ""),
                                        image_width,
                                        image_height));
}

Result<std::vector<Page>, Error> ParsePagesElement(const tinyxml2::XMLElement* root) {
    using R = Result<std::vector<Page>, Error>;
    std::vector<Page> pages;
    const auto* pages_elem = root->FirstChildElement("Pages");
    if (!pages_elem) {
        return R::Ok(std::move(pages));
    }
    for (const auto* page_elem = pages_elem->FirstChildElement("Page"); page_elem;
         page_elem = page_elem->NextSiblingElement("Page")) {
        auto page = ParsePageElement(page_elem);
        if (page.IsErr()) {
            return R::Err(std::move(page).Error());
        }
        pages.push_back(std::move(page).Value());
    }
    return R::Ok(std::move(pages));
}

// ---------------------------------------------------------------------------
// Serialization helpers
// ---------------------------------------------------------------------------

// XML 1.0 forbids C0 controls other than tab, LF and CR.
bool IsXmlRenderable(const std::string& text) {
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 && c != '\t' && c != '\n' && c != '\r') {
            return false;
        }
    }
    return true;
}

std::string DocumentToString(const tinyxml2::XMLDocument& doc) {
    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return printer.CStr() ? std::string(printer.CStr()) : std::string();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

XmlCodec::XmlCodec() = default;
XmlCodec::~XmlCodec() = default;

// ---------------------------------------------------------------------------
// ParseIssue
//
// Unparsed → TreeBuilt → RootValidated → FieldsExtracted → Done. The first
// error at any stage is returned; there is no partial Issue.
// ---------------------------------------------------------------------------
Result<Issue, Error> XmlCodec::ParseIssue(std::string_view xml) const {
    using R = Result<Issue, Error>;

    if (strings::IsBlank(xml)) {
        return R::Err(Error::Parse("XML string cannot be nil or empty"));
    }

    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        std::string message = "Invalid XML syntax";
        if (const char* err = doc.ErrorStr(); err != nullptr && *err != '\0') {
            message += ": ";
            message += err;
        }
        LogDebug("xml", message);
        return R::Err(Error::Parse(std::move(message)));
    }

    const auto* root = doc.RootElement();
    if (!root) {
        return R::Err(Error::Parse("No root element found"));
    }
    if (std::string_view(root->Name()) != kComicInfoRoot) {
        return R::Err(Error::Parse("No ComicInfo root element found (root is '" +
                                   std::string(root->Name()) + "')"));
    }
    // tinyxml2 tolerates a second top-level element and stray text.
    if (root->NextSiblingElement() != nullptr) {
        return R::Err(Error::Parse("Extra content at the end of the document"));
    }
    for (const auto* node = doc.FirstChild(); node; node = node->NextSibling()) {
        const auto* text = node->ToText();
        if (text && !strings::IsBlank(text->Value() ? text->Value() : "")) {
            return R::Err(Error::Parse("Extra content at the end of the document"));
        }
    }

    IssueBuilder builder;
    for (const auto& [name, setter] : TextFields()) {
        (builder.*setter)(xml_fields::ElementText(root, name));
    }

    // Validated fields, in element-name order.
    auto age_rating = ParseEnumField(root, "AgeRating", &AgeRatingFromStringStrict);
    if (age_rating.IsErr()) return R::Err(std::move(age_rating).Error());

    auto alternate_count = CoerceOptionalInt(
        "AlternateCount", xml_fields::ElementText(root, "AlternateCount"));
    if (alternate_count.IsErr()) return R::Err(std::move(alternate_count).Error());

    auto black_and_white = ParseEnumField(root, "BlackAndWhite", &BlackAndWhiteFromStringStrict);
    if (black_and_white.IsErr()) return R::Err(std::move(black_and_white).Error());

    auto community_rating = CoerceOptionalDoubleInRange(
        "CommunityRating", xml_fields::ElementText(root, "CommunityRating"),
        kMinCommunityRating, kMaxCommunityRating);
    if (community_rating.IsErr()) return R::Err(std::move(community_rating).Error());

    auto count = CoerceOptionalInt("Count", xml_fields::ElementText(root, "Count"));
    if (count.IsErr()) return R::Err(std::move(count).Error());

    auto day = CoerceOptionalIntInRange(
        "Day", xml_fields::ElementText(root, "Day"), kMinDay, kMaxDay);
    if (day.IsErr()) return R::Err(std::move(day).Error());

    auto manga = ParseEnumField(root, "Manga", &MangaFromStringStrict);
    if (manga.IsErr()) return R::Err(std::move(manga).Error());

    auto month = CoerceOptionalIntInRange(
        "Month", xml_fields::ElementText(root, "Month"), kMinMonth, kMaxMonth);
    if (month.IsErr()) return R::Err(std::move(month).Error());

    auto page_count = CoerceOptionalInt("PageCount", xml_fields::ElementText(root, "PageCount"));
    if (page_count.IsErr()) return R::Err(std::move(page_count).Error());

    auto volume = CoerceOptionalInt("Volume", xml_fields::ElementText(root, "Volume"));
    if (volume.IsErr()) return R::Err(std::move(volume).Error());

    auto year = CoerceOptionalIntInRange(
        "Year", xml_fields::ElementText(root, "Year"), kMinYear, kMaxYear);
    if (year.IsErr()) return R::Err(std::move(year).Error());

    auto pages = ParsePagesElement(root);
    if (pages.IsErr()) return R::Err(std::move(pages).Error());

    builder.AgeRating(age_rating.Value())
        .AlternateCount(alternate_count.Value())
        .BlackAndWhite(black_and_white.Value())
        .CommunityRating(community_rating.Value())
        .Count(count.Value())
        .Day(day.Value())
        .Manga(manga.Value())
        .Month(month.Value())
        .PageCount(page_count.Value())
        .Volume(volume.Value())
        .Year(year.Value())
        .Pages(std::move(pages).Value());

    auto issue = builder.Build();
    if (issue.IsOk()) {
        LogDebug("xml", "Parsed ComicInfo document with " +
                            std::to_string(issue.Value().Pages().size()) + " page(s)");
    }
    return issue;
}

// ---------------------------------------------------------------------------
// BuildIssueXml
// ---------------------------------------------------------------------------
Result<std::string, Error> XmlCodec::BuildIssueXml(const Issue& issue) const {
    using R = Result<std::string, Error>;

    tinyxml2::XMLDocument doc;
    doc.InsertFirstChild(doc.NewDeclaration());

    auto* root = doc.NewElement(kComicInfoRoot);
    root->SetAttribute("xmlns:xsd", kNsXsd);
    root->SetAttribute("xmlns:xsi", kNsXsi);
    doc.InsertEndChild(root);

    std::optional<Error> failure;

    auto add_text = [&](const char* name, const std::optional<std::string>& value) {
        if (failure || !value.has_value()) {
            return;
        }
        if (!IsXmlRenderable(*value)) {
            failure = Error::Parse(std::string("Cannot render field '") + name +
                                   "': value contains characters not allowed in XML");
            return;
        }
        auto* elem = doc.NewElement(name);
        elem->SetText(value->c_str());
        root->InsertEndChild(elem);
    };
    auto add_int = [&](const char* name, const std::optional<int>& value) {
        if (value.has_value()) {
            add_text(name, std::to_string(*value));
        }
    };
    auto add_decimal = [&](const char* name, const std::optional<double>& value) {
        if (value.has_value()) {
            add_text(name, FormatDecimal(*value));
        }
    };
    auto add_enum = [&](const char* name, const auto& value) {
        if (value.has_value()) {
            add_text(name, ToString(*value));
        }
    };

    // Schema element order.
    add_text("Title", issue.Title());
    add_text("Series", issue.Series());
    add_text("Number", issue.Number());
    add_int("Count", issue.Count());
    add_int("Volume", issue.Volume());
    add_text("AlternateSeries", issue.AlternateSeries());
    add_text("AlternateNumber", issue.AlternateNumber());
    add_int("AlternateCount", issue.AlternateCount());
    add_text("Summary", issue.Summary());
    add_text("Notes", issue.Notes());
    add_int("Year", issue.Year());
    add_int("Month", issue.Month());
    add_int("Day", issue.Day());
    add_text("Writer", issue.Writer());
    add_text("Penciller", issue.Penciller());
    add_text("Inker", issue.Inker());
    add_text("Colorist", issue.Colorist());
    add_text("Letterer", issue.Letterer());
    add_text("CoverArtist", issue.CoverArtist());
    add_text("Editor", issue.Editor());
    add_text("Translator", issue.Translator());
    add_text("Publisher", issue.Publisher());
    add_text("Imprint", issue.Imprint());
    add_text("Genre", issue.GenreRawData());
    add_text("Web", issue.WebRawData());
    add_int("PageCount", issue.PageCount());
    add_text("LanguageISO", issue.LanguageIso());
    add_text("Format", issue.Format());
    add_enum("BlackAndWhite", issue.BlackAndWhite());
    add_enum("Manga", issue.Manga());
    add_text("Characters", issue.CharactersRawData());
    add_text("Teams", issue.TeamsRawData());
    add_text("Locations", issue.LocationsRawData());
    add_text("ScanInformation", issue.ScanInformation());
    add_text("StoryArc", issue.StoryArcRawData());
    add_text("StoryArcNumber", issue.StoryArcNumberRawData());
    add_text("SeriesGroup", issue.SeriesGroup());
    add_enum("AgeRating", issue.AgeRating());
    add_decimal("CommunityRating", issue.CommunityRating());
    add_text("MainCharacterOrTeam", issue.MainCharacterOrTeam());
    add_text("Review", issue.Review());

    if (failure) {
        return R::Err(std::move(*failure));
    }

    if (issue.HasPages()) {
        auto* pages_elem = doc.NewElement("Pages");
        root->InsertEndChild(pages_elem);
        for (const auto& page : issue.Pages()) {
            if (!IsXmlRenderable(page.Key()) || !IsXmlRenderable(page.Bookmark())) {
                return R::Err(Error::Parse(
                    "Cannot render page " + std::to_string(page.Image()) +
                    ": attribute contains characters not allowed in XML"));
            }
            auto* page_elem = doc.NewElement("Page");
            page_elem->SetAttribute("Image", page.Image());
            page_elem->SetAttribute("Type", ToString(page.Type()).c_str());
            if (page.DoublePage()) {
                page_elem->SetAttribute("DoublePage", "true");
            }
            if (page.ImageSize() != 0) {
                page_elem->SetAttribute("ImageSize", std::to_string(page.ImageSize()).c_str());
            }
            if (!page.Key().empty()) {
                page_elem->SetAttribute("Key", page.Key().c_str());
            }
            if (!page.Bookmark().empty()) {
                page_elem->SetAttribute("Bookmark", page.Bookmark().c_str());
            }
            if (page.ImageWidth() != kUnknownDimension) {
                page_elem->SetAttribute("ImageWidth", page.ImageWidth());
            }
            if (page.ImageHeight() != kUnknownDimension) {
                page_elem->SetAttribute("ImageHeight", page.ImageHeight());
            }
            pages_elem->InsertEndChild(page_elem);
        }
    }

    auto text = DocumentToString(doc);
    if (text.empty()) {
        return R::Err(Error::Parse("Failed to render ComicInfo XML"));
    }
    return R::Ok(std::move(text));
}

} // namespace comicinfo
