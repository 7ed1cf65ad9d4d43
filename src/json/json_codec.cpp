#include <comicinfo/json/json_codec.hpp>

#include <nlohmann/json.hpp>

#include <limits>
#include <utility>
#include <vector>

namespace comicinfo {

namespace {

using json = nlohmann::json;

using StringSetter = IssueBuilder& (IssueBuilder::*)(std::optional<std::string>);
using StringGetter = const std::optional<std::string>& (Issue::*)() const noexcept;
using IntSetter = IssueBuilder& (IssueBuilder::*)(std::optional<int>);
using IntGetter = const std::optional<int>& (Issue::*)() const noexcept;

struct TextKey {
    const char* key;
    StringGetter get;
    StringSetter set;
};

struct IntKey {
    const char* key;
    IntGetter get;
    IntSetter set;
};

const std::vector<TextKey>& TextKeys() {
    static const std::vector<TextKey> keys = {
        {"title", &Issue::Title, &IssueBuilder::Title},
        {"series", &Issue::Series, &IssueBuilder::Series},
        {"number", &Issue::Number, &IssueBuilder::Number},
        {"alternateSeries", &Issue::AlternateSeries, &IssueBuilder::AlternateSeries},
        {"alternateNumber", &Issue::AlternateNumber, &IssueBuilder::AlternateNumber},
        {"summary", &Issue::Summary, &IssueBuilder::Summary},
        {"notes", &Issue::Notes, &IssueBuilder::Notes},
        {"writer", &Issue::Writer, &IssueBuilder::Writer},
        {"penciller", &Issue::Penciller, &IssueBuilder::Penciller},
        {"inker", &Issue::Inker, &IssueBuilder::Inker},
        {"colorist", &Issue::Colorist, &IssueBuilder::Colorist},
        {"letterer", &Issue::Letterer, &IssueBuilder::Letterer},
        {"coverArtist", &Issue::CoverArtist, &IssueBuilder::CoverArtist},
        {"editor", &Issue::Editor, &IssueBuilder::Editor},
        {"translator", &Issue::Translator, &IssueBuilder::Translator},
        {"publisher", &Issue::Publisher, &IssueBuilder::Publisher},
        {"imprint", &Issue::Imprint, &IssueBuilder::Imprint},
        {"genre", &Issue::GenreRawData, &IssueBuilder::Genre},
        {"web", &Issue::WebRawData, &IssueBuilder::Web},
        {"languageISO", &Issue::LanguageIso, &IssueBuilder::LanguageIso},
        {"format", &Issue::Format, &IssueBuilder::Format},
        {"characters", &Issue::CharactersRawData, &IssueBuilder::Characters},
        {"teams", &Issue::TeamsRawData, &IssueBuilder::Teams},
        {"locations", &Issue::LocationsRawData, &IssueBuilder::Locations},
        {"scanInformation", &Issue::ScanInformation, &IssueBuilder::ScanInformation},
        {"storyArc", &Issue::StoryArcRawData, &IssueBuilder::StoryArc},
        {"storyArcNumber", &Issue::StoryArcNumberRawData, &IssueBuilder::StoryArcNumber},
        {"seriesGroup", &Issue::SeriesGroup, &IssueBuilder::SeriesGroup},
        {"mainCharacterOrTeam", &Issue::MainCharacterOrTeam, &IssueBuilder::MainCharacterOrTeam},
        {"review", &Issue::Review, &IssueBuilder::Review},
    };
    return keys;
}

const std::vector<IntKey>& IntKeys() {
    static const std::vector<IntKey> keys = {
        {"count", &Issue::Count, &IssueBuilder::Count},
        {"volume", &Issue::Volume, &IssueBuilder::Volume},
        {"alternateCount", &Issue::AlternateCount, &IssueBuilder::AlternateCount},
        {"year", &Issue::Year, &IssueBuilder::Year},
        {"month", &Issue::Month, &IssueBuilder::Month},
        {"day", &Issue::Day, &IssueBuilder::Day},
        {"pageCount", &Issue::PageCount, &IssueBuilder::PageCount},
    };
    return keys;
}

json PageToJson(const Page& page) {
    return json{
        {"image", page.Image()},
        {"type", ToString(page.Type())},
        {"doublePage", page.DoublePage()},
        {"imageSize", page.ImageSize()},
        {"key", page.Key()},
        {"bookmark", page.Bookmark()},
        {"imageWidth", page.ImageWidth()},
        {"imageHeight", page.ImageHeight()},
    };
}

// -- Typed member access ----------------------------------------------------
// Each returns nullopt when the key is missing or null.

Result<std::optional<std::string>, Error> GetString(const json& obj, const std::string& key,
                                                    const std::string& field) {
    using R = Result<std::optional<std::string>, Error>;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!it->is_string()) {
        return R::Err(Error::TypeCoercion(field, it->dump(), "String"));
    }
    return R::Ok(it->get<std::string>());
}

Result<std::optional<long long>, Error> GetInteger(const json& obj, const std::string& key,
                                                   const std::string& field) {
    using R = Result<std::optional<long long>, Error>;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!it->is_number_integer()) {
        return R::Err(Error::TypeCoercion(field, it->dump(), "Int"));
    }
    if (it->is_number_unsigned() &&
        it->get<unsigned long long>() >
            static_cast<unsigned long long>(std::numeric_limits<long long>::max())) {
        return R::Err(Error::TypeCoercion(field, it->dump(), "Int"));
    }
    return R::Ok(it->get<long long>());
}

Result<std::optional<int>, Error> GetInt(const json& obj, const std::string& key,
                                         const std::string& field) {
    using R = Result<std::optional<int>, Error>;
    auto wide = GetInteger(obj, key, field);
    if (wide.IsErr()) {
        return R::Err(std::move(wide).Error());
    }
    const auto& value = wide.Value();
    if (!value.has_value()) {
        return R::Ok(std::nullopt);
    }
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        return R::Err(Error::TypeCoercion(field, std::to_string(*value), "Int"));
    }
    return R::Ok(static_cast<int>(*value));
}

Result<std::optional<double>, Error> GetDouble(const json& obj, const std::string& key,
                                               const std::string& field) {
    using R = Result<std::optional<double>, Error>;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!it->is_number()) {
        return R::Err(Error::TypeCoercion(field, it->dump(), "Double"));
    }
    return R::Ok(it->get<double>());
}

Result<std::optional<bool>, Error> GetBool(const json& obj, const std::string& key,
                                           const std::string& field) {
    using R = Result<std::optional<bool>, Error>;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return R::Ok(std::nullopt);
    }
    if (!it->is_boolean()) {
        return R::Err(Error::TypeCoercion(field, it->dump(), "Bool"));
    }
    return R::Ok(it->get<bool>());
}

template <typename E>
Result<std::optional<E>, Error> GetEnum(const json& obj, const std::string& key,
                                        const std::string& field,
                                        Result<E, Error> (*strict)(std::string_view)) {
    using R = Result<std::optional<E>, Error>;
    auto raw = GetString(obj, key, field);
    if (raw.IsErr()) {
        return R::Err(std::move(raw).Error());
    }
    if (!raw.Value().has_value()) {
        return R::Ok(std::nullopt);
    }
    auto parsed = strict(*raw.Value());
    if (parsed.IsErr()) {
        return R::Err(std::move(parsed).Error());
    }
    return R::Ok(parsed.Value());
}

Result<Page, Error> PageFromJson(const json& obj) {
    using R = Result<Page, Error>;
    if (!obj.is_object()) {
        return R::Err(Error::Schema("Page entry must be a JSON object"));
    }

    auto image = GetInt(obj, "image", "Page.Image");
    if (image.IsErr()) return R::Err(std::move(image).Error());
    if (!image.Value().has_value()) {
        return R::Err(Error::Schema("Page element missing required Image attribute"));
    }

    auto type = GetEnum(obj, "type", "Page.Type", &PageTypeFromStringStrict);
    if (type.IsErr()) return R::Err(std::move(type).Error());

    auto double_page = GetBool(obj, "doublePage", "Page.DoublePage");
    if (double_page.IsErr()) return R::Err(std::move(double_page).Error());

    auto image_size = GetInteger(obj, "imageSize", "Page.ImageSize");
    if (image_size.IsErr()) return R::Err(std::move(image_size).Error());

    auto key = GetString(obj, "key", "Page.Key");
    if (key.IsErr()) return R::Err(std::move(key).Error());

    auto bookmark = GetString(obj, "bookmark", "Page.Bookmark");
    if (bookmark.IsErr()) return R::Err(std::move(bookmark).Error());

    auto width = GetInt(obj, "imageWidth", "Page.ImageWidth");
    if (width.IsErr()) return R::Err(std::move(width).Error());

    auto height = GetInt(obj, "imageHeight", "Page.ImageHeight");
    if (height.IsErr()) return R::Err(std::move(height).Error());

    return R::Ok(Page(*image.Value(),
                      type.Value().value_or(PageType::Story),
                      double_page.Value().value_or(false),
                      image_size.Value().value_or(0),
                      key.Value().value_or(""),
                      bookmark.Value().value_or(""),
                      width.Value().value_or(kUnknownDimension),
                      height.Value().value_or(kUnknownDimension)));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// IssueToJson
// ---------------------------------------------------------------------------
std::string IssueToJson(const Issue& issue, int indent) {
    json j = json::object();

    for (const auto& text : TextKeys()) {
        const auto& value = (issue.*text.get)();
        if (value.has_value()) {
            j[text.key] = *value;
        }
    }
    for (const auto& number : IntKeys()) {
        const auto& value = (issue.*number.get)();
        if (value.has_value()) {
            j[number.key] = *value;
        }
    }
    if (issue.CommunityRating().has_value()) {
        j["communityRating"] = *issue.CommunityRating();
    }
    if (issue.AgeRating().has_value()) {
        j["ageRating"] = ToString(*issue.AgeRating());
    }
    if (issue.BlackAndWhite().has_value()) {
        j["blackAndWhite"] = ToString(*issue.BlackAndWhite());
    }
    if (issue.Manga().has_value()) {
        j["manga"] = ToString(*issue.Manga());
    }
    if (issue.HasPages()) {
        json pages = json::array();
        for (const auto& page : issue.Pages()) {
            pages.push_back(PageToJson(page));
        }
        j["pages"] = std::move(pages);
    }

    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// IssueFromJson
// ---------------------------------------------------------------------------
Result<Issue, Error> IssueFromJson(std::string_view text) {
    using R = Result<Issue, Error>;

    json j;
    try {
        j = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return R::Err(Error::Parse(std::string("Invalid JSON: ") + e.what()));
    }
    if (!j.is_object()) {
        return R::Err(Error::Parse("JSON document must be an object"));
    }

    IssueBuilder builder;

    for (const auto& text_key : TextKeys()) {
        auto value = GetString(j, text_key.key, text_key.key);
        if (value.IsErr()) return R::Err(std::move(value).Error());
        (builder.*text_key.set)(std::move(value).Value());
    }
    for (const auto& int_key : IntKeys()) {
        auto value = GetInt(j, int_key.key, int_key.key);
        if (value.IsErr()) return R::Err(std::move(value).Error());
        (builder.*int_key.set)(value.Value());
    }

    auto rating = GetDouble(j, "communityRating", "communityRating");
    if (rating.IsErr()) return R::Err(std::move(rating).Error());
    builder.CommunityRating(rating.Value());

    auto age_rating = GetEnum(j, "ageRating", "ageRating", &AgeRatingFromStringStrict);
    if (age_rating.IsErr()) return R::Err(std::move(age_rating).Error());
    builder.AgeRating(age_rating.Value());

    auto black_and_white =
        GetEnum(j, "blackAndWhite", "blackAndWhite", &BlackAndWhiteFromStringStrict);
    if (black_and_white.IsErr()) return R::Err(std::move(black_and_white).Error());
    builder.BlackAndWhite(black_and_white.Value());

    auto manga = GetEnum(j, "manga", "manga", &MangaFromStringStrict);
    if (manga.IsErr()) return R::Err(std::move(manga).Error());
    builder.Manga(manga.Value());

    auto pages_it = j.find("pages");
    if (pages_it != j.end() && !pages_it->is_null()) {
        if (!pages_it->is_array()) {
            return R::Err(Error::Schema("\"pages\" must be a JSON array"));
        }
        for (const auto& entry : *pages_it) {
            auto page = PageFromJson(entry);
            if (page.IsErr()) return R::Err(std::move(page).Error());
            builder.AddPage(std::move(page).Value());
        }
    }

    return builder.Build();
}

} // namespace comicinfo
