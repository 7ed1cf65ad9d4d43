#include <comicinfo/cli/issue_printer.hpp>

#include <comicinfo/core/coercion.hpp>
#include <comicinfo/core/strings.hpp>
#include <comicinfo/json/json_codec.hpp>

#include <sstream>

namespace comicinfo {

namespace {

void Line(std::ostringstream& out, const char* label, const std::string& value) {
    out << label << ": " << value << "\n";
}

void Line(std::ostringstream& out, const char* label,
          const std::optional<std::string>& value) {
    if (value.has_value()) {
        Line(out, label, *value);
    }
}

void Line(std::ostringstream& out, const char* label, const std::vector<std::string>& values) {
    if (!values.empty()) {
        Line(out, label, strings::Join(values, ", "));
    }
}

} // anonymous namespace

Result<std::string, Error> RenderIssue(const IXmlCodec& codec,
                                       const Issue& issue,
                                       OutputFormat format,
                                       bool pretty) {
    if (format == OutputFormat::Xml) {
        return codec.BuildIssueXml(issue);
    }
    return Result<std::string, Error>::Ok(IssueToJson(issue, pretty ? 2 : -1));
}

std::string FormatIssueSummary(const Issue& issue) {
    std::ostringstream out;

    Line(out, "Title", issue.Title());
    if (issue.Series().has_value()) {
        std::string series = *issue.Series();
        if (issue.Number().has_value()) {
            series += " #" + *issue.Number();
        }
        if (issue.Count().has_value()) {
            series += " of " + std::to_string(*issue.Count());
        }
        if (issue.Volume().has_value()) {
            series += " (vol. " + std::to_string(*issue.Volume()) + ")";
        }
        Line(out, "Series", series);
    }
    if (auto date = issue.PublicationDate()) {
        Line(out, "Published", date->ToIsoString());
    }
    Line(out, "Publisher", issue.Publisher());
    Line(out, "Writer", issue.Writer());
    Line(out, "Penciller", issue.Penciller());
    Line(out, "Genres", issue.Genres());
    Line(out, "Characters", issue.Characters());
    Line(out, "Story arcs", issue.StoryArcs());
    if (issue.AgeRating().has_value()) {
        Line(out, "Age rating", ToString(*issue.AgeRating()));
    }
    if (issue.CommunityRating().has_value()) {
        Line(out, "Rating", FormatDecimal(*issue.CommunityRating()));
    }
    if (issue.Manga().has_value()) {
        std::string manga = ToString(*issue.Manga());
        if (issue.IsRightToLeft()) {
            manga += " (right to left)";
        }
        Line(out, "Manga", manga);
    }
    if (issue.IsBlackAndWhite()) {
        Line(out, "Black and white", std::string("yes"));
    }
    const auto urls = issue.WebUrls();
    if (!urls.empty()) {
        std::vector<std::string> values;
        for (const auto& url : urls) {
            values.push_back(url.Value());
        }
        Line(out, "Web", values);
    }
    if (issue.HasPages()) {
        Line(out, "Pages", std::to_string(issue.Pages().size()) + " (" +
                               std::to_string(issue.CoverPages().size()) + " cover, " +
                               std::to_string(issue.StoryPages().size()) + " story)");
    }
    return out.str();
}

void PrintError(const Error& error, bool json_output, std::ostream& out) {
    if (json_output) {
        out << error.ToJson() << "\n";
    } else {
        out << "Error: " << error.ToString() << "\n";
    }
}

} // namespace comicinfo
