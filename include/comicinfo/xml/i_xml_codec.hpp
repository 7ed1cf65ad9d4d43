#pragma once

#include <comicinfo/core/result.hpp>
#include <comicinfo/model/issue.hpp>

#include <string>
#include <string_view>

namespace comicinfo {

// Root element name of a ComicInfo document.
constexpr const char* kComicInfoRoot = "ComicInfo";

// ---------------------------------------------------------------------------
// IXmlCodec — abstract interface for reading and writing ComicInfo XML.
//
// The concrete implementation uses tinyxml2 but no tinyxml2 types appear in
// this interface. All methods are const and return Result<T, Error>; the
// first error found aborts the whole operation.
// ---------------------------------------------------------------------------
class IXmlCodec {
public:
    virtual ~IXmlCodec() = default;

    // Non-copyable, non-movable (polymorphic base).
    IXmlCodec(const IXmlCodec&) = delete;
    IXmlCodec& operator=(const IXmlCodec&) = delete;
    IXmlCodec(IXmlCodec&&) = delete;
    IXmlCodec& operator=(IXmlCodec&&) = delete;

    /// Parse and validate a complete ComicInfo document.
    [[nodiscard]] virtual Result<Issue, Error> ParseIssue(
        std::string_view xml) const = 0;

    /// Render an Issue as a ComicInfo document (UTF-8, with declaration).
    [[nodiscard]] virtual Result<std::string, Error> BuildIssueXml(
        const Issue& issue) const = 0;

protected:
    IXmlCodec() = default;
};

} // namespace comicinfo
