#pragma once

#include <comicinfo/xml/i_xml_codec.hpp>

namespace comicinfo {

// ---------------------------------------------------------------------------
// XmlCodec — concrete IXmlCodec implementation backed by tinyxml2.
//
// Stateless. tinyxml2 types do NOT appear in this header; the
// implementation is fully encapsulated in the .cpp file.
// ---------------------------------------------------------------------------
class XmlCodec : public IXmlCodec {
public:
    XmlCodec();
    ~XmlCodec() override;

    [[nodiscard]] Result<Issue, Error> ParseIssue(
        std::string_view xml) const override;

    [[nodiscard]] Result<std::string, Error> BuildIssueXml(
        const Issue& issue) const override;
};

} // namespace comicinfo
