#pragma once

#include <comicinfo/config/tool_config.hpp>
#include <comicinfo/core/result.hpp>
#include <comicinfo/model/issue.hpp>
#include <comicinfo/xml/i_xml_codec.hpp>

#include <ostream>
#include <string>

namespace comicinfo {

// Exit codes of the comicinfo tool.
constexpr int kExitSuccess = 0;
constexpr int kExitLoadError = 1;
constexpr int kExitUsageError = 2;

// Serialized form of `issue` in the requested format.
[[nodiscard]] Result<std::string, Error> RenderIssue(const IXmlCodec& codec,
                                                     const Issue& issue,
                                                     OutputFormat format,
                                                     bool pretty);

// Multi-line "Key: value" overview for humans. Absent fields are skipped.
[[nodiscard]] std::string FormatIssueSummary(const Issue& issue);

// Writes the error as one line of text, or as the JSON envelope.
void PrintError(const Error& error, bool json_output, std::ostream& out);

} // namespace comicinfo
