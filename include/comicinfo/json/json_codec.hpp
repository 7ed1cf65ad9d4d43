#pragma once

#include <comicinfo/core/result.hpp>
#include <comicinfo/model/issue.hpp>

#include <string>
#include <string_view>

namespace comicinfo {

// ---------------------------------------------------------------------------
// JSON projection of an Issue.
//
// Keys are the lower-camel-case XML element names ("title", "ageRating",
// "languageISO"); multi-value fields carry their raw delimited string; absent
// fields are omitted. Pages are an array of objects with every page field.
// ---------------------------------------------------------------------------

/// `indent` < 0 renders compact output.
[[nodiscard]] std::string IssueToJson(const Issue& issue, int indent = 2);

/// Malformed JSON → ParseError; wrong JSON type → TypeCoercionError;
/// page without "image" → SchemaError. Enums are strict and the result is
/// re-validated through IssueBuilder.
[[nodiscard]] Result<Issue, Error> IssueFromJson(std::string_view json);

} // namespace comicinfo
