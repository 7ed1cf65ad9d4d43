#pragma once

#include <comicinfo/core/strings.hpp>

#include <tinyxml2.h>

#include <optional>
#include <string>

namespace comicinfo::xml_fields {

// Concatenated text of every text/CDATA node below `node`, in document order.
inline void AppendText(const tinyxml2::XMLNode* node, std::string& out) {
    for (const auto* child = node->FirstChild(); child; child = child->NextSibling()) {
        if (const auto* text = child->ToText()) {
            if (text->Value()) {
                out += text->Value();
            }
        } else if (child->ToElement()) {
            AppendText(child, out);
        }
    }
}

// Element-valued field: first child named `name`, text trimmed, blank or
// missing → nullopt.
inline std::optional<std::string> ElementText(const tinyxml2::XMLElement* parent,
                                              const char* name) {
    if (!parent) {
        return std::nullopt;
    }
    const auto* child = parent->FirstChildElement(name);
    if (!child) {
        return std::nullopt;
    }
    std::string text;
    AppendText(child, text);
    return strings::TrimmedOrAbsent(std::string_view(text));
}

// Attribute-valued field: raw value, nullopt when the attribute is missing.
inline std::optional<std::string> Attr(const tinyxml2::XMLElement* element,
                                       const char* name) {
    if (!element) {
        return std::nullopt;
    }
    const char* value = element->Attribute(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

inline std::string AttrOr(const tinyxml2::XMLElement* element,
                          const char* name,
                          const std::string& default_value) {
    return Attr(element, name).value_or(default_value);
}

// "true", "1", "yes" in any case → true; everything else → false.
inline bool ParseLenientBool(const std::string& value) {
    const auto trimmed = strings::Trim(value);
    return strings::IEquals(trimmed, "true") ||
           trimmed == "1" ||
           strings::IEquals(trimmed, "yes");
}

} // namespace comicinfo::xml_fields
