#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace comicinfo::strings {

inline bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string_view Trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && IsSpace(s[begin])) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && IsSpace(s[end - 1])) {
        --end;
    }
    return s.substr(begin, end - begin);
}

inline bool IsBlank(std::string_view s) {
    return Trim(s).empty();
}

// Trim, then map empty to nullopt.
inline std::optional<std::string> TrimmedOrAbsent(std::string_view s) {
    auto trimmed = Trim(s);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return std::string(trimmed);
}

inline std::optional<std::string> TrimmedOrAbsent(const std::optional<std::string>& s) {
    if (!s.has_value()) {
        return std::nullopt;
    }
    return TrimmedOrAbsent(std::string_view(*s));
}

inline bool IEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        const auto lc = static_cast<unsigned char>(lhs[i]);
        const auto rc = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(lc) != std::tolower(rc)) {
            return false;
        }
    }
    return true;
}

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Split on `delimiter`, trim every part, drop parts that end up empty.
inline std::vector<std::string> SplitAndTrim(std::string_view text, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        auto pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            pos = text.size();
        }
        auto part = Trim(text.substr(start, pos - start));
        if (!part.empty()) {
            parts.emplace_back(part);
        }
        start = pos + 1;
    }
    return parts;
}

// Split on runs of whitespace.
inline std::vector<std::string> SplitWhitespace(std::string_view text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && IsSpace(text[i])) {
            ++i;
        }
        const size_t begin = i;
        while (i < text.size() && !IsSpace(text[i])) {
            ++i;
        }
        if (i > begin) {
            tokens.emplace_back(text.substr(begin, i - begin));
        }
    }
    return tokens;
}

inline std::string Join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += parts[i];
    }
    return out;
}

} // namespace comicinfo::strings
