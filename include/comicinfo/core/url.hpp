#pragma once

#include <comicinfo/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace comicinfo {

// ---------------------------------------------------------------------------
// Url — validated absolute URL (RFC 3986 shape: scheme ":" hier-part).
//
// Rules:
//   - Scheme: letter followed by letters, digits, '+', '-', '.'
//   - No whitespace, control characters, or any of <>"{}|\^`
//   - "//" authority form requires a non-empty host for http, https, ftp
//   - Port, when present, is 1..65535
// ---------------------------------------------------------------------------
class Url {
public:
    static Result<Url, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] std::optional<uint16_t> Port() const noexcept { return port_; }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }
    [[nodiscard]] const std::string& Query() const noexcept { return query_; }
    [[nodiscard]] const std::string& Fragment() const noexcept { return fragment_; }

    /// "scheme://host[:port]", empty for URLs without an authority.
    [[nodiscard]] std::string Origin() const;

    /// Path plus "?query", never empty for URLs with an authority ("/").
    [[nodiscard]] std::string PathAndQuery() const;

    bool operator==(const Url& other) const { return value_ == other.value_; }
    bool operator!=(const Url& other) const { return value_ != other.value_; }

private:
    Url() = default;

    std::string value_;
    std::string scheme_;
    std::string host_;
    std::optional<uint16_t> port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    bool has_authority_ = false;
};

} // namespace comicinfo
