#include <comicinfo/core/url.hpp>

#include <cctype>

namespace comicinfo {

namespace {

bool IsSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool IsForbiddenChar(char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc <= 0x20 || uc == 0x7F) {
        return true;
    }
    switch (c) {
        case '<': case '>': case '"': case '{': case '}':
        case '|': case '\\': case '^': case '`':
            return true;
        default:
            return false;
    }
}

bool RequiresHost(const std::string& scheme) {
    return scheme == "http" || scheme == "https" || scheme == "ftp";
}

} // anonymous namespace

Result<Url, std::string> Url::Create(std::string_view url) {
    if (url.empty()) {
        return Result<Url, std::string>::Err("URL must not be empty");
    }
    for (char c : url) {
        if (IsForbiddenChar(c)) {
            return Result<Url, std::string>::Err(
                "URL contains an invalid character: '" + std::string(url) + "'");
        }
    }

    const auto colon = url.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Result<Url, std::string>::Err("URL has no scheme: '" + std::string(url) + "'");
    }
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
        return Result<Url, std::string>::Err("URL scheme must start with a letter");
    }
    for (size_t i = 1; i < colon; ++i) {
        if (!IsSchemeChar(url[i])) {
            return Result<Url, std::string>::Err(
                "URL scheme contains an invalid character: '" + std::string(url) + "'");
        }
    }

    Url parsed;
    parsed.value_ = std::string(url);
    for (size_t i = 0; i < colon; ++i) {
        parsed.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url[i])));
    }

    auto rest = url.substr(colon + 1);

    // Fragment and query are split off first; '#' ends everything.
    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        parsed.fragment_ = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    if (auto question = rest.find('?'); question != std::string_view::npos) {
        parsed.query_ = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    if (rest.substr(0, 2) == "//") {
        parsed.has_authority_ = true;
        rest = rest.substr(2);
        const auto slash = rest.find('/');
        auto authority = rest.substr(0, slash);
        parsed.path_ = slash == std::string_view::npos ? "" : std::string(rest.substr(slash));

        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        std::string_view host = authority;
        std::string_view port;
        if (!authority.empty() && authority.front() == '[') {
            const auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return Result<Url, std::string>::Err("URL has an unterminated IPv6 host");
            }
            host = authority.substr(0, close + 1);
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return Result<Url, std::string>::Err("URL has garbage after IPv6 host");
                }
                port = after.substr(1);
            }
        } else if (auto pc = authority.rfind(':'); pc != std::string_view::npos) {
            host = authority.substr(0, pc);
            port = authority.substr(pc + 1);
        }

        parsed.host_ = std::string(host);
        if (parsed.host_.empty() && RequiresHost(parsed.scheme_)) {
            return Result<Url, std::string>::Err(
                "URL must have a host after " + parsed.scheme_ + "://");
        }

        if (!port.empty()) {
            unsigned long value = 0;
            for (char c : port) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return Result<Url, std::string>::Err("URL port must be numeric");
                }
                value = value * 10 + static_cast<unsigned long>(c - '0');
                if (value > 65535) {
                    return Result<Url, std::string>::Err("URL port out of range");
                }
            }
            if (value == 0) {
                return Result<Url, std::string>::Err("URL port out of range");
            }
            parsed.port_ = static_cast<uint16_t>(value);
        }
    } else {
        if (RequiresHost(parsed.scheme_)) {
            return Result<Url, std::string>::Err(
                "URL must have a host after " + parsed.scheme_ + "://");
        }
        parsed.path_ = std::string(rest);
    }

    return Result<Url, std::string>::Ok(std::move(parsed));
}

std::string Url::Origin() const {
    if (!has_authority_) {
        return {};
    }
    std::string origin = scheme_ + "://" + host_;
    if (port_.has_value()) {
        origin += ":" + std::to_string(*port_);
    }
    return origin;
}

std::string Url::PathAndQuery() const {
    std::string out = path_;
    if (out.empty() && has_authority_) {
        out = "/";
    }
    if (!query_.empty()) {
        out += "?" + query_;
    }
    return out;
}

} // namespace comicinfo
