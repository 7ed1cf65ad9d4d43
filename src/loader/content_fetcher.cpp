#include <comicinfo/loader/content_fetcher.hpp>

#include <comicinfo/core/log.hpp>
#include <comicinfo/core/url.hpp>

#include <httplib.h>

#include <utility>

namespace comicinfo {

namespace {

bool IsHttpScheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — options only; httplib::Client instances are per request.
// ---------------------------------------------------------------------------
struct HttpContentFetcher::Impl {
    FetchOptions options;

    explicit Impl(FetchOptions opts) : options(std::move(opts)) {}

    std::unique_ptr<httplib::Client> MakeClient(const Url& url) const {
        auto client = std::make_unique<httplib::Client>(url.Origin());
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_follow_location(options.follow_redirects);
        return client;
    }
};

HttpContentFetcher::HttpContentFetcher(FetchOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpContentFetcher::~HttpContentFetcher() = default;

const FetchOptions& HttpContentFetcher::Options() const noexcept {
    return impl_->options;
}

Result<std::string, Error> HttpContentFetcher::Fetch(std::string_view url_text) const {
    using R = Result<std::string, Error>;

    auto url = Url::Create(url_text);
    if (url.IsErr()) {
        return R::Err(Error::File("Invalid URL: " + url.Error()));
    }
    if (!IsHttpScheme(url.Value().Scheme())) {
        return R::Err(Error::File("Unsupported URL scheme '" + url.Value().Scheme() + "'"));
    }

    auto client = impl_->MakeClient(url.Value());
    httplib::Headers headers;
    headers.emplace("User-Agent", impl_->options.user_agent);
    headers.emplace("Accept", "application/xml, text/xml, */*");

    const auto target = url.Value().PathAndQuery();
    LogInfo("http", "GET " + url.Value().Origin() + target);
    auto res = client->Get(target, headers);
    if (!res) {
        return R::Err(Error::File("HTTP request failed: " + httplib::to_string(res.error())));
    }
    LogInfo("http", "  < " + std::to_string(res->status));
    if (res->status < 200 || res->status >= 300) {
        return R::Err(Error::File("HTTP status " + std::to_string(res->status)));
    }
    return R::Ok(std::move(res->body));
}

} // namespace comicinfo
