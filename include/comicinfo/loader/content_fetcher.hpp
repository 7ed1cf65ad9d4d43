#pragma once

#include <comicinfo/core/result.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace comicinfo {

// ---------------------------------------------------------------------------
// FetchOptions — transport settings for remote ComicInfo documents.
// ---------------------------------------------------------------------------
struct FetchOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
    std::string user_agent = "comicinfo";
    bool follow_redirects = true;
};

// ---------------------------------------------------------------------------
// IContentFetcher — retrieves the full body behind a URL.
//
// The loader depends on this interface rather than an HTTP client, so tests
// run offline against MockContentFetcher. Failures are returned as Error
// values; the loader rewraps them as FileError.
// ---------------------------------------------------------------------------
class IContentFetcher {
public:
    virtual ~IContentFetcher() = default;

    IContentFetcher(const IContentFetcher&) = delete;
    IContentFetcher& operator=(const IContentFetcher&) = delete;
    IContentFetcher(IContentFetcher&&) = delete;
    IContentFetcher& operator=(IContentFetcher&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Fetch(std::string_view url) const = 0;

protected:
    IContentFetcher() = default;
};

// ---------------------------------------------------------------------------
// HttpContentFetcher — IContentFetcher over cpp-httplib (http and https).
//
// Pimpl keeps httplib out of this header. A new client is created per
// request, so one fetcher may be shared across threads.
// ---------------------------------------------------------------------------
class HttpContentFetcher : public IContentFetcher {
public:
    explicit HttpContentFetcher(FetchOptions options = {});
    ~HttpContentFetcher() override;

    [[nodiscard]] Result<std::string, Error> Fetch(std::string_view url) const override;

    [[nodiscard]] const FetchOptions& Options() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace comicinfo
