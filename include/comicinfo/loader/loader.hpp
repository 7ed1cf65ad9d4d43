#pragma once

#include <comicinfo/core/result.hpp>
#include <comicinfo/loader/content_fetcher.hpp>
#include <comicinfo/model/issue.hpp>
#include <comicinfo/xml/i_xml_codec.hpp>

#include <future>
#include <memory>
#include <string>
#include <string_view>

namespace comicinfo {

// ---------------------------------------------------------------------------
// Loader — turns an XML string, a file path or a URL into a validated Issue.
//
// Every entry point has an overload taking the IXmlCodec to use; the
// overloads without one use a shared XmlCodec. Errors from the XML stage are
// returned unchanged; I/O failures are FileError.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<Issue, Error> LoadFromXml(const IXmlCodec& codec, std::string_view xml);
[[nodiscard]] Result<Issue, Error> LoadFromXml(std::string_view xml);

/// Smart detection: input starting with '<' (after whitespace) is XML,
/// anything else is treated as a file path.
[[nodiscard]] Result<Issue, Error> Load(const IXmlCodec& codec, std::string_view input);
[[nodiscard]] Result<Issue, Error> Load(std::string_view input);

[[nodiscard]] Result<Issue, Error> LoadFromFile(const IXmlCodec& codec, std::string_view path);
[[nodiscard]] Result<Issue, Error> LoadFromFile(std::string_view path);

/// file:// URLs are read from disk; everything else goes through `fetcher`.
/// Read failures → FileError "Failed to read from URL '<url>': ...".
[[nodiscard]] Result<Issue, Error> LoadFromUrl(const IXmlCodec& codec,
                                               const IContentFetcher& fetcher,
                                               std::string_view url);
[[nodiscard]] Result<Issue, Error> LoadFromUrl(const IContentFetcher& fetcher,
                                               std::string_view url);

/// LoadFromUrl on a worker thread. The task shares ownership of `fetcher`.
[[nodiscard]] std::future<Result<Issue, Error>> LoadFromUrlAsync(
    std::shared_ptr<const IContentFetcher> fetcher, std::string url);

/// True when `input` is an absolute URL the loader can fetch
/// (http, https, file).
[[nodiscard]] bool IsLoadableUrl(std::string_view input);

} // namespace comicinfo
