#include "url.hpp"
#include "download_error.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/core.h>

namespace
{

constexpr unsigned int kParseFlags = CURLU_NON_SUPPORT_SCHEME | CURLU_URLENCODE;

} // namespace

Url::Url(Handle handle) : handle_(std::move(handle))
{
    text_ = getPart(CURLUPART_URL);
}

Url Url::parse(const std::string &text)
{
    Handle handle(curl_url(), curl_url_cleanup);
    if (!handle)
    {
        throw DownloadError(DownloadError::Kind::InvalidUrl,
                            "Failed to allocate URL handle (out of memory)");
    }

    // Accept any syntactically valid scheme here; the scheme policy is the caller's.
    // Spaces and non-ASCII bytes are percent-encoded instead of rejected.
    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, text.c_str(), kParseFlags);
    if (rc != CURLUE_OK)
    {
        throw DownloadError(DownloadError::Kind::InvalidUrl,
                            fmt::format("Invalid URL '{}': {}", text, curl_url_strerror(rc)));
    }

    return Url(std::move(handle));
}

Url Url::resolve(const std::string &reference) const
{
    Handle handle(curl_url_dup(handle_.get()), curl_url_cleanup);
    if (!handle)
    {
        throw DownloadError(DownloadError::Kind::InvalidUrl,
                            "Failed to allocate URL handle (out of memory)");
    }

    // An empty reference is the current document without its fragment
    if (reference.empty())
    {
        CURLUcode rc = curl_url_set(handle.get(), CURLUPART_FRAGMENT, nullptr, 0);
        if (rc != CURLUE_OK)
        {
            throw DownloadError(DownloadError::Kind::InvalidUrl,
                                fmt::format("Cannot resolve '' against {}: {}", text_, curl_url_strerror(rc)));
        }
        return Url(std::move(handle));
    }

    // Setting a URL on a handle that already holds one resolves it relative to the old one
    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, reference.c_str(), kParseFlags);
    if (rc != CURLUE_OK)
    {
        throw DownloadError(DownloadError::Kind::InvalidUrl,
                            fmt::format("Cannot resolve '{}' against {}: {}",
                                        reference, text_, curl_url_strerror(rc)));
    }

    return Url(std::move(handle));
}

std::string Url::scheme() const
{
    std::string value = getPart(CURLUPART_SCHEME);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string Url::path() const
{
    return getPart(CURLUPART_PATH);
}

bool Url::isHttp() const
{
    std::string s = scheme();
    return s == "http" || s == "https";
}

std::string Url::getPart(CURLUPart part) const
{
    char *value = nullptr;
    CURLUcode rc = curl_url_get(handle_.get(), part, &value, 0);
    if (rc != CURLUE_OK || value == nullptr)
    {
        // Absent optional parts come back as errors; treat them as empty
        return std::string();
    }

    std::string result(value);
    curl_free(value);
    return result;
}
