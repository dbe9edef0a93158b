#pragma once

#include <memory>
#include <string>
#include <curl/curl.h>

/**
 * Absolute URL backed by libcurl's URL API (CURLU).
 * Uses RAII to manage the CURLU handle lifecycle.
 */
class Url
{
public:
    /**
     * Parse an absolute URL. Spaces and non-ASCII bytes are percent-encoded.
     *
     * @param text URL text, e.g. "https://example.com/files/report.pdf"
     * @return Parsed URL
     * @throws DownloadError (InvalidUrl) if the text is not an absolute URL
     */
    static Url parse(const std::string &text);

    // CURLU handles are moved, never shared
    Url(const Url &) = delete;
    Url &operator=(const Url &) = delete;
    Url(Url &&) noexcept = default;
    Url &operator=(Url &&) noexcept = default;

    /**
     * Resolve a reference (e.g. a Location header value) against this URL.
     * Accepts absolute URLs as well as "//host/x", "/x" and "x" forms.
     *
     * @throws DownloadError (InvalidUrl) if the reference cannot be resolved
     */
    Url resolve(const std::string &reference) const;

    // Lowercase scheme without the trailing ':' ("http", "https", ...)
    std::string scheme() const;

    // Path component as it appears in the URL (percent-encoding kept, "/" when empty)
    std::string path() const;

    bool isHttp() const;

    // Normalized full URL
    const std::string &str() const { return text_; }

private:
    using Handle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    explicit Url(Handle handle);

    std::string getPart(CURLUPart part) const;

    Handle handle_;
    std::string text_;
};
