#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "config.hpp"
#include "http_transport.hpp"
#include "url.hpp"

/**
 * What the caller asked for: a source URL and an optional output path.
 */
struct DownloadRequest
{
    std::string url;
    std::optional<std::string> outputPath; // Absolute, or relative to the base directory
};

/**
 * Outcome of a completed download.
 */
struct TransferResult
{
    std::string url;                  // Final URL after all redirects
    std::filesystem::path outputPath; // Where the body was written
    std::uint64_t bytesWritten = 0;
    std::string sha256; // Hex digest of the bytes written
    int redirects = 0;  // Redirect hops followed
};

/**
 * Compute where a download is saved.
 *
 * An absolute destinationPath is used verbatim, a relative one is resolved
 * against baseDirectory. Without one (or with an empty one) the last
 * non-empty segment of the URL path names the file, or kDefaultFilename
 * when the path has no segments.
 *
 * @param source Parsed source URL
 * @param destinationPath Optional explicit output path
 * @param baseDirectory Directory relative paths are resolved from
 * @return Absolute, lexically normalized path (no filesystem access)
 */
std::filesystem::path resolveDestination(const Url &source,
                                         const std::optional<std::string> &destinationPath,
                                         const std::filesystem::path &baseDirectory);

// 301, 302, 303, 307 and 308
bool isRedirectStatus(long statusCode);

/**
 * Downloads a single URL to disk, following redirects itself.
 * Holds no state between calls besides its configuration.
 */
class Downloader
{
public:
    /**
     * Invoked once per followed redirect, before the next request is sent.
     */
    using RedirectObserver = std::function<void(long statusCode, const std::string &from, const std::string &to)>;

    explicit Downloader(HttpTransport &transport, int maxRedirects = kMaxRedirects);

    void setRedirectObserver(RedirectObserver observer) { onRedirect_ = std::move(observer); }

    /**
     * Fetch sourceUrl and write the body of the final 2xx response to outputPath.
     *
     * Missing parent directories are created and an existing file is
     * overwritten. Nothing touches the disk unless the final status is 2xx.
     * A failed transfer may leave a truncated file behind.
     *
     * @param sourceUrl Absolute http/https URL
     * @param outputPath Destination file
     * @return Final URL, output path, byte count and digest
     * @throws DownloadError InvalidUrl, TooManyRedirects, DownloadFailed,
     *         Transport or Filesystem
     */
    TransferResult fetchAndSave(const std::string &sourceUrl, const std::filesystem::path &outputPath);

    /**
     * Validate the request, resolve its destination against baseDirectory,
     * then fetchAndSave.
     */
    TransferResult download(const DownloadRequest &request, const std::filesystem::path &baseDirectory);

private:
    TransferResult fetch(Url source, const std::filesystem::path &outputPath);

    HttpTransport &transport_;
    int maxRedirects_;
    RedirectObserver onRedirect_;
};
