#include "downloader.hpp"
#include "checksum.hpp"
#include "download_error.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace
{

bool isSuccessStatus(long statusCode)
{
    return statusCode >= 200 && statusCode < 300;
}

// A 3xx without a Location header is a final response, not a redirect.
// An empty Location is present and resolves to the current URL.
bool followsRedirect(const ResponseHead &head)
{
    return isRedirectStatus(head.statusCode) && head.location.has_value();
}

Url parseHttpUrl(const std::string &text)
{
    Url url = Url::parse(text);
    if (!url.isHttp())
    {
        throw DownloadError(DownloadError::Kind::InvalidUrl,
                            "Only http and https URLs are supported.");
    }
    return url;
}

std::string inferFilename(const Url &source)
{
    const std::string path = source.path();

    // Last non-empty "/"-separated segment
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos)
    {
        return kDefaultFilename;
    }
    size_t start = path.find_last_of('/', end);
    start = (start == std::string::npos) ? 0 : start + 1;
    return path.substr(start, end - start + 1);
}

fs::path resolveAgainst(const fs::path &baseDirectory, const fs::path &relative)
{
    fs::path base = baseDirectory;
    if (!base.is_absolute())
    {
        std::error_code ec;
        fs::path absoluteBase = fs::absolute(base, ec);
        if (!ec)
        {
            base = absoluteBase;
        }
    }
    return (base / relative).lexically_normal();
}

/**
 * Response handler for one hop of the redirect chain.
 * Opens the destination only for a final 2xx response; the stream is
 * closed by close() on success or by the destructor on any other exit.
 */
class FileSink final : public ResponseHandler
{
public:
    explicit FileSink(const fs::path &outputPath) : outputPath_(outputPath) {}

    bool onResponse(const ResponseHead &head) override
    {
        head_ = head;
        if (followsRedirect(head) || !isSuccessStatus(head.statusCode))
        {
            return false;
        }

        // Create all parent directories (like mkdir -p)
        fs::path directory = outputPath_.parent_path();
        if (!directory.empty())
        {
            std::error_code ec;
            fs::create_directories(directory, ec);
            if (ec)
            {
                throw DownloadError(DownloadError::Kind::Filesystem,
                                    fmt::format("Failed to create directory {}: {}",
                                                directory.string(), ec.message()));
            }
        }

        out_.open(outputPath_, std::ios::binary | std::ios::trunc);
        if (!out_)
        {
            throw DownloadError(DownloadError::Kind::Filesystem,
                                fmt::format("Cannot open file for writing: {}", outputPath_.string()));
        }
        return true;
    }

    void onData(const char *data, std::size_t size) override
    {
        out_.write(data, static_cast<std::streamsize>(size));
        if (!out_.good())
        {
            throw DownloadError(DownloadError::Kind::Filesystem,
                                fmt::format("Failed to write to {}", outputPath_.string()));
        }
        digest_.update(data, size);
        bytesWritten_ += size;
    }

    void close()
    {
        if (!out_.is_open())
        {
            return;
        }
        out_.close();
        if (out_.fail())
        {
            throw DownloadError(DownloadError::Kind::Filesystem,
                                fmt::format("Failed to finish writing {}", outputPath_.string()));
        }
    }

    const std::optional<ResponseHead> &head() const { return head_; }
    std::uint64_t bytesWritten() const { return bytesWritten_; }
    std::string sha256() { return digest_.finalHex(); }

private:
    fs::path outputPath_;
    std::optional<ResponseHead> head_;
    std::ofstream out_;
    Sha256Digest digest_;
    std::uint64_t bytesWritten_ = 0;
};

} // namespace

fs::path resolveDestination(const Url &source,
                            const std::optional<std::string> &destinationPath,
                            const fs::path &baseDirectory)
{
    if (destinationPath && !destinationPath->empty())
    {
        fs::path requested(*destinationPath);
        if (requested.is_absolute())
        {
            return requested;
        }
        return resolveAgainst(baseDirectory, requested);
    }

    return resolveAgainst(baseDirectory, inferFilename(source));
}

bool isRedirectStatus(long statusCode)
{
    switch (statusCode)
    {
    case 301: // Moved Permanently
    case 302: // Found
    case 303: // See Other
    case 307: // Temporary Redirect
    case 308: // Permanent Redirect
        return true;
    default:
        return false;
    }
}

Downloader::Downloader(HttpTransport &transport, int maxRedirects)
    : transport_(transport), maxRedirects_(maxRedirects)
{
}

TransferResult Downloader::fetchAndSave(const std::string &sourceUrl, const fs::path &outputPath)
{
    return fetch(parseHttpUrl(sourceUrl), outputPath);
}

TransferResult Downloader::download(const DownloadRequest &request, const fs::path &baseDirectory)
{
    Url source = parseHttpUrl(request.url);
    fs::path outputPath = resolveDestination(source, request.outputPath, baseDirectory);
    return fetch(std::move(source), outputPath);
}

TransferResult Downloader::fetch(Url source, const fs::path &outputPath)
{
    Url current = std::move(source);
    int redirects = 0;

    while (true)
    {
        FileSink sink(outputPath);
        transport_.get(current.str(), sink);

        if (!sink.head())
        {
            throw DownloadError(DownloadError::Kind::Transport,
                                fmt::format("No response received from {}", current.str()));
        }
        const ResponseHead &head = *sink.head();

        if (followsRedirect(head))
        {
            if (redirects >= maxRedirects_)
            {
                throw DownloadError(DownloadError::Kind::TooManyRedirects,
                                    fmt::format("Too many redirects (limit is {}).", maxRedirects_));
            }

            Url next = current.resolve(*head.location);
            if (!next.isHttp())
            {
                throw DownloadError(DownloadError::Kind::InvalidUrl,
                                    fmt::format("Redirect to unsupported URL: {}", next.str()));
            }

            ++redirects;
            if (onRedirect_)
            {
                onRedirect_(head.statusCode, current.str(), next.str());
            }
            current = std::move(next);
            continue;
        }

        if (!isSuccessStatus(head.statusCode))
        {
            throw DownloadError(DownloadError::Kind::DownloadFailed,
                                fmt::format("Download failed with status {}.", head.statusCode),
                                head.statusCode);
        }

        sink.close();

        TransferResult result;
        result.url = current.str();
        result.outputPath = outputPath;
        result.bytesWritten = sink.bytesWritten();
        result.sha256 = sink.sha256();
        result.redirects = redirects;
        return result;
    }
}
