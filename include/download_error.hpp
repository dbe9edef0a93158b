#pragma once

#include <stdexcept>
#include <string>

/**
 * Error raised by every stage of a download.
 * The kind tells callers which stage failed; the message is ready for display.
 */
class DownloadError : public std::runtime_error
{
public:
    enum class Kind
    {
        InvalidUrl,       // Unparseable URL or scheme other than http/https
        TooManyRedirects, // Redirect chain longer than the allowed hop count
        DownloadFailed,   // Final response status outside 2xx
        Transport,        // Network-level failure reported by libcurl
        Filesystem        // Directory creation or file write failure
    };

    DownloadError(Kind kind, const std::string &message, long statusCode = 0)
        : std::runtime_error(message), kind_(kind), statusCode_(statusCode)
    {
    }

    Kind kind() const noexcept { return kind_; }

    /**
     * HTTP status of the final response. Only meaningful for DownloadFailed.
     */
    long statusCode() const noexcept { return statusCode_; }

private:
    Kind kind_;
    long statusCode_;
};

/**
 * Short stable name for an error kind ("InvalidURL", "TooManyRedirects", ...).
 */
const char *kindName(DownloadError::Kind kind);
