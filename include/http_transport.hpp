#pragma once

#include <cstddef>
#include <optional>
#include <string>

/**
 * Status line and the headers the downloader cares about.
 */
struct ResponseHead
{
    long statusCode = 0;
    std::optional<std::string> location; // Raw Location header value, if present
};

/**
 * Receives one HTTP response from a transport.
 */
class ResponseHandler
{
public:
    virtual ~ResponseHandler() = default;

    /**
     * Called once when the final (non-1xx) header block is complete.
     *
     * @return true to receive the body through onData, false to discard it
     */
    virtual bool onResponse(const ResponseHead &head) = 0;

    /**
     * Called for each body chunk of an accepted response.
     * May throw; the transport aborts and rethrows to the caller of get().
     */
    virtual void onData(const char *data, std::size_t size) = 0;
};

/**
 * Single-request HTTP GET. Implementations never follow redirects themselves.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Perform one GET and drain the response into the handler.
     *
     * @param url Absolute http/https URL
     * @param handler Receives the response head and (if accepted) the body
     * @throws DownloadError (Transport) on connection or protocol failure
     */
    virtual void get(const std::string &url, ResponseHandler &handler) = 0;
};
