#pragma once

#include <string>
#include <memory>
#include <optional>
#include <exception>
#include <curl/curl.h>

#include "http_transport.hpp"

/**
 * HTTP transport implemented with libcurl.
 * Uses RAII to manage CURL handle lifecycle. The handle is reused across
 * requests so consecutive redirect hops can share a connection.
 */
class HttpClient final : public HttpTransport
{
public:
    HttpClient();
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    // Move operations (allow transferring ownership)
    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    /**
     * Perform a single GET without following redirects.
     *
     * @param url HTTP/HTTPS URL to request
     * @param handler Receives the response head and, if accepted, the body
     * @throws DownloadError (Transport) if libcurl reports a failure
     */
    void get(const std::string &url, ResponseHandler &handler) override;

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    /**
     * Per-request state shared with the libcurl callbacks.
     * Exceptions thrown inside callbacks are parked here and rethrown
     * after curl_easy_perform returns (they must not cross the C boundary).
     */
    struct TransferState
    {
        CURL *curl = nullptr;
        ResponseHandler *handler = nullptr;
        ResponseHead head;
        bool headDelivered = false;
        bool acceptBody = false;
        std::exception_ptr error;
    };

    /**
     * Static callback for libcurl header lines.
     * Collects the Location header and hands the head to the handler
     * once the blank line closing the final header block arrives.
     *
     * @param buffer One header line (not NUL-terminated)
     * @param size Size of each element (always 1)
     * @param nitems Number of elements
     * @param userdata Our TransferState*
     * @return Bytes consumed; anything else aborts the transfer
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Static callback for libcurl body chunks.
     * Forwards to the handler or drops the chunk if the body was declined.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Extract the value of a "Location:" header line (case-insensitive name).
     *
     * @param line Header line without the trailing CRLF
     * @return Trimmed value, or nullopt for any other header
     */
    static std::optional<std::string> parseLocation(const std::string &line);
};
