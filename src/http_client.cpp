#include "http_client.hpp"
#include "config.hpp"
#include "download_error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace
{

// libcurl global state is initialized once per process and torn down at exit
void ensureCurlInitialized()
{
    static std::once_flag flag;
    std::call_once(flag, []()
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([]() { curl_global_cleanup(); });
    });
}

std::string trim(const std::string &value)
{
    const char *whitespace = " \t\r\n";
    size_t first = value.find_first_not_of(whitespace);
    if (first == std::string::npos)
    {
        return std::string();
    }
    size_t last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

} // namespace

HttpClient::HttpClient() : curl_(nullptr, curl_easy_cleanup)
{
    ensureCurlInitialized();

    curl_.reset(curl_easy_init());
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT, kUserAgent);

    // HTTPS settings (CRITICAL for security)
    curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYPEER, 1L); // Verify server certificate
    curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYHOST, 2L); // Verify hostname matches cert
    curl_easy_setopt(curl_.get(), CURLOPT_PROTOCOLS_STR, "http,https");

    // Redirects are chased by the Downloader so every hop is validated and counted
    curl_easy_setopt(curl_.get(), CURLOPT_FOLLOWLOCATION, 0L);

    // Connection deadline only; the body may take as long as it needs
    curl_easy_setopt(curl_.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
    curl_easy_setopt(curl_.get(), CURLOPT_NOSIGNAL, 1L);

    // Let the server compress; we store the decoded body
    curl_easy_setopt(curl_.get(), CURLOPT_ACCEPT_ENCODING, "");

    // Keep proxy CONNECT responses out of the header callback
    curl_easy_setopt(curl_.get(), CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

    curl_easy_setopt(curl_.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, writeCallback);
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

void HttpClient::get(const std::string &url, ResponseHandler &handler)
{
    TransferState state;
    state.curl = curl_.get();
    state.handler = &handler;

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl_.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    CURLcode res = curl_easy_perform(curl_.get());

    // Don't leave dangling pointers to this frame in the reusable handle
    curl_easy_setopt(curl_.get(), CURLOPT_ERRORBUFFER, nullptr);
    curl_easy_setopt(curl_.get(), CURLOPT_HEADERDATA, nullptr);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, nullptr);

    // A handler failure (e.g. disk full) takes precedence over the abort it caused
    if (state.error)
    {
        std::rethrow_exception(state.error);
    }

    if (res != CURLE_OK)
    {
        const char *detail = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res);
        throw DownloadError(DownloadError::Kind::Transport,
                            fmt::format("Request to {} failed: {}", url, detail));
    }

    if (!state.headDelivered)
    {
        throw DownloadError(DownloadError::Kind::Transport,
                            fmt::format("No response received from {}", url));
    }
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *state = static_cast<TransferState *>(userdata);

    try
    {
        std::string line(buffer, totalSize);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        {
            line.pop_back();
        }

        // A status line starts a new header block (interim 1xx or final)
        if (line.rfind("HTTP/", 0) == 0)
        {
            if (!state->headDelivered)
            {
                state->head = ResponseHead{};
            }
            return totalSize;
        }

        if (!line.empty())
        {
            if (!state->headDelivered)
            {
                if (auto location = parseLocation(line))
                {
                    state->head.location = std::move(location);
                }
            }
            return totalSize;
        }

        // Blank line: end of a header block. Trailers after the body are ignored.
        if (state->headDelivered)
        {
            return totalSize;
        }

        long code = 0;
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &code);
        if (code >= 100 && code < 200)
        {
            return totalSize; // Interim response, the real one follows
        }

        state->head.statusCode = code;
        state->headDelivered = true;
        state->acceptBody = state->handler->onResponse(state->head);
        return totalSize;
    }
    catch (...)
    {
        state->error = std::current_exception();
        return 0; // Abort transfer, get() rethrows
    }
}

size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    // Calculate total bytes in this chunk
    size_t totalSize = size * nmemb;
    auto *state = static_cast<TransferState *>(userdata);

    if (!state->acceptBody)
    {
        return totalSize; // Drain and drop (redirect or error body)
    }

    try
    {
        state->handler->onData(ptr, totalSize);
    }
    catch (...)
    {
        state->error = std::current_exception();
        return 0; // Abort transfer, get() rethrows
    }

    // If we return 0 or a different value, libcurl aborts the transfer
    return totalSize;
}

std::optional<std::string> HttpClient::parseLocation(const std::string &line)
{
    size_t colon = line.find(':');
    if (colon == std::string::npos)
    {
        return std::nullopt;
    }

    std::string name = trim(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name != "location")
    {
        return std::nullopt;
    }

    return trim(line.substr(colon + 1));
}
