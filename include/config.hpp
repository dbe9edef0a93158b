#pragma once

#include <string>
#include <optional> // C++17 feature for optional values

/**
 * Configuration for the download-file command.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct DownloadConfig
{
    // Positional parameters
    std::string url;
    std::optional<std::string> outputPath; // Relative paths resolve from the working directory
};

// Redirect hops followed before giving up with TooManyRedirects
constexpr int kMaxRedirects = 5;

// Seconds allowed to establish a connection (no limit on the transfer itself)
constexpr long kConnectTimeoutSeconds = 30;

constexpr const char *kUserAgent = "download-file/1.0";

// Used when the URL path has no usable segment to name the file after
constexpr const char *kDefaultFilename = "downloaded-file";
