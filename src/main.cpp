#include <cstdint>
#include <filesystem>
#include <string>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "config.hpp"
#include "downloader.hpp"
#include "http_client.hpp"

namespace
{

// Format bytes into human-readable string (e.g., "52.30 MB")
std::string formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    return fmt::format("{} B", bytes);
}

} // namespace

int main(int argc, char *argv[])
{
    // Create CLI11 app
    CLI::App app{"Download a file from an HTTP(S) URL and save it locally", "download-file"};

    // Configuration struct to be populated
    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    // Positional URL (checked by hand below so a missing URL exits with 1)
    app.add_option("URL", config.url, "HTTP/HTTPS URL to download");

    // Optional positional output path
    app.add_option("OUTPUT", config.outputPath,
                   "Where to save the file (default: last URL path segment, in the current directory)");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e)
    {
        // -h / --help: print usage and exit 0
        return app.exit(e);
    }
    catch (const CLI::ParseError &e)
    {
        app.exit(e);
        return 1;
    }

    if (config.url.empty())
    {
        fmt::print(stderr, "{}", app.help());
        return 1;
    }

    // ====================================================================
    // PERFORM DOWNLOAD
    // ====================================================================

    try
    {
        // Create HTTP client (RAII ensures cleanup)
        HttpClient client;
        Downloader downloader(client);

        downloader.setRedirectObserver([](long statusCode, const std::string &, const std::string &to)
                                       { fmt::print("Redirected ({}) to {}\n", statusCode, to); });

        fmt::print("Downloading {}...\n", config.url);

        DownloadRequest request{config.url, config.outputPath};
        TransferResult result = downloader.download(request, std::filesystem::current_path());

        fmt::print("✓ Saved {} to {}\n", formatBytes(result.bytesWritten), result.outputPath.string());
        fmt::print("  SHA-256: {}\n", result.sha256);
        return 0;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
