#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "downloader.hpp"

/**
 * Context a host hands to a tool invocation.
 */
struct ToolContext
{
    std::filesystem::path directory; // Relative output paths resolve from here
};

/**
 * Exposes the downloader as a callable tool: JSON arguments in, JSON result out.
 */
class DownloadTool
{
public:
    explicit DownloadTool(HttpTransport &transport);

    /**
     * Tool description in function-calling form:
     * { "name", "description", "parameters": <JSON schema> }
     */
    static const nlohmann::json &schema();

    /**
     * Run one download.
     *
     * @param args { "url": string, "outputPath"?: string }
     * @param context Supplies the base directory
     * @return { "url", "outputPath", "bytesWritten", "sha256" }
     * @throws DownloadError on invalid arguments or any download failure
     */
    nlohmann::json execute(const nlohmann::json &args, const ToolContext &context);

private:
    Downloader downloader_;
};
