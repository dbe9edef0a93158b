#include "download_tool.hpp"
#include "download_error.hpp"

#include <optional>
#include <stdexcept>
#include <string>

DownloadTool::DownloadTool(HttpTransport &transport) : downloader_(transport)
{
}

const nlohmann::json &DownloadTool::schema()
{
    static const nlohmann::json definition = nlohmann::json::parse(R"(
    {
        "name" : "download_file",
        "description" : "Download a file from an HTTP(S) URL and save it locally.",
        "parameters" : {
            "type" : "object",
            "properties" : {
                "url" : {
                    "type" : "string",
                    "format" : "uri",
                    "description" : "HTTP(S) URL for the file to download"
                },
                "outputPath" : {
                    "type" : "string",
                    "description" : "Optional output path. Relative paths are resolved from context.directory."
                }
            },
            "required" : ["url"]
        }
    })");
    return definition;
}

nlohmann::json DownloadTool::execute(const nlohmann::json &args, const ToolContext &context)
{
    if (!args.is_object() || !args.contains("url") || !args["url"].is_string())
    {
        throw DownloadError(DownloadError::Kind::InvalidUrl,
                            "Missing required string argument 'url'");
    }

    DownloadRequest request;
    request.url = args["url"].get<std::string>();

    if (args.contains("outputPath") && !args["outputPath"].is_null())
    {
        if (!args["outputPath"].is_string())
        {
            throw std::invalid_argument("Argument 'outputPath' must be a string");
        }
        request.outputPath = args["outputPath"].get<std::string>();
    }

    TransferResult result = downloader_.download(request, context.directory);

    return nlohmann::json{
        {"url", result.url},
        {"outputPath", result.outputPath.string()},
        {"bytesWritten", result.bytesWritten},
        {"sha256", result.sha256},
    };
}
