#include "download_tool.hpp"
#include "test_support.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <fmt/core.h>

namespace fs = std::filesystem;

int main()
{
    TestReport report;

    try
    {
        TempDir temp("download-file-tool");
        ToolContext context{temp.path()};

        // Test 1: Schema advertises the arguments
        {
            const nlohmann::json &schema = DownloadTool::schema();
            report.check(schema["name"] == "download_file", "Schema name");
            report.check(schema["parameters"]["properties"].contains("url"), "Schema has url");
            report.check(schema["parameters"]["properties"].contains("outputPath"), "Schema has outputPath");
            report.check(schema["parameters"]["required"] == nlohmann::json::array({"url"}), "Only url is required");
        }

        FakeTransport transport;
        transport.respond("https://example.com/files/report.pdf", {200, std::nullopt, "report body"});
        transport.respond("https://example.com/latest", {302, std::string("/files/report.pdf"), ""});
        DownloadTool tool(transport);

        // Test 2: Filename inferred into the context directory
        {
            nlohmann::json result = tool.execute({{"url", "https://example.com/files/report.pdf"}}, context);
            fs::path expected = (temp.path() / "report.pdf").lexically_normal();

            report.check(result["url"] == "https://example.com/files/report.pdf", "Result url");
            report.check(result["outputPath"] == expected.string(), "Result outputPath");
            report.check(result["bytesWritten"] == 11, "Result bytesWritten");
            report.check(result["sha256"].get<std::string>().size() == 64, "Result sha256");
            report.check(readFile(expected) == "report body", "File saved in context directory");
        }

        // Test 3: Relative outputPath and redirected final url
        {
            nlohmann::json args = {{"url", "https://example.com/latest"}, {"outputPath", "docs/latest.pdf"}};
            nlohmann::json result = tool.execute(args, context);

            report.check(result["url"] == "https://example.com/files/report.pdf", "Result url follows redirect");
            report.check(readFile(temp.path() / "docs" / "latest.pdf") == "report body", "Relative outputPath honored");
        }

        // Test 4: Null outputPath behaves like an omitted one
        {
            nlohmann::json args = {{"url", "https://example.com/files/report.pdf"}, {"outputPath", nullptr}};
            nlohmann::json result = tool.execute(args, context);
            report.check(result["outputPath"] == (temp.path() / "report.pdf").lexically_normal().string(),
                         "Null outputPath inferred");
        }

        // Test 5: Argument validation happens before any request
        {
            size_t before = transport.requests().size();

            report.checkThrows(DownloadError::Kind::InvalidUrl, "Missing url",
                               [&] { tool.execute(nlohmann::json::object(), context); });
            report.checkThrows(DownloadError::Kind::InvalidUrl, "Non-string url",
                               [&] { tool.execute({{"url", 42}}, context); });
            report.checkThrows(DownloadError::Kind::InvalidUrl, "Non-http url",
                               [&] { tool.execute({{"url", "ftp://example.com/a"}}, context); });

            bool rejected = false;
            try
            {
                tool.execute({{"url", "https://example.com/files/report.pdf"}, {"outputPath", 7}}, context);
            }
            catch (const std::invalid_argument &)
            {
                rejected = true;
            }
            report.check(rejected, "Non-string outputPath");
            report.check(transport.requests().size() == before, "No request for invalid arguments");
        }

        // Test 6: Download failures surface unchanged
        {
            report.checkThrows(DownloadError::Kind::Transport, "Unknown host",
                               [&] { tool.execute({{"url", "https://unknown.example.com/x"}}, context); });
        }

        return report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
