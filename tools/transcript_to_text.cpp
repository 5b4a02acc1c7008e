#include "core/transcript_formatter.hpp"
#include "core/video_id_extractor.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include "youtube/html_text.hpp"
#include "youtube/httplib_transport.hpp"
#include "youtube/youtube_transcript_provider.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FETCH_FAILED = 1;
    constexpr int EXIT_USAGE = 2;
    constexpr int EXIT_NOTHING_TO_SAVE = 3;
    constexpr int EXIT_WRITE_FAILED = 4;

    struct Options
    {
        std::string video;
        std::string api_url = "http://localhost:8000";
        std::string languages = "ko,en";
        std::string output;
        bool direct = false;
        bool preserve_formatting = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "Usage: " << program << " <video-id-or-url> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --api-url <url>         Transcript server base URL (default: http://localhost:8000)" << std::endl;
        std::cout << "  --languages <codes>     Comma-separated language preference (default: ko,en)" << std::endl;
        std::cout << "  --output, -o <file>     Output file (default: transcript_<VIDEO_ID>.txt)" << std::endl;
        std::cout << "  --direct                Fetch from YouTube in-process instead of via the server" << std::endl;
        std::cout << "  --preserve-formatting   Keep inline markup in the saved text" << std::endl;
        std::cout << "  --help, -h              Show this help message" << std::endl;
    }

    std::string stripTrailingSlashes(std::string url)
    {
        while (!url.empty() && url.back() == '/')
        {
            url.pop_back();
        }
        return url;
    }

    // GET /transcript/{id} on the server and read the segment array back
    std::vector<TranscriptSegment> fetchViaServer(const Options &options, const std::string &video_id)
    {
        std::string url = stripTrailingSlashes(options.api_url) + "/transcript/" + HtmlText::urlEncode(video_id) +
                          "?languages=" + HtmlText::urlEncode(options.languages) +
                          "&format=json&preserve_formatting=" + (options.preserve_formatting ? "true" : "false");

        HttplibTransport transport{TransportSettings{}};
        Logger::debug("GET " + url);
        HttpResult result = transport.get(url, {{"Accept", "application/json"}});

        nlohmann::json body = nlohmann::json::parse(result.body, nullptr, false);
        if (!result.isSuccess())
        {
            std::string detail = "HTTP " + std::to_string(result.status);
            if (body.is_object() && body.contains("detail") && body["detail"].is_string())
            {
                detail += ": " + body["detail"].get<std::string>();
            }
            throw std::runtime_error(detail);
        }
        if (!body.is_object() || !body.contains("transcript"))
        {
            return {};
        }
        return TranscriptFormatter::segmentsFromJson(body["transcript"]);
    }

    std::vector<TranscriptSegment> fetchDirect(const Options &options, const std::string &video_id)
    {
        YouTubeTranscriptProvider provider(std::make_unique<HttplibTransport>(TransportSettings{}));
        FetchedTranscript fetched = provider.fetch(video_id, splitList(options.languages, ','), options.preserve_formatting);
        Logger::info("Fetched " + std::to_string(fetched.segments.size()) + " segments in " + fetched.language_code);
        return fetched.segments;
    }
}

int main(int argc, char *argv[])
{
    Options options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        else if (arg == "--api-url" && has_value)
        {
            options.api_url = argv[++i];
        }
        else if (arg == "--languages" && has_value)
        {
            options.languages = argv[++i];
        }
        else if ((arg == "--output" || arg == "-o") && has_value)
        {
            options.output = argv[++i];
        }
        else if (arg == "--direct")
        {
            options.direct = true;
        }
        else if (arg == "--preserve-formatting")
        {
            options.preserve_formatting = true;
        }
        else if (!arg.empty() && arg[0] != '-' && options.video.empty())
        {
            options.video = arg;
        }
        else
        {
            std::cerr << "Error: unexpected argument '" << arg << "'" << std::endl;
            printUsage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (options.video.empty())
    {
        std::cerr << "Error: a video id or URL is required" << std::endl;
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    Logger::init("INFO");

    std::string video_id = VideoIdExtractor::extract(options.video);
    if (options.output.empty())
    {
        options.output = "transcript_" + video_id + ".txt";
    }

    std::cout << "Fetching transcript for video " << video_id << "..." << std::endl;

    std::vector<TranscriptSegment> segments;
    try
    {
        segments = options.direct ? fetchDirect(options, video_id) : fetchViaServer(options, video_id);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Failed to fetch transcript: " << e.what() << std::endl;
        return EXIT_FETCH_FAILED;
    }

    std::string text = TranscriptFormatter::toText(segments);
    if (text.empty())
    {
        std::cerr << "Nothing to save: the transcript has no text" << std::endl;
        return EXIT_NOTHING_TO_SAVE;
    }

    std::ofstream out(options.output, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        std::cerr << "Failed to open " << options.output << " for writing" << std::endl;
        return EXIT_WRITE_FAILED;
    }
    out << text;
    out.close();
    if (!out)
    {
        std::cerr << "Failed to write " << options.output << std::endl;
        return EXIT_WRITE_FAILED;
    }

    std::cout << "Transcript saved to " << options.output << std::endl;
    return EXIT_OK;
}
