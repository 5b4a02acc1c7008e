#include "core/transcript_service.hpp"
#include "core/transcript_errors.hpp"
#include "core/transcript_formatter.hpp"
#include "core/video_id_extractor.hpp"
#include "logging/logger.hpp"

namespace
{
    std::string joinLanguages(const std::vector<std::string> &languages)
    {
        std::string joined;
        for (const auto &language : languages)
        {
            if (!joined.empty())
                joined += ",";
            joined += language;
        }
        return joined;
    }

    [[noreturn]] void rethrowAsRequestError(const char *prefix, const std::string &video_id)
    {
        try
        {
            throw;
        }
        catch (const TranscriptFetchError &e)
        {
            Logger::warn(std::string(prefix) + " for " + video_id + " [" +
                         TranscriptFetchError::kindName(e.kind()) + "]: " + e.what());
            throw TranscriptRequestError(std::string(prefix) + ": " + e.what());
        }
        catch (const std::exception &e)
        {
            Logger::warn(std::string(prefix) + " for " + video_id + ": " + e.what());
            throw TranscriptRequestError(std::string(prefix) + ": " + e.what());
        }
    }
}

TranscriptService::TranscriptService(TranscriptProviderFactory &provider_factory)
    : provider_factory_(provider_factory)
{
}

TranscriptResponse TranscriptService::fetch(const TranscriptRequest &request)
{
    std::string video_id = request.url_or_id;
    try
    {
        video_id = VideoIdExtractor::extract(request.url_or_id);
        Logger::debug("Fetching transcript for " + video_id + " (languages: " + joinLanguages(request.languages) +
                      ", format: " + TranscriptFormats::getFormatName(request.format) + ")");

        auto provider = provider_factory_.create();
        FetchedTranscript fetched = provider->fetch(video_id, request.languages, request.preserve_formatting);

        TranscriptResponse response;
        response.video_id = fetched.video_id;
        response.language = fetched.language;
        response.language_code = fetched.language_code;
        response.is_generated = fetched.is_generated;
        response.transcript = TranscriptFormatter::format(fetched.segments, request.format);

        Logger::info("Fetched " + std::to_string(fetched.segments.size()) + " segments for " + fetched.video_id +
                     " in " + fetched.language_code + (fetched.is_generated ? " (generated)" : ""));
        return response;
    }
    catch (...)
    {
        rethrowAsRequestError(FETCH_ERROR_PREFIX, video_id);
    }
}

TranscriptListResponse TranscriptService::listTracks(const std::string &url_or_id)
{
    std::string video_id = url_or_id;
    try
    {
        video_id = VideoIdExtractor::extract(url_or_id);
        Logger::debug("Listing transcripts for " + video_id);

        auto provider = provider_factory_.create();
        auto tracks = provider->list(video_id);

        TranscriptListResponse response;
        response.video_id = video_id;
        for (const auto &track : tracks)
        {
            TranscriptTrackInfo info;
            info.language = track.language;
            info.language_code = track.language_code;
            info.is_generated = track.is_generated;
            info.is_translatable = track.is_translatable;
            for (const auto &translation : track.translation_languages)
                info.translation_languages.push_back(translation.language_code);
            response.available_transcripts.push_back(std::move(info));
        }

        Logger::info("Listed " + std::to_string(response.available_transcripts.size()) + " transcripts for " + video_id);
        return response;
    }
    catch (...)
    {
        rethrowAsRequestError(LIST_ERROR_PREFIX, video_id);
    }
}
