#pragma once

#include "core/transcript_provider.hpp"
#include "youtube/http_transport.hpp"
#include "youtube/httplib_transport.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief TranscriptProvider backed by YouTube's watch page, the Innertube
 * player endpoint and the timed-text endpoint.
 *
 * Flow per call:
 *  1. GET the watch page (accepting the EU consent form once if shown)
 *  2. Read INNERTUBE_API_KEY from the page
 *  3. POST the player request as the ANDROID client
 *  4. Check playability, read the caption track list
 *  5. (fetch only) GET the selected track's timed-text XML
 *
 * An instance keeps the consent cookie between calls, so it must not be
 * shared across independent requests.
 */
class YouTubeTranscriptProvider : public TranscriptProvider
{
public:
    static constexpr const char *WATCH_URL = "https://www.youtube.com/watch?v=";
    static constexpr const char *INNERTUBE_API_URL = "https://www.youtube.com/youtubei/v1/player?key=";
    static constexpr const char *INNERTUBE_CLIENT_NAME = "ANDROID";
    static constexpr const char *INNERTUBE_CLIENT_VERSION = "20.10.38";

    explicit YouTubeTranscriptProvider(std::unique_ptr<HttpTransport> transport,
                                       std::string accept_language = "en-US");

    FetchedTranscript fetch(const std::string &video_id,
                            const std::vector<std::string> &languages,
                            bool preserve_formatting) override;

    std::vector<TranscriptTrack> list(const std::string &video_id) override;

    /**
     * @brief Picks the first requested language with a track; manual beats generated.
     * @throws TranscriptFetchError(NoTranscriptFound)
     */
    static const TranscriptTrack &findTrack(const std::vector<TranscriptTrack> &tracks,
                                            const std::vector<std::string> &languages,
                                            const std::string &video_id);

    /**
     * @brief Parses timed-text XML into segments.
     * @throws TranscriptFetchError(YouTubeDataUnparsable) on malformed XML
     */
    static std::vector<TranscriptSegment> parseTimedText(const std::string &xml,
                                                         bool preserve_formatting,
                                                         const std::string &video_id);

private:
    std::string fetchVideoHtml(const std::string &video_id);
    std::string fetchHtml(const std::string &video_id);
    void createConsentCookie(const std::string &html, const std::string &video_id);
    std::string extractInnertubeApiKey(const std::string &html, const std::string &video_id) const;
    nlohmann::json fetchInnertubeData(const std::string &video_id, const std::string &api_key);
    nlohmann::json extractCaptionsJson(const nlohmann::json &innertube_data, const std::string &video_id) const;
    void assertPlayability(const nlohmann::json &playability_status, const std::string &video_id) const;
    std::vector<TranscriptTrack> buildTracks(const nlohmann::json &captions_json, const std::string &video_id) const;
    void raiseHttpErrors(const HttpResult &result, const std::string &video_id) const;
    HttpHeaders requestHeaders() const;

    std::unique_ptr<HttpTransport> transport_;
    std::string accept_language_;
    std::string consent_cookie_;
};

/**
 * @brief Builds a YouTubeTranscriptProvider with a fresh HttplibTransport per request
 */
class YouTubeTranscriptProviderFactory : public TranscriptProviderFactory
{
public:
    YouTubeTranscriptProviderFactory(TransportSettings settings, std::string accept_language)
        : settings_(std::move(settings)), accept_language_(std::move(accept_language)) {}

    std::unique_ptr<TranscriptProvider> create() override
    {
        return std::make_unique<YouTubeTranscriptProvider>(std::make_unique<HttplibTransport>(settings_), accept_language_);
    }

private:
    TransportSettings settings_;
    std::string accept_language_;
};
