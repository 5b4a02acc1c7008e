#include "youtube/youtube_transcript_provider.hpp"
#include "core/transcript_errors.hpp"
#include "logging/logger.hpp"
#include "youtube/html_text.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <iterator>
#include <regex>

namespace
{
    using Kind = TranscriptFetchError::Kind;

    const char *CONSENT_FORM_MARKER = "action=\"https://consent.youtube.com/s\"";
    const char *RECAPTCHA_MARKER = "class=\"g-recaptcha\"";
    const char *BOT_DETECTED_REASON = "Sign in to confirm you’re not a bot";
    const char *AGE_RESTRICTED_REASON = "This video may be inappropriate for some users.";
    const char *VIDEO_UNAVAILABLE_REASON = "This video is unavailable";

    bool startsWith(const std::string &value, const std::string &prefix)
    {
        return value.compare(0, prefix.size(), prefix) == 0;
    }

    bool looksLikeUrl(const std::string &video_id)
    {
        return startsWith(video_id, "http://") || startsWith(video_id, "https://") || startsWith(video_id, "www.");
    }

    std::string invalidVideoIdCause()
    {
        return "You provided an invalid video id. Make sure you are using the video id and NOT the url! "
               "(`https://www.youtube.com/watch?v=1234` -> `1234`)";
    }

    std::string ipBlockedCause()
    {
        return "YouTube is blocking requests from this IP address. This usually happens after too many "
               "requests or when the server runs on a cloud provider's IP range.";
    }

    // "runs":[{"text":..}] or "simpleText"
    std::string readText(const nlohmann::json &node)
    {
        if (!node.is_object())
            return "";
        auto runs = node.find("runs");
        if (runs != node.end() && runs->is_array() && !runs->empty())
            return (*runs)[0].value("text", "");
        return node.value("simpleText", "");
    }

    std::string removeAll(std::string value, const std::string &needle)
    {
        size_t pos = 0;
        while ((pos = value.find(needle, pos)) != std::string::npos)
            value.erase(pos, needle.size());
        return value;
    }

    std::string describeTracks(const std::vector<TranscriptTrack> &tracks, bool generated)
    {
        std::string lines;
        for (const auto &track : tracks)
        {
            if (track.is_generated != generated)
                continue;
            lines += "\n - " + track.language_code + " (\"" + track.language + "\")";
        }
        return lines.empty() ? "\n None" : lines;
    }
}

YouTubeTranscriptProvider::YouTubeTranscriptProvider(std::unique_ptr<HttpTransport> transport,
                                                     std::string accept_language)
    : transport_(std::move(transport)), accept_language_(std::move(accept_language))
{
}

FetchedTranscript YouTubeTranscriptProvider::fetch(const std::string &video_id,
                                                   const std::vector<std::string> &languages,
                                                   bool preserve_formatting)
{
    auto tracks = list(video_id);
    const TranscriptTrack &track = findTrack(tracks, languages, video_id);

    if (track.url.find("&exp=xpe") != std::string::npos)
    {
        throw TranscriptFetchError(Kind::PoTokenRequired, video_id,
                                   "The requested video cannot be retrieved without a PO Token.");
    }

    Logger::debug("YouTubeTranscriptProvider: Downloading " + track.language_code + " track for " + video_id);
    HttpResult result;
    try
    {
        result = transport_->get(track.url, requestHeaders());
    }
    catch (const HttpTransportError &e)
    {
        throw TranscriptFetchError(Kind::YouTubeRequestFailed, video_id, std::string("Request to YouTube failed: ") + e.what());
    }
    raiseHttpErrors(result, video_id);

    FetchedTranscript fetched;
    fetched.video_id = track.video_id;
    fetched.language = track.language;
    fetched.language_code = track.language_code;
    fetched.is_generated = track.is_generated;
    fetched.segments = parseTimedText(result.body, preserve_formatting, video_id);
    return fetched;
}

std::vector<TranscriptTrack> YouTubeTranscriptProvider::list(const std::string &video_id)
{
    if (looksLikeUrl(video_id))
        throw TranscriptFetchError(Kind::InvalidVideoId, video_id, invalidVideoIdCause());

    std::string html = fetchVideoHtml(video_id);
    std::string api_key = extractInnertubeApiKey(html, video_id);
    nlohmann::json innertube_data = fetchInnertubeData(video_id, api_key);
    nlohmann::json captions_json = extractCaptionsJson(innertube_data, video_id);

    auto tracks = buildTracks(captions_json, video_id);

    // Prefer the id the platform reports for the video
    if (innertube_data.contains("videoDetails") && innertube_data["videoDetails"].is_object())
    {
        std::string resolved_id = innertube_data["videoDetails"].value("videoId", "");
        if (!resolved_id.empty())
        {
            for (auto &track : tracks)
                track.video_id = resolved_id;
        }
    }

    return tracks;
}

const TranscriptTrack &YouTubeTranscriptProvider::findTrack(const std::vector<TranscriptTrack> &tracks,
                                                            const std::vector<std::string> &languages,
                                                            const std::string &video_id)
{
    for (const auto &language_code : languages)
    {
        for (bool generated : {false, true})
        {
            for (const auto &track : tracks)
            {
                if (track.is_generated == generated && track.language_code == language_code)
                    return track;
            }
        }
    }

    std::string requested;
    for (const auto &language_code : languages)
        requested += (requested.empty() ? "" : ", ") + language_code;

    throw TranscriptFetchError(Kind::NoTranscriptFound, video_id,
                               "No transcripts were found for any of the requested language codes: [" + requested +
                                   "]\n\nAvailable transcripts:\n(MANUALLY CREATED)" + describeTracks(tracks, false) +
                                   "\n(GENERATED)" + describeTracks(tracks, true));
}

std::vector<TranscriptSegment> YouTubeTranscriptProvider::parseTimedText(const std::string &xml,
                                                                         bool preserve_formatting,
                                                                         const std::string &video_id)
{
    pugi::xml_document document;
    pugi::xml_parse_result parsed = document.load_string(xml.c_str(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!parsed)
    {
        throw TranscriptFetchError(Kind::YouTubeDataUnparsable, video_id,
                                   std::string("The transcript data is not parsable: ") + parsed.description());
    }

    pugi::xml_node root = document.child("transcript");
    if (!root)
    {
        throw TranscriptFetchError(Kind::YouTubeDataUnparsable, video_id,
                                   "The transcript data has no <transcript> element");
    }

    std::vector<TranscriptSegment> segments;
    for (pugi::xml_node element : root.children("text"))
    {
        std::string raw = element.child_value();
        if (raw.empty())
            continue;

        TranscriptSegment segment;
        segment.text = HtmlText::stripTags(HtmlText::unescape(raw), preserve_formatting);
        segment.start = element.attribute("start").as_double(0.0);
        segment.duration = element.attribute("dur").as_double(0.0);
        segments.push_back(std::move(segment));
    }

    return segments;
}

std::string YouTubeTranscriptProvider::fetchVideoHtml(const std::string &video_id)
{
    std::string html = fetchHtml(video_id);
    if (html.find(CONSENT_FORM_MARKER) != std::string::npos)
    {
        createConsentCookie(html, video_id);
        html = fetchHtml(video_id);
        if (html.find(CONSENT_FORM_MARKER) != std::string::npos)
        {
            throw TranscriptFetchError(Kind::FailedToCreateConsentCookie, video_id,
                                       "Failed to automatically give consent to saving cookies");
        }
    }
    return html;
}

std::string YouTubeTranscriptProvider::fetchHtml(const std::string &video_id)
{
    HttpResult result;
    try
    {
        result = transport_->get(WATCH_URL + HtmlText::urlEncode(video_id), requestHeaders());
    }
    catch (const HttpTransportError &e)
    {
        throw TranscriptFetchError(Kind::YouTubeRequestFailed, video_id, std::string("Request to YouTube failed: ") + e.what());
    }
    raiseHttpErrors(result, video_id);
    return HtmlText::unescape(result.body);
}

void YouTubeTranscriptProvider::createConsentCookie(const std::string &html, const std::string &video_id)
{
    static const std::regex consent_value(R"(name="v" value="(.*?)")");
    std::smatch match;
    if (!std::regex_search(html, match, consent_value))
    {
        throw TranscriptFetchError(Kind::FailedToCreateConsentCookie, video_id,
                                   "Failed to automatically give consent to saving cookies");
    }

    consent_cookie_ = "CONSENT=YES+" + match.str(1);
    Logger::debug("YouTubeTranscriptProvider: Accepted consent form for " + video_id);
}

std::string YouTubeTranscriptProvider::extractInnertubeApiKey(const std::string &html, const std::string &video_id) const
{
    static const std::regex api_key_pattern(R"("INNERTUBE_API_KEY":\s*"([a-zA-Z0-9_-]+)")");
    std::smatch match;
    if (std::regex_search(html, match, api_key_pattern))
        return match.str(1);

    if (html.find(RECAPTCHA_MARKER) != std::string::npos)
        throw TranscriptFetchError(Kind::IpBlocked, video_id, ipBlockedCause());

    throw TranscriptFetchError(Kind::YouTubeDataUnparsable, video_id,
                               "The data required to fetch the transcript is not parsable. "
                               "YouTube may have changed its page layout.");
}

nlohmann::json YouTubeTranscriptProvider::fetchInnertubeData(const std::string &video_id, const std::string &api_key)
{
    nlohmann::json payload = {
        {"context", {{"client", {{"clientName", INNERTUBE_CLIENT_NAME}, {"clientVersion", INNERTUBE_CLIENT_VERSION}}}}},
        {"videoId", video_id}};

    HttpResult result;
    try
    {
        result = transport_->post(INNERTUBE_API_URL + api_key, payload.dump(), "application/json", requestHeaders());
    }
    catch (const HttpTransportError &e)
    {
        throw TranscriptFetchError(Kind::YouTubeRequestFailed, video_id, std::string("Request to YouTube failed: ") + e.what());
    }
    raiseHttpErrors(result, video_id);

    try
    {
        return nlohmann::json::parse(result.body);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw TranscriptFetchError(Kind::YouTubeDataUnparsable, video_id,
                                   std::string("The player response is not valid JSON: ") + e.what());
    }
}

nlohmann::json YouTubeTranscriptProvider::extractCaptionsJson(const nlohmann::json &innertube_data, const std::string &video_id) const
{
    if (!innertube_data.is_object())
    {
        throw TranscriptFetchError(Kind::YouTubeDataUnparsable, video_id, "The player response is not a JSON object");
    }

    auto playability = innertube_data.find("playabilityStatus");
    if (playability != innertube_data.end())
        assertPlayability(*playability, video_id);

    auto captions = innertube_data.find("captions");
    if (captions == innertube_data.end() || !captions->is_object())
        throw TranscriptFetchError(Kind::TranscriptsDisabled, video_id, "Subtitles are disabled for this video");

    auto renderer = captions->find("playerCaptionsTracklistRenderer");
    if (renderer == captions->end() || !renderer->is_object() || !renderer->contains("captionTracks"))
        throw TranscriptFetchError(Kind::TranscriptsDisabled, video_id, "Subtitles are disabled for this video");

    return *renderer;
}

void YouTubeTranscriptProvider::assertPlayability(const nlohmann::json &playability_status, const std::string &video_id) const
{
    if (!playability_status.is_object())
        return;

    std::string status = playability_status.value("status", "");
    if (status.empty() || status == "OK")
        return;

    std::string reason = playability_status.value("reason", "");

    if (status == "LOGIN_REQUIRED")
    {
        if (reason == BOT_DETECTED_REASON)
            throw TranscriptFetchError(Kind::RequestBlocked, video_id, ipBlockedCause());
        if (reason == AGE_RESTRICTED_REASON)
            throw TranscriptFetchError(Kind::AgeRestricted, video_id,
                                       "This video is age-restricted. Transcripts cannot be retrieved without "
                                       "authenticating as a user.");
    }

    if (status == "ERROR" && reason == VIDEO_UNAVAILABLE_REASON)
    {
        if (startsWith(video_id, "http://") || startsWith(video_id, "https://"))
            throw TranscriptFetchError(Kind::InvalidVideoId, video_id, invalidVideoIdCause());
        throw TranscriptFetchError(Kind::VideoUnavailable, video_id, "The video is no longer available");
    }

    std::string cause = "The video is unplayable for the following reason: " + (reason.empty() ? "No reason specified!" : reason);

    const nlohmann::json *node = &playability_status;
    for (const char *key : {"errorScreen", "playerErrorMessageRenderer", "subreason", "runs"})
    {
        if (!node->is_object() || !node->contains(key))
        {
            node = nullptr;
            break;
        }
        node = &(*node)[key];
    }

    if (node && node->is_array() && !node->empty())
    {
        cause += "\n\nAdditional Details:";
        for (const auto &run : *node)
            cause += "\n - " + (run.is_object() ? run.value("text", "") : std::string());
    }

    throw TranscriptFetchError(Kind::VideoUnplayable, video_id, cause);
}

std::vector<TranscriptTrack> YouTubeTranscriptProvider::buildTracks(const nlohmann::json &captions_json, const std::string &video_id) const
{
    std::vector<TranslationLanguage> translation_languages;
    auto translations = captions_json.find("translationLanguages");
    if (translations != captions_json.end() && translations->is_array())
    {
        for (const auto &translation : *translations)
        {
            TranslationLanguage language;
            language.language = readText(translation.value("languageName", nlohmann::json::object()));
            language.language_code = translation.value("languageCode", "");
            translation_languages.push_back(std::move(language));
        }
    }

    std::vector<TranscriptTrack> manual;
    std::vector<TranscriptTrack> generated;

    const auto &caption_tracks = captions_json["captionTracks"];
    if (!caption_tracks.is_array())
    {
        throw TranscriptFetchError(Kind::YouTubeDataUnparsable, video_id, "captionTracks is not a list");
    }

    try
    {
        for (const auto &caption : caption_tracks)
        {
            TranscriptTrack track;
            track.video_id = video_id;
            track.language_code = caption.at("languageCode").get<std::string>();
            track.language = readText(caption.value("name", nlohmann::json::object()));
            track.is_generated = caption.value("kind", "") == "asr";
            track.is_translatable = caption.value("isTranslatable", false);
            track.url = removeAll(caption.at("baseUrl").get<std::string>(), "&fmt=srv3");
            if (track.is_translatable)
                track.translation_languages = translation_languages;

            // One track per language code within a group; a later entry replaces the earlier one in place
            auto &group = track.is_generated ? generated : manual;
            auto existing = std::find_if(group.begin(), group.end(), [&](const TranscriptTrack &other)
                                         { return other.language_code == track.language_code; });
            if (existing != group.end())
                *existing = std::move(track);
            else
                group.push_back(std::move(track));
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        throw TranscriptFetchError(Kind::YouTubeDataUnparsable, video_id,
                                   std::string("Malformed caption track entry: ") + e.what());
    }

    manual.insert(manual.end(), std::make_move_iterator(generated.begin()), std::make_move_iterator(generated.end()));
    return manual;
}

void YouTubeTranscriptProvider::raiseHttpErrors(const HttpResult &result, const std::string &video_id) const
{
    if (result.status == 429)
        throw TranscriptFetchError(Kind::IpBlocked, video_id, ipBlockedCause());

    if (!result.isSuccess())
    {
        throw TranscriptFetchError(Kind::YouTubeRequestFailed, video_id,
                                   "Request to YouTube failed: HTTP " + std::to_string(result.status));
    }
}

HttpHeaders YouTubeTranscriptProvider::requestHeaders() const
{
    HttpHeaders headers{{"Accept-Language", accept_language_}};
    if (!consent_cookie_.empty())
        headers["Cookie"] = consent_cookie_;
    return headers;
}
