#pragma once

#include <gtest/gtest.h>
#include "core/transcript_errors.hpp"
#include "core/transcript_provider.hpp"
#include "logging/logger.hpp"
#include "youtube/http_transport.hpp"
#include "youtube/youtube_transcript_provider.hpp"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Canned platform data shared by every provider a FakeTranscriptProviderFactory creates
 */
struct FakeProviderState
{
    std::string resolved_video_id; // empty: echo the requested id
    std::vector<TranscriptTrack> tracks;
    std::map<std::string, std::vector<TranscriptSegment>> segments_by_language;

    // When set, fetch and list call this before anything else
    std::function<void(const std::string &video_id)> fail_with;

    // Recorded calls
    std::mutex mutex;
    int created = 0;
    std::vector<std::string> requested_ids;
    std::vector<std::string> last_languages;
    bool last_preserve_formatting = false;

    void addTrack(const std::string &language_code, const std::string &language, bool generated,
                  std::vector<TranscriptSegment> segments = {}, bool translatable = false)
    {
        TranscriptTrack track;
        track.language_code = language_code;
        track.language = language;
        track.is_generated = generated;
        track.is_translatable = translatable;
        track.url = "https://www.youtube.com/api/timedtext?lang=" + language_code;
        tracks.push_back(track);
        segments_by_language[language_code + (generated ? "#asr" : "")] = std::move(segments);
    }
};

class FakeTranscriptProvider : public TranscriptProvider
{
public:
    explicit FakeTranscriptProvider(FakeProviderState &state) : state_(state) {}

    FetchedTranscript fetch(const std::string &video_id,
                            const std::vector<std::string> &languages,
                            bool preserve_formatting) override
    {
        {
            std::lock_guard<std::mutex> lock(state_.mutex);
            state_.last_languages = languages;
            state_.last_preserve_formatting = preserve_formatting;
        }
        auto tracks = list(video_id);
        const TranscriptTrack &track = YouTubeTranscriptProvider::findTrack(tracks, languages, video_id);

        FetchedTranscript fetched;
        fetched.video_id = track.video_id;
        fetched.language = track.language;
        fetched.language_code = track.language_code;
        fetched.is_generated = track.is_generated;
        fetched.segments = state_.segments_by_language[track.language_code + (track.is_generated ? "#asr" : "")];
        return fetched;
    }

    std::vector<TranscriptTrack> list(const std::string &video_id) override
    {
        {
            std::lock_guard<std::mutex> lock(state_.mutex);
            state_.requested_ids.push_back(video_id);
        }
        if (state_.fail_with)
            state_.fail_with(video_id);

        auto tracks = state_.tracks;
        for (auto &track : tracks)
            track.video_id = state_.resolved_video_id.empty() ? video_id : state_.resolved_video_id;
        return tracks;
    }

private:
    FakeProviderState &state_;
};

class FakeTranscriptProviderFactory : public TranscriptProviderFactory
{
public:
    std::unique_ptr<TranscriptProvider> create() override
    {
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.created++;
        }
        return std::make_unique<FakeTranscriptProvider>(state);
    }

    FakeProviderState state;
};

/**
 * @brief Scripted HttpTransport. Responses are matched by method and URL
 * substring, in the order the rules were added. A rule with several
 * responses plays them in sequence and then repeats the last one.
 * A status of -1 makes the call throw HttpTransportError.
 */
class FakeHttpTransport : public HttpTransport
{
public:
    struct Call
    {
        std::string method;
        std::string url;
        std::string body;
        HttpHeaders headers;
    };

    void on(const std::string &method, const std::string &url_part, std::vector<HttpResult> responses)
    {
        rules_.push_back(Rule{method, url_part, std::deque<HttpResult>(responses.begin(), responses.end())});
    }

    HttpResult get(const std::string &url, const HttpHeaders &headers) override
    {
        return respond("GET", url, "", headers);
    }

    HttpResult post(const std::string &url,
                    const std::string &body,
                    const std::string &,
                    const HttpHeaders &headers) override
    {
        return respond("POST", url, body, headers);
    }

    // Shared so a test can inspect calls after the provider took ownership
    std::shared_ptr<std::vector<Call>> calls = std::make_shared<std::vector<Call>>();

private:
    struct Rule
    {
        std::string method;
        std::string url_part;
        std::deque<HttpResult> responses;
    };

    HttpResult respond(const std::string &method, const std::string &url, const std::string &body, const HttpHeaders &headers)
    {
        calls->push_back(Call{method, url, body, headers});
        for (auto &rule : rules_)
        {
            if (rule.method != method || url.find(rule.url_part) == std::string::npos || rule.responses.empty())
                continue;

            HttpResult result = rule.responses.front();
            if (rule.responses.size() > 1)
                rule.responses.pop_front();
            if (result.status == -1)
                throw HttpTransportError(method + " " + url + " failed: Connection");
            return result;
        }
        return HttpResult{404, ""};
    }

    std::vector<Rule> rules_;
};

/**
 * @brief Quiet logger for tests
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
    }
};
