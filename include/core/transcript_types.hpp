#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief One timed caption line. start and duration are in seconds.
 */
struct TranscriptSegment
{
    std::string text;
    double start = 0.0;
    double duration = 0.0;

    bool operator==(const TranscriptSegment &other) const
    {
        return text == other.text && start == other.start && duration == other.duration;
    }
};

/**
 * @brief Language a translatable track can be auto-translated into
 */
struct TranslationLanguage
{
    std::string language;
    std::string language_code;
};

/**
 * @brief Caption track as enumerated from the platform.
 *
 * url is the timed-text endpoint for this track and never leaves the fetcher.
 */
struct TranscriptTrack
{
    std::string video_id;
    std::string language;
    std::string language_code;
    bool is_generated = false;
    bool is_translatable = false;
    std::vector<TranslationLanguage> translation_languages;
    std::string url;
};

/**
 * @brief Result of a successful fetch: track metadata plus its segments in
 * platform order. video_id is the id the platform resolved, which is what
 * gets echoed back to callers.
 */
struct FetchedTranscript
{
    std::string video_id;
    std::string language;
    std::string language_code;
    bool is_generated = false;
    std::vector<TranscriptSegment> segments;
};

inline void to_json(nlohmann::json &j, const TranscriptSegment &segment)
{
    j = nlohmann::json{{"text", segment.text}, {"start", segment.start}, {"duration", segment.duration}};
}

inline void from_json(const nlohmann::json &j, TranscriptSegment &segment)
{
    j.at("text").get_to(segment.text);
    j.at("start").get_to(segment.start);
    j.at("duration").get_to(segment.duration);
}
