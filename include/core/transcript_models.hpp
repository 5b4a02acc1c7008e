#pragma once

#include "core/transcript_formats.hpp"
#include "core/transcript_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief Validated fetch request.
 *
 * Built once at the HTTP boundary by fromJson() (POST body) or fromQuery()
 * (GET path and query string). Both throw RequestValidationError.
 */
struct TranscriptRequest
{
    std::string url_or_id;
    std::vector<std::string> languages;
    TranscriptFormat format = TranscriptFormat::JSON;
    bool preserve_formatting = false;

    /**
     * @brief Body shape: {url_or_id, languages?, format?, preserve_formatting?}.
     * Absent or null optional fields take their defaults.
     */
    static TranscriptRequest fromJson(const nlohmann::json &body, const std::vector<std::string> &default_languages);

    /**
     * @brief Query form. languages is comma-joined ("ko,en"); each entry is trimmed.
     * Empty optional parameters take their defaults.
     */
    static TranscriptRequest fromQuery(const std::string &video_id,
                                       const std::string &languages,
                                       const std::string &format,
                                       const std::string &preserve_formatting,
                                       const std::vector<std::string> &default_languages);
};

/**
 * @brief Accepts true/false, 1/0, yes/no, on/off (case-insensitive)
 * @throws RequestValidationError for anything else
 */
bool parseBoolParam(const std::string &name, const std::string &value);

struct TranscriptResponse
{
    std::string video_id;
    std::string language;
    std::string language_code;
    bool is_generated = false;
    nlohmann::json transcript; // string (text) or array of segments (json)
};

struct TranscriptTrackInfo
{
    std::string language;
    std::string language_code;
    bool is_generated = false;
    bool is_translatable = false;
    std::vector<std::string> translation_languages;
};

struct TranscriptListResponse
{
    std::string video_id;
    std::vector<TranscriptTrackInfo> available_transcripts;
};

void to_json(nlohmann::json &j, const TranscriptResponse &response);
void to_json(nlohmann::json &j, const TranscriptTrackInfo &info);
void to_json(nlohmann::json &j, const TranscriptListResponse &response);
