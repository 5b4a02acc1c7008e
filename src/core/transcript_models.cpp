#include "core/transcript_models.hpp"
#include "core/poco_config_manager.hpp"
#include "core/transcript_errors.hpp"
#include <algorithm>
#include <cctype>

namespace
{
    TranscriptFormat parseFormat(const std::string &value)
    {
        auto format = TranscriptFormats::fromString(value);
        if (!format)
            throw RequestValidationError("format must match ^(json|text)$, got '" + value + "'");
        return *format;
    }
}

TranscriptRequest TranscriptRequest::fromJson(const nlohmann::json &body, const std::vector<std::string> &default_languages)
{
    if (!body.is_object())
        throw RequestValidationError("Request body must be a JSON object");

    TranscriptRequest request;
    request.languages = default_languages;

    auto url_or_id = body.find("url_or_id");
    if (url_or_id == body.end() || url_or_id->is_null())
        throw RequestValidationError("url_or_id: field required");
    if (!url_or_id->is_string())
        throw RequestValidationError("url_or_id: must be a string");
    request.url_or_id = url_or_id->get<std::string>();

    auto languages = body.find("languages");
    if (languages != body.end() && !languages->is_null())
    {
        if (!languages->is_array())
            throw RequestValidationError("languages: must be a list of strings");
        request.languages.clear();
        for (const auto &language : *languages)
        {
            if (!language.is_string())
                throw RequestValidationError("languages: must be a list of strings");
            request.languages.push_back(language.get<std::string>());
        }
    }

    auto format = body.find("format");
    if (format != body.end() && !format->is_null())
    {
        if (!format->is_string())
            throw RequestValidationError("format: must be a string");
        request.format = parseFormat(format->get<std::string>());
    }

    auto preserve = body.find("preserve_formatting");
    if (preserve != body.end() && !preserve->is_null())
    {
        if (!preserve->is_boolean())
            throw RequestValidationError("preserve_formatting: must be a boolean");
        request.preserve_formatting = preserve->get<bool>();
    }

    return request;
}

TranscriptRequest TranscriptRequest::fromQuery(const std::string &video_id,
                                               const std::string &languages,
                                               const std::string &format,
                                               const std::string &preserve_formatting,
                                               const std::vector<std::string> &default_languages)
{
    if (video_id.empty())
        throw RequestValidationError("video_id: field required");

    TranscriptRequest request;
    request.url_or_id = video_id;
    request.languages = languages.empty() ? default_languages : splitList(languages, ',');
    if (!format.empty())
        request.format = parseFormat(format);
    if (!preserve_formatting.empty())
        request.preserve_formatting = parseBoolParam("preserve_formatting", preserve_formatting);
    return request;
}

bool parseBoolParam(const std::string &name, const std::string &value)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on")
        return true;
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off")
        return false;
    throw RequestValidationError(name + ": value could not be parsed to a boolean, got '" + value + "'");
}

void to_json(nlohmann::json &j, const TranscriptResponse &response)
{
    j = nlohmann::json{
        {"video_id", response.video_id},
        {"language", response.language},
        {"language_code", response.language_code},
        {"is_generated", response.is_generated},
        {"transcript", response.transcript}};
}

void to_json(nlohmann::json &j, const TranscriptTrackInfo &info)
{
    j = nlohmann::json{
        {"language", info.language},
        {"language_code", info.language_code},
        {"is_generated", info.is_generated},
        {"is_translatable", info.is_translatable},
        {"translation_languages", info.translation_languages}};
}

void to_json(nlohmann::json &j, const TranscriptListResponse &response)
{
    j = nlohmann::json{
        {"video_id", response.video_id},
        {"available_transcripts", response.available_transcripts}};
}
