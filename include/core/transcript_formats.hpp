#pragma once

#include <optional>
#include <string>

/**
 * @brief Output shape of the transcript field in a fetch response
 */
enum class TranscriptFormat
{
    JSON, // Array of {text, start, duration}
    TEXT  // Segment texts joined with '\n'
};

class TranscriptFormats
{
public:
    static std::string getFormatName(TranscriptFormat format)
    {
        switch (format)
        {
        case TranscriptFormat::JSON:
            return "json";
        case TranscriptFormat::TEXT:
            return "text";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Parse a wire name. Matching is exact ("json" or "text");
     * anything else yields std::nullopt so the caller can reject it.
     */
    static std::optional<TranscriptFormat> fromString(const std::string &format_str)
    {
        if (format_str == "json")
            return TranscriptFormat::JSON;
        if (format_str == "text")
            return TranscriptFormat::TEXT;
        return std::nullopt;
    }
};
