#pragma once

#include "core/transcript_formats.hpp"
#include "core/transcript_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief Converts fetched segments into the response shape.
 *
 * Pure functions: segment order and text are passed through untouched.
 * Markup handling happens upstream in the fetcher (preserve_formatting).
 */
class TranscriptFormatter
{
public:
    // Texts joined with '\n'
    static std::string toText(const std::vector<TranscriptSegment> &segments);

    // Array of {text, start, duration}
    static nlohmann::json toJson(const std::vector<TranscriptSegment> &segments);

    // JSON string for TEXT, JSON array for JSON
    static nlohmann::json format(const std::vector<TranscriptSegment> &segments, TranscriptFormat format);

    /**
     * @brief Reads a JSON-format transcript array back into segments.
     * @throws nlohmann::json::exception if an entry lacks text/start/duration
     */
    static std::vector<TranscriptSegment> segmentsFromJson(const nlohmann::json &transcript);
};
