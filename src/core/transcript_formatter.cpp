#include "core/transcript_formatter.hpp"

std::string TranscriptFormatter::toText(const std::vector<TranscriptSegment> &segments)
{
    std::string text;
    for (size_t i = 0; i < segments.size(); ++i)
    {
        if (i > 0)
            text += '\n';
        text += segments[i].text;
    }
    return text;
}

nlohmann::json TranscriptFormatter::toJson(const std::vector<TranscriptSegment> &segments)
{
    nlohmann::json records = nlohmann::json::array();
    for (const auto &segment : segments)
        records.push_back(segment);
    return records;
}

nlohmann::json TranscriptFormatter::format(const std::vector<TranscriptSegment> &segments, TranscriptFormat format)
{
    if (format == TranscriptFormat::TEXT)
        return toText(segments);
    return toJson(segments);
}

std::vector<TranscriptSegment> TranscriptFormatter::segmentsFromJson(const nlohmann::json &transcript)
{
    std::vector<TranscriptSegment> segments;
    if (!transcript.is_array())
        return segments;

    segments.reserve(transcript.size());
    for (const auto &entry : transcript)
        segments.push_back(entry.get<TranscriptSegment>());
    return segments;
}
