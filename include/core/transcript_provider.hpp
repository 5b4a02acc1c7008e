#pragma once

#include "core/transcript_types.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Transcript retrieval capability.
 *
 * Implementations throw TranscriptFetchError on any failure.
 */
class TranscriptProvider
{
public:
    virtual ~TranscriptProvider() = default;

    /**
     * @brief Fetch the first track matching the language preference.
     *
     * Languages are tried in order. For each code a manually created track
     * wins over a generated one.
     *
     * @param video_id Canonical video identifier
     * @param languages Language codes in priority order
     * @param preserve_formatting Keep basic inline markup (<i>, <b>, ...) in segment text
     */
    virtual FetchedTranscript fetch(const std::string &video_id,
                                    const std::vector<std::string> &languages,
                                    bool preserve_formatting) = 0;

    /**
     * @brief Enumerate every track for the video, manual tracks first
     */
    virtual std::vector<TranscriptTrack> list(const std::string &video_id) = 0;
};

/**
 * @brief Creates a provider per request so no client state (cookies,
 * connections) is shared between requests.
 */
class TranscriptProviderFactory
{
public:
    virtual ~TranscriptProviderFactory() = default;
    virtual std::unique_ptr<TranscriptProvider> create() = 0;
};
