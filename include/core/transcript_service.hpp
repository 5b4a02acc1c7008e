#pragma once

#include "core/transcript_models.hpp"
#include "core/transcript_provider.hpp"
#include <string>

/**
 * @brief Request orchestration for the fetch and list operations.
 *
 * Error Handling Policy:
 * - Every failure after normalization (provider errors, transport errors,
 *   malformed platform data, formatting) is caught here once and rethrown
 *   as TranscriptRequestError carrying "<prefix>: <cause>".
 * - Nothing is retried. The provider error kind is logged, not surfaced.
 */
class TranscriptService
{
public:
    static constexpr const char *FETCH_ERROR_PREFIX = "Failed to fetch transcript";
    static constexpr const char *LIST_ERROR_PREFIX = "Failed to list transcripts";

    explicit TranscriptService(TranscriptProviderFactory &provider_factory);

    /**
     * @brief Normalize the id, fetch the preferred track and format it.
     * @throws TranscriptRequestError on any failure
     */
    TranscriptResponse fetch(const TranscriptRequest &request);

    /**
     * @brief Normalize the id and enumerate its tracks in platform order.
     * @throws TranscriptRequestError on any failure
     */
    TranscriptListResponse listTracks(const std::string &url_or_id);

private:
    TranscriptProviderFactory &provider_factory_;
};
