#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Failure raised by a TranscriptProvider. kind() is for logging and
 * tests only; callers above the service never branch on it.
 */
class TranscriptFetchError : public std::runtime_error
{
public:
    enum class Kind
    {
        InvalidVideoId,
        VideoUnavailable,
        VideoUnplayable,
        AgeRestricted,
        RequestBlocked,
        IpBlocked,
        TranscriptsDisabled,
        NoTranscriptFound,
        PoTokenRequired,
        FailedToCreateConsentCookie,
        YouTubeRequestFailed,
        YouTubeDataUnparsable
    };

    TranscriptFetchError(Kind kind, const std::string &video_id, const std::string &cause)
        : std::runtime_error(buildMessage(video_id, cause)), kind_(kind), video_id_(video_id) {}

    Kind kind() const { return kind_; }
    const std::string &videoId() const { return video_id_; }

    static std::string kindName(Kind kind)
    {
        switch (kind)
        {
        case Kind::InvalidVideoId:
            return "InvalidVideoId";
        case Kind::VideoUnavailable:
            return "VideoUnavailable";
        case Kind::VideoUnplayable:
            return "VideoUnplayable";
        case Kind::AgeRestricted:
            return "AgeRestricted";
        case Kind::RequestBlocked:
            return "RequestBlocked";
        case Kind::IpBlocked:
            return "IpBlocked";
        case Kind::TranscriptsDisabled:
            return "TranscriptsDisabled";
        case Kind::NoTranscriptFound:
            return "NoTranscriptFound";
        case Kind::PoTokenRequired:
            return "PoTokenRequired";
        case Kind::FailedToCreateConsentCookie:
            return "FailedToCreateConsentCookie";
        case Kind::YouTubeRequestFailed:
            return "YouTubeRequestFailed";
        case Kind::YouTubeDataUnparsable:
            return "YouTubeDataUnparsable";
        default:
            return "Unknown";
        }
    }

private:
    static std::string buildMessage(const std::string &video_id, const std::string &cause)
    {
        return "Could not retrieve a transcript for the video " + video_id + "! " + cause;
    }

    Kind kind_;
    std::string video_id_;
};

/**
 * @brief The single client-facing failure of the fetch/list pipeline.
 * Always answered with HTTP 400 and what() as the detail.
 */
class TranscriptRequestError : public std::runtime_error
{
public:
    explicit TranscriptRequestError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Malformed request at the HTTP boundary (HTTP 422)
 */
class RequestValidationError : public std::runtime_error
{
public:
    explicit RequestValidationError(const std::string &message) : std::runtime_error(message) {}
};
