#include <gtest/gtest.h>
#include "core/transcript_errors.hpp"
#include "youtube/httplib_transport.hpp"

TEST(HttplibTransportTest, SplitUrlSeparatesOriginFromPath)
{
    auto parts = HttplibTransport::splitUrl("https://www.youtube.com/watch?v=abc123");
    EXPECT_EQ(parts.first, "https://www.youtube.com");
    EXPECT_EQ(parts.second, "/watch?v=abc123");
}

TEST(HttplibTransportTest, SplitUrlKeepsPort)
{
    auto parts = HttplibTransport::splitUrl("http://localhost:8000/transcript/abc123?format=json");
    EXPECT_EQ(parts.first, "http://localhost:8000");
    EXPECT_EQ(parts.second, "/transcript/abc123?format=json");
}

TEST(HttplibTransportTest, SplitUrlWithoutPathUsesRoot)
{
    auto parts = HttplibTransport::splitUrl("https://www.youtube.com");
    EXPECT_EQ(parts.first, "https://www.youtube.com");
    EXPECT_EQ(parts.second, "/");
}

TEST(HttplibTransportTest, SplitUrlRequiresScheme)
{
    EXPECT_THROW(HttplibTransport::splitUrl("www.youtube.com/watch"), HttpTransportError);
}

TEST(HttplibTransportTest, UnreachableHostThrows)
{
    TransportSettings settings;
    settings.connect_timeout_seconds = 1;
    settings.read_timeout_seconds = 1;
    HttplibTransport transport(settings);

    // Port 1 on loopback is closed
    EXPECT_THROW(transport.get("http://127.0.0.1:1/", {}), HttpTransportError);
}

TEST(TranscriptFetchErrorTest, MessageNamesTheVideo)
{
    TranscriptFetchError error(TranscriptFetchError::Kind::TranscriptsDisabled, "abc123", "Subtitles are disabled for this video");
    EXPECT_EQ(std::string(error.what()),
              "Could not retrieve a transcript for the video abc123! Subtitles are disabled for this video");
    EXPECT_EQ(error.videoId(), "abc123");
    EXPECT_EQ(TranscriptFetchError::kindName(error.kind()), "TranscriptsDisabled");
}
