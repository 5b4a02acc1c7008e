#include <gtest/gtest.h>
#include "core/video_id_extractor.hpp"

TEST(VideoIdExtractorTest, BareIdIsReturnedUnchanged)
{
    EXPECT_EQ(VideoIdExtractor::extract("dQw4w9WgXcQ"), "dQw4w9WgXcQ");
}

TEST(VideoIdExtractorTest, WatchUrl)
{
    EXPECT_EQ(VideoIdExtractor::extract("https://www.youtube.com/watch?v=dQw4w9WgXcQ"), "dQw4w9WgXcQ");
}

TEST(VideoIdExtractorTest, WatchUrlStopsAtNextParameter)
{
    EXPECT_EQ(VideoIdExtractor::extract("https://www.youtube.com/watch?v=abc123&t=42s"), "abc123");
}

TEST(VideoIdExtractorTest, ShortUrl)
{
    EXPECT_EQ(VideoIdExtractor::extract("https://youtu.be/abc123?t=10"), "abc123");
}

TEST(VideoIdExtractorTest, EmbedUrl)
{
    EXPECT_EQ(VideoIdExtractor::extract("https://www.youtube.com/embed/abc123#player"), "abc123");
}

TEST(VideoIdExtractorTest, WatchUrlWithVNotFirst)
{
    EXPECT_EQ(VideoIdExtractor::extract("https://www.youtube.com/watch?feature=share&v=xyz789"), "xyz789");
}

TEST(VideoIdExtractorTest, SchemeIsOptional)
{
    EXPECT_EQ(VideoIdExtractor::extract("youtube.com/watch?v=abc123"), "abc123");
}

TEST(VideoIdExtractorTest, UnrecognizedUrlPassesThrough)
{
    EXPECT_EQ(VideoIdExtractor::extract("https://vimeo.com/12345"), "https://vimeo.com/12345");
    EXPECT_EQ(VideoIdExtractor::extract(""), "");
}

TEST(VideoIdExtractorTest, IsIdempotent)
{
    for (const std::string input : {"https://youtu.be/abc123", "https://www.youtube.com/watch?v=abc123&t=1", "abc123"})
    {
        std::string once = VideoIdExtractor::extract(input);
        EXPECT_EQ(VideoIdExtractor::extract(once), once) << input;
    }
}
