#include <gtest/gtest.h>
#include "youtube/html_text.hpp"

TEST(HtmlTextTest, UnescapesNamedReferences)
{
    EXPECT_EQ(HtmlText::unescape("Tom &amp; Jerry &lt;3 &quot;hi&quot;"), "Tom & Jerry <3 \"hi\"");
}

TEST(HtmlTextTest, UnescapesNumericReferences)
{
    EXPECT_EQ(HtmlText::unescape("it&#39;s"), "it's");
    EXPECT_EQ(HtmlText::unescape("it&#x27;s"), "it's");
    EXPECT_EQ(HtmlText::unescape("&#xAC00;"), "\xEA\xB0\x80"); // 가
}

TEST(HtmlTextTest, LeavesUnknownReferencesAlone)
{
    EXPECT_EQ(HtmlText::unescape("a & b"), "a & b");
    EXPECT_EQ(HtmlText::unescape("&bogus;"), "&bogus;");
    EXPECT_EQ(HtmlText::unescape("&#xZZ;"), "&#xZZ;");
}

TEST(HtmlTextTest, UnescapesEntitiesBeyondTheBasicSet)
{
    EXPECT_EQ(HtmlText::unescape("&euro;5"), "\xE2\x82\xAC" "5");
    EXPECT_EQ(HtmlText::unescape("&Eacute;cole"), "\xC3\x89" "cole");
    EXPECT_EQ(HtmlText::unescape("&hearts;"), "\xE2\x99\xA5");
    EXPECT_EQ(HtmlText::unescape("&notin;"), "\xE2\x88\x89");
    EXPECT_EQ(HtmlText::unescape("&AMP;"), "&");
}

TEST(HtmlTextTest, NumericReferencesInC1RangeUseWindows1252)
{
    EXPECT_EQ(HtmlText::unescape("&#128;"), "\xE2\x82\xAC");
    EXPECT_EQ(HtmlText::unescape("&#x80;"), "\xE2\x82\xAC");
    EXPECT_EQ(HtmlText::unescape("&#147;hi&#148;"), "\xE2\x80\x9C" "hi" "\xE2\x80\x9D");
}

TEST(HtmlTextTest, InvalidNumericReferences)
{
    EXPECT_EQ(HtmlText::unescape("&#0;"), "\xEF\xBF\xBD");
    EXPECT_EQ(HtmlText::unescape("&#x110000;"), "\xEF\xBF\xBD");
    EXPECT_EQ(HtmlText::unescape("&#xD800;"), "\xEF\xBF\xBD");
    EXPECT_EQ(HtmlText::unescape("&#1;x"), "x");
    EXPECT_EQ(HtmlText::unescape("&#xFFFF;"), "");
}

TEST(HtmlTextTest, ReferencesWithoutSemicolon)
{
    EXPECT_EQ(HtmlText::unescape("&#39"), "'");
    EXPECT_EQ(HtmlText::unescape("&amp"), "&");
    EXPECT_EQ(HtmlText::unescape("&ampfoo"), "&foo");
    EXPECT_EQ(HtmlText::unescape("&notit;"), "\xC2\xAC" "it;");
    EXPECT_EQ(HtmlText::unescape("&hearts"), "&hearts");
}

TEST(HtmlTextTest, DoubleEscapedTextUnescapesOneLevel)
{
    EXPECT_EQ(HtmlText::unescape("&amp;#39;"), "&#39;");
}

TEST(HtmlTextTest, StripsAllTagsByDefault)
{
    EXPECT_EQ(HtmlText::stripTags("<font color=\"#fff\">hello</font> <i>world</i>", false), "hello world");
}

TEST(HtmlTextTest, PreservesFormattingTags)
{
    EXPECT_EQ(HtmlText::stripTags("<font color=\"#fff\"><b>hello</b></font> <i>world</i>", true),
              "<b>hello</b> <i>world</i>");
    EXPECT_EQ(HtmlText::stripTags("<EM>x</EM><br>", true), "<EM>x</EM>");
}

TEST(HtmlTextTest, PreserveDoesNotKeepTagsThatOnlyShareAPrefix)
{
    EXPECT_EQ(HtmlText::stripTags("<br>a<bold>b</bold>", true), "ab");
}

TEST(HtmlTextTest, UrlEncode)
{
    EXPECT_EQ(HtmlText::urlEncode("abc-_.~123"), "abc-_.~123");
    EXPECT_EQ(HtmlText::urlEncode("ko,en"), "ko%2Cen");
    EXPECT_EQ(HtmlText::urlEncode("a b&c"), "a%20b%26c");
}
