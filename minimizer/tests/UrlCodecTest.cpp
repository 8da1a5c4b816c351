#include "utils/UrlCodec.hpp"

#include <gtest/gtest.h>

TEST(UrlCodecTest, UnescapesPlusAndPercent) {
    EXPECT_EQ(formUnescape("a+b%20c%2Fd"), "a b c/d");
    EXPECT_EQ(formUnescape("100%"), "100%");
    EXPECT_EQ(formUnescape("%zz"), "%zz");
}

TEST(UrlCodecTest, EscapesLikeFormEncoding) {
    EXPECT_EQ(formEscape("a b&c=d~_.-"), "a+b%26c%3Dd~_.-");
    EXPECT_EQ(formEscape("\xC3\xA9"), "%C3%A9");
}

TEST(UrlCodecTest, ParseQueryDropsBlankValuesOnRequest) {
    auto pairs = parseQueryString("a=1&&b=&c=3", false);
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0], (std::pair<std::string, std::string>{"a", "1"}));
    EXPECT_EQ(pairs[1], (std::pair<std::string, std::string>{"c", "3"}));

    EXPECT_EQ(parseQueryString("a=1&&b=&c=3", true).size(), 3u);
}

TEST(UrlCodecTest, SplitsUrl) {
    UrlParts parts = splitUrl("HTTPS://api.example.com:8443/v1/items?id=7&q=x#frag");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "api.example.com:8443");
    EXPECT_EQ(parts.path, "/v1/items");
    EXPECT_EQ(parts.query, "id=7&q=x");

    UrlParts bare = splitUrl("http://example.com");
    EXPECT_EQ(bare.host, "example.com");
    EXPECT_EQ(bare.path, "");
    EXPECT_EQ(bare.query, "");
}
