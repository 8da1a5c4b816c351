#include "core/BodyCodec.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

TEST(BodyCodecTest, AutoModeClassifiesByContentType) {
    EXPECT_EQ(resolveBodyKind(std::string("application/json; charset=utf-8"), BodyMode::Auto), BodyKind::Json);
    EXPECT_EQ(resolveBodyKind(std::string("application/vnd.api+JSON"), BodyMode::Auto), BodyKind::Json);
    EXPECT_EQ(resolveBodyKind(std::string("application/x-www-form-urlencoded"), BodyMode::Auto), BodyKind::Form);
    EXPECT_EQ(resolveBodyKind(std::string("text/plain"), BodyMode::Auto), BodyKind::Raw);
    EXPECT_EQ(resolveBodyKind(std::nullopt, BodyMode::Auto), BodyKind::Raw);
}

TEST(BodyCodecTest, ForcedModesIgnoreContentType) {
    EXPECT_EQ(resolveBodyKind(std::string("text/plain"), BodyMode::Json), BodyKind::Json);
    EXPECT_EQ(resolveBodyKind(std::string("application/json"), BodyMode::Form), BodyKind::Form);
}

TEST(BodyCodecTest, DecodesJsonObjectInOrder) {
    auto fields = decodeBody(BodyKind::Json, std::string(R"({"z":"1","a":2,"m":{"n":true}})"));
    ASSERT_TRUE(fields.has_value());
    ASSERT_EQ(fields->size(), 3u);
    EXPECT_EQ((*fields)[0].key, "z");
    EXPECT_EQ((*fields)[1].key, "a");
    EXPECT_EQ((*fields)[2].key, "m");
    EXPECT_EQ((*fields)[1].value, 2);
}

TEST(BodyCodecTest, JsonThatIsNotAnObjectIsNotReducible) {
    EXPECT_FALSE(decodeBody(BodyKind::Json, std::string("[1,2,3]")).has_value());
    EXPECT_FALSE(decodeBody(BodyKind::Json, std::string("{broken")).has_value());
    EXPECT_FALSE(decodeBody(BodyKind::Raw, std::string("a=1")).has_value());
}

TEST(BodyCodecTest, EmptyBodyDecodesToNoFields) {
    auto json = decodeBody(BodyKind::Json, std::string());
    ASSERT_TRUE(json.has_value());
    EXPECT_TRUE(json->empty());

    auto form = decodeBody(BodyKind::Form, std::nullopt);
    ASSERT_TRUE(form.has_value());
    EXPECT_TRUE(form->empty());
}

TEST(BodyCodecTest, EncodesCompactJson) {
    auto fields = decodeBody(BodyKind::Json, std::string("{ \"a\" : \"1\",\n \"b\" : [1, 2] }"));
    ASSERT_TRUE(fields.has_value());
    EXPECT_EQ(encodeBody(BodyKind::Json, *fields), R"({"a":"1","b":[1,2]})");
}

TEST(BodyCodecTest, FormKeepsBlankValuesAndDuplicates) {
    auto fields = decodeBody(BodyKind::Form, std::string("a=1&b=&c&a=2&name=John+Doe%21"));
    ASSERT_TRUE(fields.has_value());
    ASSERT_EQ(fields->size(), 5u);
    EXPECT_EQ((*fields)[1].key, "b");
    EXPECT_EQ((*fields)[1].value, "");
    EXPECT_EQ((*fields)[2].key, "c");
    EXPECT_EQ((*fields)[2].value, "");
    EXPECT_EQ((*fields)[3].value, "2");
    EXPECT_EQ((*fields)[4].value, "John Doe!");

    EXPECT_EQ(encodeBody(BodyKind::Form, *fields), "a=1&b=&c=&a=2&name=John+Doe%21");
}

TEST(BodyCodecTest, CountsFields) {
    EXPECT_EQ(countBodyFields(BodyKind::Json, std::string(R"({"a":1,"b":2})")), 2u);
    EXPECT_EQ(countBodyFields(BodyKind::Form, std::string("a=1&b=2&c=3")), 3u);
    EXPECT_EQ(countBodyFields(BodyKind::Json, std::string("not json")), 0u);
    EXPECT_EQ(countBodyFields(BodyKind::Raw, std::string("a=1")), 0u);
    EXPECT_EQ(countBodyFields(BodyKind::Json, std::nullopt), 0u);
}
