// tests/json_test.cpp
// Unit tests for the JSON writers.

#include <gtest/gtest.h>
#include "beacon/json.hpp"
#include <string>

using namespace beacon;

TEST(JsonTest, EmptyObject) {
    JsonObject o;
    EXPECT_EQ(o.str(), "{}");
    EXPECT_TRUE(o.empty());
}

TEST(JsonTest, SingleString) {
    JsonObject o;
    o.add("os", "Linux");
    EXPECT_EQ(o.str(), R"({"os":"Linux"})");
    EXPECT_EQ(o.size(), 1u);
}

TEST(JsonTest, MultipleTypes) {
    auto json = JsonObject()
        .add("locale", std::string("en-US"))
        .add("seq", int64_t(42))
        .add("v", 7)
        .add("enabled", true)
        .add("ratio", 0.5)
        .str();

    EXPECT_EQ(json, R"({"locale":"en-US","seq":42,"v":7,"enabled":true,"ratio":0.5})");
}

TEST(JsonTest, NullAndRaw) {
    auto json = JsonObject()
        .add_null("defaultSearch")
        .add_raw("events", "[[1,\"a\"]]")
        .str();
    EXPECT_EQ(json, R"({"defaultSearch":null,"events":[[1,"a"]]})");
}

TEST(JsonTest, EscapesQuotesAndBackslash) {
    auto json = JsonObject().add("path", "C:\\Users\\\"me\"").str();
    EXPECT_EQ(json, R"({"path":"C:\\Users\\\"me\""})");
}

TEST(JsonTest, EscapesControlCharacters) {
    auto json = JsonObject().add("text", std::string("a\nb\t\x01")).str();
    EXPECT_EQ(json, R"({"text":"a\nb\t\u0001"})");
}

TEST(JsonTest, EscapesKeys) {
    auto json = JsonObject().add("we\"ird", 1).str();
    EXPECT_EQ(json, R"({"we\"ird":1})");
}

TEST(JsonTest, NegativeInteger) {
    auto json = JsonObject().add("tz", int64_t(-300)).str();
    EXPECT_EQ(json, R"({"tz":-300})");
}

TEST(JsonTest, Array) {
    JsonArray a;
    EXPECT_EQ(a.str(), "[]");
    a.push(int64_t(12)).push("click").push_null().push_raw("{}");
    EXPECT_EQ(a.str(), R"([12,"click",null,{}])");
    EXPECT_EQ(a.size(), 4u);
}

TEST(JsonTest, Quote) {
    EXPECT_EQ(json::quote("a\"b"), R"("a\"b")");
}
