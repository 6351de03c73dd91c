#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>

#include "jdelta/diff_options.hpp"
#include "test_helpers.hpp"

using jdelta::DiffOptions;
using jdelta::ErrorCode;

namespace {

jdelta::DiffOptionsResult parse(const char* text) {
    return DiffOptions::fromJson(json(text).toObject());
}

}  // namespace

TEST(DiffOptionsTest, Defaults) {
    const DiffOptions options;
    EXPECT_EQ(options.maxDepth, 1000);
    EXPECT_EQ(options.format, "changes");
    EXPECT_FALSE(options.sortKeys);
    EXPECT_TRUE(options.ignorePatterns.isEmpty());
}

TEST(DiffOptionsTest, EmptyPayloadKeepsDefaults) {
    const auto result = parse("{}");
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.options.maxDepth, DiffOptions::kDefaultMaxDepth);
    EXPECT_EQ(result.options.format, "changes");
}

TEST(DiffOptionsTest, ReadsEveryKey) {
    const auto result = parse(R"({"max_depth":12,"format":" RFC6902 ","sort":true,"ignore":["/a","b.c"]})");
    ASSERT_TRUE(result.success()) << result.error.message.toStdString();
    EXPECT_EQ(result.options.maxDepth, 12);
    EXPECT_EQ(result.options.format, "rfc6902");
    EXPECT_TRUE(result.options.sortKeys);
    EXPECT_EQ(result.options.ignorePatterns, (QStringList{"/a", "b.c"}));
}

TEST(DiffOptionsTest, RejectsBadDepth) {
    const char* payloads[] = {
        R"({"max_depth":0})",
        R"({"max_depth":-3})",
        R"({"max_depth":2.5})",
        R"({"max_depth":"10"})",
        R"({"max_depth":1e20})",
    };
    for (const char* payload : payloads) {
        const auto result = parse(payload);
        ASSERT_FALSE(result.success()) << payload;
        EXPECT_EQ(result.error.code, ErrorCode::InvalidConfig) << payload;
        EXPECT_TRUE(result.error.message.contains("max_depth")) << payload;
    }
}

TEST(DiffOptionsTest, RejectsWrongTypes) {
    EXPECT_FALSE(parse(R"({"format":1})").success());
    EXPECT_FALSE(parse(R"({"sort":"yes"})").success());
    EXPECT_FALSE(parse(R"({"ignore":"/a"})").success());
    EXPECT_FALSE(parse(R"({"ignore":["/a",2]})").success());
}

TEST(DiffOptionsTest, UnknownFormatNameIsLeftForTheFormatter) {
    const auto result = parse(R"({"format":"xml"})");
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.options.format, "xml");
}

TEST(DiffOptionsTest, ToJsonRoundTrips) {
    DiffOptions options;
    options.maxDepth = 7;
    options.format = "after";
    options.sortKeys = true;
    options.ignorePatterns = {"x", "/y"};

    const auto result = DiffOptions::fromJson(options.toJson());
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.options.maxDepth, 7);
    EXPECT_EQ(result.options.format, "after");
    EXPECT_TRUE(result.options.sortKeys);
    EXPECT_EQ(result.options.ignorePatterns, options.ignorePatterns);
}
