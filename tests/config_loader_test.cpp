#include <gtest/gtest.h>

#include "config/config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

using namespace S3Fs;

class ConfigLoaderTest : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        std::random_device rd;
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("s3fs_config_test_" + std::to_string(rd()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::filesystem::path WriteConfig(const std::string& contents)
    {
        auto path = test_dir_ / "config.json";
        std::ofstream out(path, std::ios::trunc);
        out << contents;
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigLoaderTest, MinimalStoreUsesDefaults)
{
    auto result = Config::loadConfigFromFile(
        WriteConfig(R"({"store": {"type": "s3", "bucket": "public-sample-data"}})")
    );
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->store_definition.type, Config::StoreType::S3);
    EXPECT_EQ(result->store_definition.bucket, "public-sample-data");
    EXPECT_EQ(result->store_definition.region, "us-east-1");
    EXPECT_FALSE(result->store_definition.endpoint.has_value());
    EXPECT_FALSE(result->store_definition.path_style);
    EXPECT_FALSE(result->range.has_value());
    EXPECT_EQ(result->global_settings.log_level, Constants::DEFAULT_LOG_LEVEL);
}

TEST_F(ConfigLoaderTest, FullConfiguration)
{
    auto result = Config::loadConfigFromFile(WriteConfig(R"({
        "store": {
            "type": "s3",
            "bucket": "media",
            "region": "eu-west-1",
            "endpoint": "http://localhost:9000",
            "path_style": true
        },
        "range": {"start": 100, "end": 199},
        "global_settings": {"log_level": "debug"}
    })"));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->store_definition.region, "eu-west-1");
    ASSERT_TRUE(result->store_definition.endpoint.has_value());
    EXPECT_EQ(*result->store_definition.endpoint, "http://localhost:9000");
    EXPECT_TRUE(result->store_definition.path_style);
    ASSERT_TRUE(result->range.has_value());
    EXPECT_EQ(result->range->start, 100);
    EXPECT_EQ(result->range->end, 199);
    EXPECT_EQ(result->global_settings.log_level, spdlog::level::debug);
}

TEST_F(ConfigLoaderTest, MissingFile)
{
    auto result = Config::loadConfigFromFile(test_dir_ / "absent.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Config::LoadError::FileNotFound);
}

TEST_F(ConfigLoaderTest, MalformedJson)
{
    auto result = Config::loadConfigFromFile(WriteConfig(R"({"store": )"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Config::LoadError::JsonParseError);
}

TEST_F(ConfigLoaderTest, WrongValueTypeIsParseError)
{
    auto result =
        Config::loadConfigFromFile(WriteConfig(R"({"store": {"type": "s3", "bucket": 42}})"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Config::LoadError::JsonParseError);
}

TEST_F(ConfigLoaderTest, ValidationFailures)
{
    const char* invalid_configs[] = {
        R"({})",
        R"({"store": "s3"})",
        R"({"store": {"bucket": "b"}})",
        R"({"store": {"type": "gcs", "bucket": "b"}})",
        R"({"store": {"type": "s3"}})",
        R"({"store": {"type": "s3", "bucket": ""}})",
        R"({"store": {"type": "s3", "bucket": "b", "endpoint": ""}})",
        R"({"store": {"type": "s3", "bucket": "b"}, "range": {"start": 10, "end": 9}})",
        R"({"store": {"type": "s3", "bucket": "b"}, "range": {"start": -1, "end": 9}})",
        R"({"store": {"type": "s3", "bucket": "b"}, "range": {"start": 0}})",
        R"({"store": {"type": "s3", "bucket": "b"}, "range": [0, 9]})",
        R"({"store": {"type": "s3", "bucket": "b"}, "global_settings": "info"})",
    };

    for (const char* contents : invalid_configs) {
        auto result = Config::loadConfigFromFile(WriteConfig(contents));
        ASSERT_FALSE(result.has_value()) << contents;
        EXPECT_EQ(result.error(), Config::LoadError::ValidationError) << contents;
    }
}

TEST_F(ConfigLoaderTest, InvalidLogLevelFallsBackToDefault)
{
    auto result = Config::loadConfigFromFile(WriteConfig(
        R"({"store": {"type": "s3", "bucket": "b"}, "global_settings": {"log_level": "loud"}})"
    ));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->global_settings.log_level, Constants::DEFAULT_LOG_LEVEL);
}

TEST_F(ConfigLoaderTest, VerboseVariantDescribesFailure)
{
    auto result = Config::loadConfigFromFileVerbose(test_dir_ / "absent.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("File not found."), std::string::npos);
}

TEST(ParseRangeStringTest, AcceptsInclusiveRanges)
{
    auto range = Config::ParseRangeString("0-1023");
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start, 0);
    EXPECT_EQ(range->end, 1023);

    auto single = Config::ParseRangeString("7-7");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->start, 7);
    EXPECT_EQ(single->end, 7);
}

TEST(ParseRangeStringTest, RejectsMalformedRanges)
{
    for (const char* text : {"", "-", "10", "10-", "-10", "a-b", "5-4", "1-2-3", " 1-2"}) {
        EXPECT_FALSE(Config::ParseRangeString(text).has_value()) << text;
    }
}
