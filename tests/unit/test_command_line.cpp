#include <gtest/gtest.h>
#include "utils/command_line.hpp"

using namespace loadpulse::utils;

class CommandLineTest : public ::testing::Test {
protected:
    CommandLineResult parse(const std::vector<std::string>& args) {
        return parseCommandLine(args, config);
    }

    LoadTestConfig config;
};

TEST_F(CommandLineTest, MinimalInvocation) {
    auto result = parse({"http://localhost:8080/", "--qps", "20"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_FALSE(result.showHelp);
    EXPECT_TRUE(result.configPath.empty());
    EXPECT_EQ(config.url, "http://localhost:8080/");
    EXPECT_DOUBLE_EQ(config.qps, 20.0);
    EXPECT_DOUBLE_EQ(config.durationSeconds, 60.0);
    EXPECT_EQ(config.concurrency, 1);
}

TEST_F(CommandLineTest, AllLoadOptions) {
    auto result = parse({"--qps", "12.5", "--duration", "30", "--concurrency", "8",
                         "--timeout", "1.5", "--expected_status", "204",
                         "https://example.com/ping"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.url, "https://example.com/ping");
    EXPECT_DOUBLE_EQ(config.qps, 12.5);
    EXPECT_DOUBLE_EQ(config.durationSeconds, 30.0);
    EXPECT_EQ(config.concurrency, 8);
    EXPECT_DOUBLE_EQ(config.timeoutSeconds, 1.5);
    EXPECT_EQ(config.expectedStatusCode, 204);
}

TEST_F(CommandLineTest, RequestOptions) {
    auto result = parse({"http://localhost/", "--qps", "1", "--method", "POST",
                         "--payload", "{\"id\": 7}", "--auth", "s3cret"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.method, "POST");
    ASSERT_TRUE(config.body.has_value());
    EXPECT_EQ(*config.body, "{\"id\": 7}");
    EXPECT_EQ(config.headers.at("Authorization"), "Bearer s3cret");
}

TEST_F(CommandLineTest, HeadersConsumeValuesUntilNextFlag) {
    auto result = parse({"http://localhost/", "--headers", "X-One: 1", "Accept:text/html",
                         "--qps", "5"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.headers.size(), 2u);
    EXPECT_EQ(config.headers.at("X-One"), "1");
    EXPECT_EQ(config.headers.at("Accept"), "text/html");
    EXPECT_DOUBLE_EQ(config.qps, 5.0);
}

TEST_F(CommandLineTest, HeaderValueMayContainColons) {
    auto result = parse({"http://localhost/", "--headers", "Referer: http://a.example:81/x"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.headers.at("Referer"), "http://a.example:81/x");
}

TEST_F(CommandLineTest, HeadersReplaceConfiguredHeaders) {
    config.headers["X-From-File"] = "yes";

    auto result = parse({"--headers", "X-From-Flag: yes", "--auth", "t"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.headers.count("X-From-File"), 0u);
    EXPECT_EQ(config.headers.at("X-From-Flag"), "yes");
    EXPECT_EQ(config.headers.at("Authorization"), "Bearer t");
}

TEST_F(CommandLineTest, AuthSurvivesLaterHeaders) {
    auto result = parse({"http://x/", "--qps", "5", "--auth", "tok", "--headers", "X-A:1"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.headers.size(), 2u);
    EXPECT_EQ(config.headers.at("X-A"), "1");
    EXPECT_EQ(config.headers.at("Authorization"), "Bearer tok");
}

TEST_F(CommandLineTest, AuthOverridesAuthorizationHeader) {
    auto result = parse({"--auth", "tok", "--headers", "Authorization: Basic abc"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.headers.at("Authorization"), "Bearer tok");
}

TEST_F(CommandLineTest, MalformedHeaderIsAnError) {
    auto result = parse({"http://localhost/", "--headers", "no-colon-here"});

    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.error.find("key:value"), std::string::npos);
}

TEST_F(CommandLineTest, OutputOptions) {
    auto result = parse({"http://localhost/", "--output", "out/report.json", "--quiet",
                         "--latency-csv", "--no-progress", "--log-level", "debug"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(config.outputPath, "out/report.json");
    EXPECT_FALSE(config.verbose);
    EXPECT_TRUE(config.latencyCsvEnabled);
    EXPECT_FALSE(config.progressEnabled);
    EXPECT_EQ(config.logLevel, "debug");
}

TEST_F(CommandLineTest, VerboseOverridesEarlierQuiet) {
    config.verbose = false;

    auto result = parse({"--verbose"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_TRUE(config.verbose);
}

TEST_F(CommandLineTest, ConfigPathIsOnlyRecorded) {
    auto result = parse({"--config", "load.json", "--qps", "3"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(result.configPath, "load.json");
    EXPECT_TRUE(config.url.empty());
    EXPECT_DOUBLE_EQ(config.qps, 3.0);
}

TEST_F(CommandLineTest, HelpFlag) {
    EXPECT_TRUE(parse({"--help"}).showHelp);

    LoadTestConfig other;
    EXPECT_TRUE(parseCommandLine({"-h"}, other).showHelp);
}

TEST_F(CommandLineTest, InvalidNumbersAreErrors) {
    EXPECT_FALSE(parse({"--qps", "fast"}).ok());
    EXPECT_FALSE(parse({"--qps", "10x"}).ok());
    EXPECT_FALSE(parse({"--concurrency", "2.5"}).ok());
    EXPECT_FALSE(parse({"--expected_status", ""}).ok());
    EXPECT_FALSE(parse({"--duration", "99999999999999999999e999999"}).ok());
}

TEST_F(CommandLineTest, MissingValueIsAnError) {
    auto result = parse({"http://localhost/", "--qps"});

    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.error.find("--qps"), std::string::npos);
}

TEST_F(CommandLineTest, UnknownOptionIsAnError) {
    auto result = parse({"http://localhost/", "--rate", "5"});

    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.error.find("--rate"), std::string::npos);

    EXPECT_FALSE(parse({"-x"}).ok());
}

TEST_F(CommandLineTest, SecondPositionalIsAnError) {
    auto result = parse({"http://a.example/", "http://b.example/"});

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(config.url, "http://a.example/");
}

TEST_F(CommandLineTest, ParsingDoesNotValidateValues) {
    auto result = parse({"http://localhost/", "--qps", "-4", "--method", "PATCH"});

    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_DOUBLE_EQ(config.qps, -4.0);
    EXPECT_EQ(config.method, "PATCH");
}

TEST(CommandLineUsageTest, UsageListsOptions) {
    std::string text = usage("loadpulse");

    EXPECT_NE(text.find("Usage: loadpulse <url> --qps"), std::string::npos);
    for (const char* option : {"--duration", "--concurrency", "--timeout", "--method", "--headers",
                               "--payload", "--expected_status", "--auth", "--output", "--config"}) {
        EXPECT_NE(text.find(option), std::string::npos) << option;
    }
}
