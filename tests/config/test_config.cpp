/**
 * @file test_config.cpp
 * @brief Configuration file loading and whitelist conversion
 */

#include "panicscan/config.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace panicscan::config::test {

namespace {

class TempConfig
{
public:
    explicit TempConfig(const std::string& content)
        : m_path(std::filesystem::temp_directory_path()
                 / ("panicscan_config_" + std::to_string(++s_counter) + ".json"))
    {
        std::ofstream out(m_path);
        out << content;
    }
    ~TempConfig() { std::filesystem::remove(m_path); }

    TempConfig(const TempConfig&) = delete;
    TempConfig& operator=(const TempConfig&) = delete;

    [[nodiscard]] std::string path() const { return m_path.string(); }

private:
    static inline int s_counter = 0;
    std::filesystem::path m_path;
};

const std::string kSchemaDir = PANICSCAN_SCHEMA_DIR;

}  // namespace

TEST(Config, ParseWhitelistEntries)
{
    const auto document = nlohmann::json::parse(R"({
        "schema_version": "config.v1",
        "function_whitelists": [
            {"function_name": "capacity_overflow"},
            {"function_name": "serde::de::Error::custom", "crate_name": "serde",
             "crate_version": "1.0.80", "strict": true}
        ]
    })");
    auto options = parse_config(document);
    ASSERT_TRUE(options) << options.error().message;
    ASSERT_EQ(options->function_whitelists.size(), 2U);

    const auto& loose = options->function_whitelists[0];
    EXPECT_EQ(loose.function_name, "capacity_overflow");
    EXPECT_FALSE(loose.crate_name);
    EXPECT_FALSE(loose.strict);

    const auto& strict = options->function_whitelists[1];
    EXPECT_EQ(strict.crate_name, "serde");
    EXPECT_EQ(strict.crate_version, "1.0.80");
    EXPECT_TRUE(strict.strict);
}

TEST(Config, BlankFunctionNameRejected)
{
    const auto document = nlohmann::json::parse(
        R"({"schema_version": "config.v1", "function_whitelists": [{"function_name": "   "}]})");
    auto options = parse_config(document);
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code, "InvalidConfig");
}

TEST(Config, MissingOptionalFileGivesDefaults)
{
    auto options = load_config("/nonexistent/panicscan.json", false, kSchemaDir);
    ASSERT_TRUE(options);
    EXPECT_TRUE(options->function_whitelists.empty());
}

TEST(Config, MissingRequiredFileFails)
{
    auto options = load_config("/nonexistent/panicscan.json", true, kSchemaDir);
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code, "ReadError");
}

TEST(Config, LoadValidFile)
{
    TempConfig file(
        R"({"schema_version": "config.v1", "function_whitelists": [{"function_name": "fmt::write"}]})");
    auto options = load_config(file.path(), true, kSchemaDir);
    ASSERT_TRUE(options) << options.error().message;
    ASSERT_EQ(options->function_whitelists.size(), 1U);
    EXPECT_EQ(options->function_whitelists.front().function_name, "fmt::write");
}

TEST(Config, SchemaViolationReported)
{
    TempConfig file(R"({"schema_version": "config.v1", "whitelist": []})");
    auto options = load_config(file.path(), false, kSchemaDir);
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code, "SchemaValidationFailed");
}

TEST(Config, MalformedFileReported)
{
    TempConfig file("{\"schema_version\": ");
    auto options = load_config(file.path(), false, kSchemaDir);
    ASSERT_FALSE(options);
    EXPECT_EQ(options.error().code, "ParseError");
}

}  // namespace panicscan::config::test
