/**
 * @file test_schema_validate.cpp
 * @brief JSON Schema validation of configuration and crate documents
 */

#include "panicscan/schema_validate.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace panicscan::common::test {

namespace {

std::string schema_path(const std::string& name)
{
    return std::string(PANICSCAN_SCHEMA_DIR) + "/" + name;
}

nlohmann::json make_valid_config_json()
{
    return nlohmann::json{
        {     "schema_version",                                                      "config.v1"},
        {"function_whitelists",
         nlohmann::json::array({nlohmann::json{{"function_name", "alloc::raw_vec::capacity_overflow"},
                                               {"crate_name", "stdlib"},
                                               {"strict", false}}})                             }
    };
}

}  // namespace

TEST(SchemaValidate, ValidConfig)
{
    auto result = validate_json(make_valid_config_json(), schema_path("config.v1.schema.json"));
    EXPECT_TRUE(result) << result.error().message;
}

TEST(SchemaValidate, ConfigRejectsUnknownProperty)
{
    auto config = make_valid_config_json();
    config["extra"] = 1;
    auto result = validate_json(config, schema_path("config.v1.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, ConfigRejectsEmptyFunctionName)
{
    auto config = make_valid_config_json();
    config["function_whitelists"][0]["function_name"] = "";
    auto result = validate_json(config, schema_path("config.v1.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, CrateAllowsNullVersion)
{
    nlohmann::json crate = {
        {   "name", "stdlib"},
        {"version",  nullptr}
    };
    auto result = validate_json(crate, schema_path("crate.v1.schema.json"));
    EXPECT_TRUE(result) << result.error().message;
}

TEST(SchemaValidate, MissingSchemaFile)
{
    auto result = validate_json(nlohmann::json::object(), schema_path("missing.v1.schema.json"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

TEST(ReadJsonFile, MissingFile)
{
    auto result = read_json_file("/nonexistent/panicscan.json");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "ReadError");
}

TEST(ReadJsonFile, MalformedFile)
{
    const auto path = std::filesystem::temp_directory_path() / "panicscan_malformed.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto result = read_json_file(path.string());
    std::filesystem::remove(path);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "ParseError");
}

}  // namespace panicscan::common::test
