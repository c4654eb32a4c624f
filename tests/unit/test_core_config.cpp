#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/core_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/core_errors.hpp"

namespace {

using nlohmann::json;
using streamcore::core::config::config_from_json;
using streamcore::core::config::CoreConfig;
using streamcore::core::config::load_core_config;
using streamcore::core::errors::get_error;
using streamcore::core::errors::get_value;
using streamcore::core::errors::is_error;
using streamcore::core::logging::LogLevel;

class TempFile {
public:
    explicit TempFile(const std::string& content) {
        path_ = std::filesystem::current_path() /
                (".tmp_config_" + streamcore::core::config::generate_session_id() + ".json");
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

TEST(CoreConfigTest, DefaultsMatchDocumentedValues) {
    CoreConfig config;
    EXPECT_EQ(config.model, "default");
    EXPECT_EQ(config.max_retries, 3u);
    EXPECT_EQ(config.context_limit, 0u);
    EXPECT_FALSE(config.model_output_limit.has_value());
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(CoreConfigTest, LoadsAllFields) {
    TempFile file(R"({
        "model": "claude-3-5-sonnet",
        "max_retries": 5,
        "context_limit": 150000,
        "model_output_limit": 8192,
        "log_level": "debug",
        "ignored": true
    })");

    auto result = load_core_config(file.path());
    ASSERT_FALSE(is_error(result));
    const auto& config = get_value(result);
    EXPECT_EQ(config.model, "claude-3-5-sonnet");
    EXPECT_EQ(config.max_retries, 5u);
    EXPECT_EQ(config.context_limit, 150000u);
    ASSERT_TRUE(config.model_output_limit.has_value());
    EXPECT_EQ(config.model_output_limit.value(), 8192u);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(CoreConfigTest, PartialConfigKeepsBase) {
    CoreConfig base;
    base.model = "gpt-4o";
    auto result = config_from_json(json{{"max_retries", 0}}, base);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).model, "gpt-4o");
    EXPECT_EQ(get_value(result).max_retries, 0u);
}

TEST(CoreConfigTest, RejectsOutOfRangeRetries) {
    auto result = config_from_json(json{{"max_retries", 101}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_config_value");

    auto negative = config_from_json(json{{"max_retries", -1}});
    ASSERT_TRUE(is_error(negative));
}

TEST(CoreConfigTest, RejectsBadLogLevelAndTypes) {
    EXPECT_EQ(get_error(config_from_json(json{{"log_level", "loud"}})).code,
              "invalid_log_level");
    EXPECT_EQ(get_error(config_from_json(json{{"model", 4}})).code, "invalid_config_value");
    EXPECT_EQ(get_error(config_from_json(json::array())).code, "invalid_config");
}

TEST(CoreConfigTest, ReportsMissingAndInvalidFiles) {
    auto missing = load_core_config(std::filesystem::current_path() / "no-such-config.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "config_not_found");

    TempFile broken("{ model: ");
    auto invalid = load_core_config(broken.path());
    ASSERT_TRUE(is_error(invalid));
    EXPECT_EQ(get_error(invalid).code, "invalid_config_json");
}

}  // namespace
