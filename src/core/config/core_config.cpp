#include "core/config/core_config.hpp"

#include <fstream>
#include <utility>
#include <system_error>

namespace streamcore::core::config {

    using errors::CoreError;
    using errors::ErrorCategory;
    using logging::LogLevel;
    using nlohmann::json;

    namespace {

        CoreError invalid_value(const std::string& key, const std::string& expected) {
            return CoreError{ErrorCategory::Input, "Invalid config value for '" + key + "'",
                             "invalid_config_value", "Expected " + expected + "."};
        }

        std::optional<std::uint64_t> non_negative_integer(const json& value) {
            if (value.is_number_unsigned()) {
                return value.get<std::uint64_t>();
            }
            if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
                return static_cast<std::uint64_t>(value.get<std::int64_t>());
            }
            return std::nullopt;
        }

    } // namespace

    errors::Result<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return CoreError{ErrorCategory::Input, "Unknown log level: " + text, "invalid_log_level",
                         "Use one of debug, info, warn, error."};
    }

    errors::Result<CoreConfig> config_from_json(const json& payload, CoreConfig base) {
        if (!payload.is_object()) {
            return CoreError{ErrorCategory::Input, "Config root must be a JSON object.",
                             "invalid_config"};
        }

        CoreConfig config = std::move(base);

        if (auto it = payload.find("model"); it != payload.end()) {
            if (!it->is_string() || it->get<std::string>().empty()) {
                return invalid_value("model", "a non-empty string");
            }
            config.model = it->get<std::string>();
        }

        if (auto it = payload.find("max_retries"); it != payload.end()) {
            const auto retries = non_negative_integer(*it);
            if (!retries.has_value() || retries.value() > kMaxConfigRetries) {
                return invalid_value("max_retries", "an integer between 0 and 100");
            }
            config.max_retries = static_cast<std::uint32_t>(retries.value());
        }

        if (auto it = payload.find("context_limit"); it != payload.end()) {
            const auto limit = non_negative_integer(*it);
            if (!limit.has_value()) {
                return invalid_value("context_limit", "a non-negative integer");
            }
            config.context_limit = limit.value();
        }

        if (auto it = payload.find("model_output_limit"); it != payload.end()) {
            if (it->is_null()) {
                config.model_output_limit.reset();
            } else {
                const auto limit = non_negative_integer(*it);
                if (!limit.has_value()) {
                    return invalid_value("model_output_limit", "a non-negative integer or null");
                }
                config.model_output_limit = limit;
            }
        }

        if (auto it = payload.find("log_level"); it != payload.end()) {
            if (!it->is_string()) {
                return invalid_value("log_level", "a string");
            }
            auto level = parse_log_level(it->get<std::string>());
            if (errors::is_error(level)) {
                return errors::get_error(level);
            }
            config.log_level = errors::get_value(level);
        }

        return config;
    }

    errors::Result<CoreConfig> load_core_config(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) {
            return CoreError{ErrorCategory::Input, "Config file not found: " + path.string(),
                             "config_not_found"};
        }

        std::ifstream in(path);
        if (!in.is_open()) {
            return CoreError{ErrorCategory::Input, "Unable to open config file: " + path.string(),
                             "config_open_failed"};
        }

        const json payload = json::parse(in, nullptr, false);
        if (payload.is_discarded()) {
            return CoreError{ErrorCategory::Input, "Config file is not valid JSON: " + path.string(),
                             "invalid_config_json"};
        }
        return config_from_json(payload);
    }

} // namespace streamcore::core::config
