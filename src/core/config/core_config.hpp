#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/core_errors.hpp"
#include "core/logging/logger.hpp"

namespace streamcore::core::config {

    struct CoreConfig {
        std::string model = "default";
        std::uint32_t max_retries = 3;
        std::uint64_t context_limit = 0;                  // 0 = take from model pricing
        std::optional<std::uint64_t> model_output_limit;  // unset = take from model pricing
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    inline constexpr std::uint32_t kMaxConfigRetries = 100;

    errors::Result<logging::LogLevel> parse_log_level(const std::string& text);

    // Unknown keys are ignored; present keys must be well-typed and in range.
    errors::Result<CoreConfig> config_from_json(const nlohmann::json& payload,
                                                CoreConfig base = {});

    errors::Result<CoreConfig> load_core_config(const std::filesystem::path& path);

} // namespace streamcore::core::config
