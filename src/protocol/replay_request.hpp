#pragma once
#include <string>
#include <filesystem>
#include <cstdint>
#include <optional>

namespace streamcore::protocol {

    // Validated input for one `streamcore replay` invocation
    struct ReplayRequest {
        std::filesystem::path events_file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::string> model;
        std::optional<std::uint32_t> max_retries;
        std::optional<std::string> snapshot_id;
        bool verbose = false;
    };

} // namespace streamcore::protocol
