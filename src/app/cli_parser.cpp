#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>
#include "core/config/core_config.hpp"

namespace streamcore::app::cli {

    using namespace streamcore::core::errors;
    using streamcore::protocol::ReplayRequest;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> events;
        std::optional<std::string> config;
        std::optional<std::string> model;
        std::optional<std::string> max_retries;
        std::optional<std::string> snapshot;
        bool verbose = false;
    };

    Result<ReplayRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return CoreError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: streamcore replay --events <file.jsonl>"};
        }

        std::string command = argv[1];
        if (command != "replay") {
            return CoreError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'replay' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--events") {
                if (i + 1 < args.size()) raw.events = args[++i];
                else return CoreError{ErrorCategory::Input, "Missing value for --events", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return CoreError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--model") {
                if (i + 1 < args.size()) raw.model = args[++i];
                else return CoreError{ErrorCategory::Input, "Missing value for --model", "missing_value"};
            } else if (args[i] == "--max-retries") {
                if (i + 1 < args.size()) raw.max_retries = args[++i];
                else return CoreError{ErrorCategory::Input, "Missing value for --max-retries", "missing_value"};
            } else if (args[i] == "--snapshot") {
                if (i + 1 < args.size()) raw.snapshot = args[++i];
                else return CoreError{ErrorCategory::Input, "Missing value for --snapshot", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return CoreError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ReplayRequest req;
        req.verbose = raw.verbose;

        if (!raw.events.has_value()) {
            return CoreError{ErrorCategory::Input, "Must provide --events", "missing_required_flag", "Pass a JSONL file of stream events."};
        }

        std::error_code path_ec;
        std::filesystem::path events_path(raw.events.value());
        if (!std::filesystem::is_regular_file(events_path, path_ec) || path_ec) {
            return CoreError{ErrorCategory::Input, "Events file does not exist or is not a regular file", "invalid_path"};
        }
        req.events_file = std::move(events_path);

        if (raw.config) {
            std::filesystem::path config_path(raw.config.value());
            if (!std::filesystem::is_regular_file(config_path, path_ec) || path_ec) {
                return CoreError{ErrorCategory::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }
            req.config_file = std::move(config_path);
        }

        if (raw.model) {
            if (raw.model->empty()) {
                return CoreError{ErrorCategory::Input, "--model cannot be empty", "invalid_model"};
            }
            req.model = raw.model.value();
        }

        // Exception-free integer parsing
        if (raw.max_retries) {
            uint32_t retries = 0;
            const char* begin = raw.max_retries->data();
            const char* end = raw.max_retries->data() + raw.max_retries->size();
            auto [ptr, ec] = std::from_chars(begin, end, retries);
            if (ec != std::errc() || ptr != end) {
                return CoreError{ErrorCategory::Input, "Invalid number for --max-retries", "invalid_integer", "Provide a non-negative integer."};
            }
            if (retries > core::config::kMaxConfigRetries) {
                return CoreError{ErrorCategory::Input, "--max-retries out of bounds", "bounds_error", "Must be between 0 and 100."};
            }
            req.max_retries = retries;
        }

        if (raw.snapshot) {
            if (raw.snapshot->empty()) {
                return CoreError{ErrorCategory::Input, "--snapshot cannot be empty", "invalid_snapshot"};
            }
            req.snapshot_id = raw.snapshot.value();
        }

        return req;
    }

} // namespace streamcore::app::cli
