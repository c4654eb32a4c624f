#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/core_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/core_errors.hpp"
#include "core/logging/logger.hpp"
#include "ledger/tokenizer.hpp"
#include "session/replay_session.hpp"

namespace {

// Set by the SIGINT handler; polled by the processor before each event.
std::atomic_bool* g_cancel_flag = nullptr;

void handle_sigint(int) {
    if (g_cancel_flag != nullptr) {
        g_cancel_flag->store(true);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line with this session's id
    const std::string session_id = streamcore::core::config::generate_session_id();
    streamcore::core::logging::Logger::get().set_session_id(session_id);

    // 2. Parse CLI input and return normalized input errors
    auto parsed = streamcore::app::cli::parse_and_validate(argc, argv);
    if (streamcore::core::errors::is_error(parsed)) {
        const auto& err = streamcore::core::errors::get_error(parsed);
        STREAMCORE_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            STREAMCORE_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = streamcore::core::errors::get_value(parsed);

    // 3. Config file first, then flag overrides
    streamcore::core::config::CoreConfig config;
    if (req.config_file.has_value()) {
        auto loaded = streamcore::core::config::load_core_config(req.config_file.value());
        if (streamcore::core::errors::is_error(loaded)) {
            const auto& err = streamcore::core::errors::get_error(loaded);
            STREAMCORE_LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            if (!err.hint.empty()) {
                STREAMCORE_LOG_INFO("Hint: " + err.hint);
            }
            return 2;
        }
        config = streamcore::core::errors::get_value(loaded);
    }
    if (req.model.has_value()) {
        config.model = req.model.value();
    }
    if (req.max_retries.has_value()) {
        config.max_retries = req.max_retries.value();
    }
    if (req.verbose) {
        config.log_level = streamcore::core::logging::LogLevel::DEBUG;
    }
    streamcore::core::logging::Logger::get().set_min_level(config.log_level);

    std::ifstream events(req.events_file);
    if (!events.is_open()) {
        STREAMCORE_LOG_ERROR("Unable to open events file: " + req.events_file.string());
        return 2;
    }

    auto cancel_token = std::make_shared<std::atomic_bool>(false);
    g_cancel_flag = cancel_token.get();
    std::signal(SIGINT, handle_sigint);

    STREAMCORE_LOG_INFO("Replaying " + req.events_file.string() + " with model " + config.model);
    streamcore::session::ReplaySession replay(
        session_id, config, std::make_shared<streamcore::ledger::TokenizerCache>(),
        cancel_token, req.snapshot_id);
    auto outcome = replay.run(events, std::cout);

    std::signal(SIGINT, SIG_DFL);
    g_cancel_flag = nullptr;

    if (streamcore::core::errors::is_error(outcome)) {
        const auto& err = streamcore::core::errors::get_error(outcome);
        STREAMCORE_LOG_ERROR("Replay error [" + err.code + "]: " + err.message);
        return 2;
    }

    const auto& summary = streamcore::core::errors::get_value(outcome);
    std::cout << streamcore::session::encode_summary(session_id, summary).dump() << std::endl;
    STREAMCORE_LOG_INFO("Session " + streamcore::session::to_string(summary.status) + ", " +
                        std::to_string(summary.total_tokens) + " tokens, limit status " +
                        streamcore::ledger::to_string(summary.limit_status));

    switch (summary.status) {
        case streamcore::session::SessionStatus::Finished:
            return 0;
        case streamcore::session::SessionStatus::Cancelled:
            return 130;
        case streamcore::session::SessionStatus::Running:
        case streamcore::session::SessionStatus::Failed:
        case streamcore::session::SessionStatus::Incomplete:
            return 1;
    }
    return 1;
}
