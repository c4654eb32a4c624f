#pragma once
#include "protocol/replay_request.hpp"
#include "core/errors/core_errors.hpp"

namespace streamcore::app::cli {
    streamcore::core::errors::Result<streamcore::protocol::ReplayRequest> parse_and_validate(int argc, char* argv[]);
}
