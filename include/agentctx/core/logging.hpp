#pragma once

#include "agentctx/core/config.hpp"

#include <spdlog/common.h>

#include <string_view>

namespace agentctx::core {

// Map a config level string to spdlog; unknown strings fall back to info
spdlog::level::level_enum parse_log_level(std::string_view level);

// Install the default logger: console sink, plus <log_path>/agentctx.log when set
Result<void, Error> init_logging(const ObservabilityConfig& config);

}  // namespace agentctx::core
