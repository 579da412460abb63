#include "agentctx/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace agentctx::core {

spdlog::level::level_enum parse_log_level(std::string_view level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

Result<void, Error> init_logging(const ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_path.empty()) {
        try {
            fs::create_directories(config.log_path);
            auto file = config.log_path / "agentctx.log";
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string()));
        } catch (const std::exception& e) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                std::string("Failed to open log file: ") + e.what(),
                config.log_path.string()
            );
        }
    }

    auto logger = std::make_shared<spdlog::logger>("agentctx", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(config.log_level));
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging initialized at level {}", config.log_level);
    return Result<void, Error>::ok();
}

}  // namespace agentctx::core
