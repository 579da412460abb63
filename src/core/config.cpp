#include "agentctx/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace agentctx::core {

std::string expand_path(const std::string& path) {
    std::string result = path;

    // Expand ~
    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // Expand ${VAR} patterns
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        std::string var_name = match[1].str();
        const char* var_value = std::getenv(var_name.c_str());
        std::string replacement = var_value ? var_value : "";
        result = match.prefix().str() + replacement + match.suffix().str();
    }

    return result;
}

namespace {

fs::path expand_path_fs(const fs::path& path) {
    if (path.empty()) return path;
    return fs::path(expand_path(path.string()));
}

}  // namespace

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.agentctx/config.yaml")));
}

void Config::expand_paths() {
    observability.log_path = expand_path_fs(observability.log_path);
    observability.capture_dir = expand_path_fs(observability.capture_dir);
}

void Config::apply_env_overrides() {
    if (const char* level = std::getenv("AGENTCTX_LOG_LEVEL")) {
        observability.log_level = level;
    }
    if (const char* dir = std::getenv("AGENTCTX_CAPTURE_DIR")) {
        observability.capture_dir = dir;
    }
}

Result<void, Error> Config::validate() const {
    if (compaction.threshold_ratio <= 0.0 || compaction.threshold_ratio > 1.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "compaction.threshold_ratio must be in (0, 1]"
        );
    }

    if (compaction.retained_budget_ratio <= 0.0 || compaction.retained_budget_ratio > 1.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "compaction.retained_budget_ratio must be in (0, 1]"
        );
    }

    if (compaction.min_retained_turns < 1) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "compaction.min_retained_turns must be at least 1"
        );
    }

    if (compaction.low_compression_ratio <= 0.0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "compaction.low_compression_ratio must be positive"
        );
    }

    if (models.default_context_window == 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "models.default_context_window must be positive"
        );
    }

    if (models.default_max_output_tokens >= models.default_context_window) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "models.default_max_output_tokens must be less than default_context_window"
        );
    }

    for (const auto& entry : models.entries) {
        if (entry.provider.empty() || entry.model.empty()) {
            return Result<void, Error>::err(
                ErrorCode::ConfigValidationFailed,
                "models.entries require provider and model"
            );
        }
        if (entry.context_window == 0 || entry.max_output_tokens >= entry.context_window) {
            return Result<void, Error>::err(
                ErrorCode::ConfigValidationFailed,
                "invalid limits for model",
                entry.provider + "/" + entry.model
            );
        }
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path_fs(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        // Parse compaction config
        if (auto cmp_node = root["compaction"]) {
            config.compaction.autocompact_buffer = cmp_node["autocompact_buffer"].as<uint64_t>(config.compaction.autocompact_buffer);
            config.compaction.threshold_ratio = cmp_node["threshold_ratio"].as<double>(config.compaction.threshold_ratio);
            config.compaction.retained_budget_ratio = cmp_node["retained_budget_ratio"].as<double>(config.compaction.retained_budget_ratio);
            config.compaction.min_retained_turns = cmp_node["min_retained_turns"].as<int>(config.compaction.min_retained_turns);
            config.compaction.low_compression_ratio = cmp_node["low_compression_ratio"].as<double>(config.compaction.low_compression_ratio);
            config.compaction.max_goals = cmp_node["max_goals"].as<int>(config.compaction.max_goals);
        }

        // Parse model registry
        if (auto models_node = root["models"]) {
            config.models.default_context_window = models_node["default_context_window"].as<uint64_t>(config.models.default_context_window);
            config.models.default_max_output_tokens = models_node["default_max_output_tokens"].as<uint64_t>(config.models.default_max_output_tokens);

            if (auto entries_node = models_node["entries"]) {
                for (const auto& e : entries_node) {
                    ModelEntry entry;
                    entry.provider = e["provider"].as<std::string>("");
                    entry.model = e["model"].as<std::string>("");
                    entry.context_window = e["context_window"].as<uint64_t>(config.models.default_context_window);
                    entry.max_output_tokens = e["max_output_tokens"].as<uint64_t>(config.models.default_max_output_tokens);
                    config.models.entries.push_back(std::move(entry));
                }
            }
        }

        // Parse observability config
        if (auto obs_node = root["observability"]) {
            config.observability.log_level = obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path = obs_node["log_path"].as<std::string>(config.observability.log_path.string());
            config.observability.capture_enabled = obs_node["capture_enabled"].as<bool>(config.observability.capture_enabled);
            config.observability.capture_dir = obs_node["capture_dir"].as<std::string>(config.observability.capture_dir.string());
        }

        config.apply_env_overrides();
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    config.apply_env_overrides();
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path_fs(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "compaction" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "autocompact_buffer" << YAML::Value << compaction.autocompact_buffer;
        out << YAML::Key << "threshold_ratio" << YAML::Value << compaction.threshold_ratio;
        out << YAML::Key << "retained_budget_ratio" << YAML::Value << compaction.retained_budget_ratio;
        out << YAML::Key << "min_retained_turns" << YAML::Value << compaction.min_retained_turns;
        out << YAML::Key << "low_compression_ratio" << YAML::Value << compaction.low_compression_ratio;
        out << YAML::Key << "max_goals" << YAML::Value << compaction.max_goals;
        out << YAML::EndMap;

        out << YAML::Key << "models" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "default_context_window" << YAML::Value << models.default_context_window;
        out << YAML::Key << "default_max_output_tokens" << YAML::Value << models.default_max_output_tokens;
        out << YAML::Key << "entries" << YAML::Value << YAML::BeginSeq;
        for (const auto& entry : models.entries) {
            out << YAML::BeginMap;
            out << YAML::Key << "provider" << YAML::Value << entry.provider;
            out << YAML::Key << "model" << YAML::Value << entry.model;
            out << YAML::Key << "context_window" << YAML::Value << entry.context_window;
            out << YAML::Key << "max_output_tokens" << YAML::Value << entry.max_output_tokens;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::Key << "capture_enabled" << YAML::Value << observability.capture_enabled;
        out << YAML::Key << "capture_dir" << YAML::Value << observability.capture_dir.string();
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what()
        );
    }
}

}  // namespace agentctx::core
