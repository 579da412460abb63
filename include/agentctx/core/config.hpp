#pragma once

#include "errors.hpp"
#include "result.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace agentctx::core {

// Compaction engine tuning
struct CompactionConfig {
    uint64_t autocompact_buffer = 50000;    // headroom kept below the hard limit
    double threshold_ratio = 0.9;           // share of usable context that triggers compaction
    double retained_budget_ratio = 0.5;     // share of usable context for the verbatim tail
    int min_retained_turns = 3;             // also the synthetic anchor offset
    double low_compression_ratio = 0.4;     // tokens_after / tokens_before above this warns
    int max_goals = 5;
};

// One registry entry for a provider/model pair
struct ModelEntry {
    std::string provider;
    std::string model;
    uint64_t context_window = 0;
    uint64_t max_output_tokens = 0;
};

struct ModelsConfig {
    uint64_t default_context_window = 200000;
    uint64_t default_max_output_tokens = 16384;
    std::vector<ModelEntry> entries;
};

// Observability configuration
struct ObservabilityConfig {
    std::string log_level = "info";  // debug, info, warn, error, off
    fs::path log_path;               // empty: console only
    bool capture_enabled = false;
    fs::path capture_dir = "~/.agentctx/debug";
};

// Main configuration
struct Config {
    CompactionConfig compaction;
    ModelsConfig models;
    ObservabilityConfig observability;

    // Load configuration from file
    static Result<Config, Error> load(const fs::path& path);

    // Load with defaults, falling back if file doesn't exist
    static Config load_or_default(const fs::path& path);

    // Save configuration to file
    Result<void, Error> save(const fs::path& path) const;

    // Get default config path
    static fs::path default_path();

    // Expand ~ and environment variables in paths
    void expand_paths();

    // Apply AGENTCTX_* environment overrides
    void apply_env_overrides();

    Result<void, Error> validate() const;
};

// Helper to expand ~ and environment variables in paths
std::string expand_path(const std::string& path);

}  // namespace agentctx::core
