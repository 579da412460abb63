#pragma once

#include "agentctx/compaction/threshold.hpp"
#include "agentctx/core/config.hpp"
#include "agentctx/session/provider_usage.hpp"

#include <map>
#include <string>
#include <utility>

namespace agentctx::session {

using compaction::ModelLimits;

// Context limits by provider/model, populated from the models config section
class ModelRegistry {
public:
    explicit ModelRegistry(const ModelsConfig& config);

    // Falls back to the configured defaults for unknown models
    ModelLimits lookup(ProviderKind provider, const std::string& model) const;

    bool contains(ProviderKind provider, const std::string& model) const;

    void add(ProviderKind provider, const std::string& model, ModelLimits limits);

    size_t size() const { return models_.size(); }

    ModelLimits defaults() const { return defaults_; }

private:
    ModelLimits defaults_;
    std::map<std::pair<ProviderKind, std::string>, ModelLimits> models_;
};

}  // namespace agentctx::session
