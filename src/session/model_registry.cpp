#include "agentctx/session/model_registry.hpp"

#include <spdlog/spdlog.h>

namespace agentctx::session {

ModelRegistry::ModelRegistry(const ModelsConfig& config)
    : defaults_{config.default_context_window, config.default_max_output_tokens}
{
    for (const auto& entry : config.entries) {
        auto provider = provider_from_string(entry.provider);
        if (!provider) {
            spdlog::warn("Skipping model '{}': unknown provider '{}'", entry.model, entry.provider);
            continue;
        }
        add(*provider, entry.model, ModelLimits{entry.context_window, entry.max_output_tokens});
    }
}

ModelLimits ModelRegistry::lookup(ProviderKind provider, const std::string& model) const {
    auto it = models_.find({provider, model});
    if (it != models_.end()) {
        return it->second;
    }
    spdlog::debug("No limits registered for {}/{}, using defaults", provider_to_string(provider), model);
    return defaults_;
}

bool ModelRegistry::contains(ProviderKind provider, const std::string& model) const {
    return models_.count({provider, model}) > 0;
}

void ModelRegistry::add(ProviderKind provider, const std::string& model, ModelLimits limits) {
    models_[{provider, model}] = limits;
}

}  // namespace agentctx::session
