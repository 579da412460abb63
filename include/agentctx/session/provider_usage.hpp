#pragma once

#include "agentctx/core/result.hpp"
#include "agentctx/core/types.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace agentctx::session {

using namespace agentctx::core;

enum class ProviderKind {
    Anthropic,
    OpenAI,
    Gemini
};

std::string_view provider_to_string(ProviderKind kind);

// Accepts "anthropic"/"claude", "openai", "gemini"/"google", case-insensitive
std::optional<ProviderKind> provider_from_string(std::string_view name);

// Normalizes a provider's raw usage object into TokenUsage, where fresh input,
// cache reads and cache writes are disjoint.
class UsageAdapter {
public:
    virtual ~UsageAdapter() = default;

    virtual ProviderKind kind() const = 0;

    // Missing fields stay empty; a non-object is InvalidArgument
    virtual Result<TokenUsage, Error> normalize(const Json& raw) const = 0;
};

// {"input_tokens", "output_tokens", "cache_read_input_tokens", "cache_creation_input_tokens"}
class AnthropicUsageAdapter : public UsageAdapter {
public:
    ProviderKind kind() const override { return ProviderKind::Anthropic; }
    Result<TokenUsage, Error> normalize(const Json& raw) const override;
};

// {"prompt_tokens", "completion_tokens", "prompt_tokens_details": {"cached_tokens"}}
// prompt_tokens already includes the cached tokens.
class OpenAIUsageAdapter : public UsageAdapter {
public:
    ProviderKind kind() const override { return ProviderKind::OpenAI; }
    Result<TokenUsage, Error> normalize(const Json& raw) const override;
};

// {"promptTokenCount", "candidatesTokenCount", "thoughtsTokenCount", "cachedContentTokenCount"}
// promptTokenCount already includes the cached tokens.
class GeminiUsageAdapter : public UsageAdapter {
public:
    ProviderKind kind() const override { return ProviderKind::Gemini; }
    Result<TokenUsage, Error> normalize(const Json& raw) const override;
};

std::unique_ptr<UsageAdapter> make_usage_adapter(ProviderKind kind);

}  // namespace agentctx::session
