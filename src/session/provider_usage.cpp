#include "agentctx/session/provider_usage.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace agentctx::session {

namespace {

std::optional<uint64_t> read_count(const Json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return std::nullopt;
    const auto& v = obj[key];
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        return n < 0 ? 0 : static_cast<uint64_t>(n);
    }
    return std::nullopt;
}

Result<TokenUsage, Error> not_an_object(ProviderKind kind) {
    return Result<TokenUsage, Error>::err(
        ErrorCode::InvalidArgument,
        "Usage payload is not a JSON object",
        std::string(provider_to_string(kind))
    );
}

// Split an inclusive prompt count into fresh and cached parts
void split_inclusive_prompt(TokenUsage& usage, std::optional<uint64_t> prompt, std::optional<uint64_t> cached) {
    if (cached) {
        usage.cache_read_input_tokens = cached;
    }
    if (prompt) {
        uint64_t c = cached.value_or(0);
        usage.input_tokens = *prompt > c ? *prompt - c : 0;
    }
}

}  // namespace

std::string_view provider_to_string(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Anthropic: return "anthropic";
        case ProviderKind::OpenAI: return "openai";
        case ProviderKind::Gemini: return "gemini";
    }
    return "unknown";
}

std::optional<ProviderKind> provider_from_string(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "anthropic" || lower == "claude") return ProviderKind::Anthropic;
    if (lower == "openai") return ProviderKind::OpenAI;
    if (lower == "gemini" || lower == "google") return ProviderKind::Gemini;
    return std::nullopt;
}

Result<TokenUsage, Error> AnthropicUsageAdapter::normalize(const Json& raw) const {
    if (!raw.is_object()) return not_an_object(kind());

    TokenUsage usage;
    usage.input_tokens = read_count(raw, "input_tokens");
    usage.output_tokens = read_count(raw, "output_tokens");
    usage.cache_read_input_tokens = read_count(raw, "cache_read_input_tokens");
    usage.cache_creation_input_tokens = read_count(raw, "cache_creation_input_tokens");
    return Result<TokenUsage, Error>::ok(usage);
}

Result<TokenUsage, Error> OpenAIUsageAdapter::normalize(const Json& raw) const {
    if (!raw.is_object()) return not_an_object(kind());

    TokenUsage usage;
    std::optional<uint64_t> cached;
    if (raw.contains("prompt_tokens_details")) {
        cached = read_count(raw["prompt_tokens_details"], "cached_tokens");
    }
    split_inclusive_prompt(usage, read_count(raw, "prompt_tokens"), cached);
    usage.output_tokens = read_count(raw, "completion_tokens");
    return Result<TokenUsage, Error>::ok(usage);
}

Result<TokenUsage, Error> GeminiUsageAdapter::normalize(const Json& raw) const {
    if (!raw.is_object()) return not_an_object(kind());

    TokenUsage usage;
    split_inclusive_prompt(usage, read_count(raw, "promptTokenCount"),
                           read_count(raw, "cachedContentTokenCount"));

    auto candidates = read_count(raw, "candidatesTokenCount");
    auto thoughts = read_count(raw, "thoughtsTokenCount");
    if (candidates || thoughts) {
        usage.output_tokens = candidates.value_or(0) + thoughts.value_or(0);
    }
    return Result<TokenUsage, Error>::ok(usage);
}

std::unique_ptr<UsageAdapter> make_usage_adapter(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Anthropic: return std::make_unique<AnthropicUsageAdapter>();
        case ProviderKind::OpenAI: return std::make_unique<OpenAIUsageAdapter>();
        case ProviderKind::Gemini: return std::make_unique<GeminiUsageAdapter>();
    }
    return nullptr;
}

}  // namespace agentctx::session
