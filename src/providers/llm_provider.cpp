#include "providers/llm_provider.hpp"

#include <stdexcept>

#include "providers/http_chat_provider.hpp"

namespace librarian::providers {

ProviderSettings ResolveProviderSettings(const config::LlmConfig& config) {
    ProviderSettings settings{};
    settings.api_key = config.api_key;
    settings.api_base = config.base_url;
    settings.model = config.model;
    settings.use_proxy = config.use_proxy;
    settings.timeout_s = config.timeout_s;

    if (config.type == "openai" || config.type == "openai-compatible") {
        settings.style = WireStyle::kOpenAI;
        if (settings.api_base.empty()) {
            settings.api_base = "https://api.openai.com/v1";
        }
        if (settings.model.empty()) {
            settings.model = "gpt-4.1";
        }
        return settings;
    }

    if (config.type == "anthropic" || config.type == "anthropic-compatible") {
        settings.style = WireStyle::kAnthropic;
        if (settings.api_base.empty()) {
            settings.api_base = "https://api.anthropic.com/v1";
        }
        if (settings.model.empty()) {
            settings.model = "claude-sonnet-4-5-20250929";
        }
        return settings;
    }

    if (config.type == "google") {
        // Gemini through its OpenAI-compatible endpoint.
        settings.style = WireStyle::kOpenAI;
        if (settings.api_base.empty()) {
            settings.api_base = "https://generativelanguage.googleapis.com/v1beta/openai";
        }
        if (settings.model.empty()) {
            settings.model = "gemini-2.5-flash-lite";
        }
        return settings;
    }

    throw std::invalid_argument("Unsupported LLM provider type: " + config.type);
}

std::unique_ptr<LLMProvider> CreateProvider(const config::LlmConfig& config,
                                            std::shared_ptr<utils::LogSink> sink) {
    return std::make_unique<HttpChatProvider>(ResolveProviderSettings(config), std::move(sink));
}

}  // namespace librarian::providers
