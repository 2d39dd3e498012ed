#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"
#include "utils/logging.hpp"

namespace librarian::providers {

struct ToolDefinition {
    std::string name;
    std::string description;
    std::string parameters_json;
};

struct Message {
    std::string role;
    std::string content;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool IsError() const { return finish_reason == "error"; }
};

enum class WireStyle {
    kOpenAI,
    kAnthropic
};

struct ProviderSettings {
    WireStyle style = WireStyle::kOpenAI;
    std::string api_key;
    std::string api_base;
    std::string model;
    bool use_proxy = false;
    int timeout_s = 60;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;
};

// Maps a provider type ("openai", "anthropic", "google", "openai-compatible",
// "anthropic-compatible") to wire style, endpoint and default model.
// Throws std::invalid_argument for an unknown type.
ProviderSettings ResolveProviderSettings(const config::LlmConfig& config);

std::unique_ptr<LLMProvider> CreateProvider(const config::LlmConfig& config,
                                            std::shared_ptr<utils::LogSink> sink);

}  // namespace librarian::providers
