#pragma once

#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"

namespace librarian::providers {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url);

// Request bodies and response parsing for both wire styles, usable without
// a network connection.
nlohmann::json BuildChatPayload(WireStyle style,
                                const std::vector<Message>& messages,
                                const std::string& model,
                                int max_tokens,
                                double temperature);
LLMResponse ParseChatResponse(WireStyle style, const nlohmann::json& body);

class HttpChatProvider : public LLMProvider {
public:
    HttpChatProvider(ProviderSettings settings, std::shared_ptr<utils::LogSink> sink);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return settings_.model; }

private:
    ProviderSettings settings_;
    std::shared_ptr<utils::LogSink> sink_;
};

}  // namespace librarian::providers
