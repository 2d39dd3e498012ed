#include "providers/http_chat_provider.hpp"

#include <cstdlib>
#include <string>

#include "httplib.h"
#include "utils/common.hpp"

namespace librarian::providers {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

void ApplyProxyFromEnv(httplib::Client& client, utils::LogSink& sink) {
    std::string host;
    int port = 0;
    for (const char* name : {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"}) {
        if (ParseProxyHostPort(GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
    if (!GetEnv("ALL_PROXY").empty() || !GetEnv("all_proxy").empty()) {
        sink.Log(utils::LogLevel::kWarn, "llm", "ALL_PROXY is set but only HTTP proxies are supported");
    }
}

LLMResponse ErrorResponse(std::string content) {
    return LLMResponse{.content = std::move(content), .finish_reason = "error"};
}

int UsageValue(const nlohmann::json& usage, const char* key) {
    const auto it = usage.find(key);
    return it != usage.end() && it->is_number_integer() ? it->get<int>() : 0;
}

}  // namespace

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

nlohmann::json BuildChatPayload(WireStyle style,
                                const std::vector<Message>& messages,
                                const std::string& model,
                                int max_tokens,
                                double temperature) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = max_tokens;
    payload["temperature"] = temperature;
    payload["messages"] = nlohmann::json::array();

    if (style == WireStyle::kAnthropic) {
        std::string system_prompt;
        for (const auto& msg : messages) {
            if (msg.role == "system") {
                if (!system_prompt.empty()) {
                    system_prompt.append("\n");
                }
                system_prompt.append(msg.content);
                continue;
            }
            payload["messages"].push_back({
                {"role", msg.role},
                {"content", nlohmann::json::array({{{"type", "text"}, {"text", msg.content}}})}
            });
        }
        if (!system_prompt.empty()) {
            payload["system"] = system_prompt;
        }
        return payload;
    }

    for (const auto& msg : messages) {
        payload["messages"].push_back({{"role", msg.role}, {"content", msg.content}});
    }
    return payload;
}

LLMResponse ParseChatResponse(WireStyle style, const nlohmann::json& body) {
    LLMResponse parsed{};
    if (style == WireStyle::kAnthropic) {
        if (!body.contains("content") || !body["content"].is_array()) {
            return ErrorResponse("Error calling LLM: invalid response");
        }
        for (const auto& block : body["content"]) {
            if (block.value("type", "") == "text") {
                parsed.content += block.value("text", "");
            }
        }
        if (body.contains("stop_reason") && body["stop_reason"].is_string()) {
            parsed.finish_reason = body["stop_reason"].get<std::string>();
        }
        if (body.contains("usage") && body["usage"].is_object()) {
            const auto& usage = body["usage"];
            parsed.usage["prompt_tokens"] = UsageValue(usage, "input_tokens");
            parsed.usage["completion_tokens"] = UsageValue(usage, "output_tokens");
            parsed.usage["total_tokens"] =
                parsed.usage["prompt_tokens"] + parsed.usage["completion_tokens"];
        }
        return parsed;
    }

    if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
        return ErrorResponse("Error calling LLM: invalid response");
    }
    const auto& choice = body["choices"][0];
    if (choice.contains("message") && choice["message"].contains("content") &&
        choice["message"]["content"].is_string()) {
        parsed.content = choice["message"]["content"].get<std::string>();
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        parsed.finish_reason = choice["finish_reason"].get<std::string>();
    }
    if (body.contains("usage") && body["usage"].is_object()) {
        const auto& usage = body["usage"];
        parsed.usage["prompt_tokens"] = UsageValue(usage, "prompt_tokens");
        parsed.usage["completion_tokens"] = UsageValue(usage, "completion_tokens");
        parsed.usage["total_tokens"] = UsageValue(usage, "total_tokens");
    }
    return parsed;
}

HttpChatProvider::HttpChatProvider(ProviderSettings settings, std::shared_ptr<utils::LogSink> sink)
    : settings_(std::move(settings))
    , sink_(sink ? std::move(sink) : std::make_shared<utils::NullLogSink>()) {}

LLMResponse HttpChatProvider::Chat(
    const std::vector<Message>& messages,
    const std::string& model,
    int max_tokens,
    double temperature) {
    try {
        const bool anthropic = settings_.style == WireStyle::kAnthropic;
        const auto chosen_model = model.empty() ? settings_.model : model;
        const auto payload = BuildChatPayload(settings_.style, messages, chosen_model, max_tokens, temperature);

        const auto parsed = ParseUrl(settings_.api_base);
        const std::string endpoint = parsed.base_path + (anthropic ? "/messages" : "/chat/completions");
        std::string scheme_host_port = parsed.https ? "https://" : "http://";
        scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);

        httplib::Client client(scheme_host_port);
        client.set_connection_timeout(settings_.timeout_s);
        client.set_read_timeout(settings_.timeout_s);
        if (settings_.use_proxy) {
            ApplyProxyFromEnv(client, *sink_);
        }

        sink_->Log(utils::LogLevel::kDebug, "llm", "POST " + scheme_host_port + endpoint, {
            {"model", chosen_model},
            {"api_key", utils::MaskKey(settings_.api_key)},
            {"style", anthropic ? "anthropic" : "openai"}
        });

        httplib::Headers headers;
        if (!settings_.api_key.empty()) {
            if (anthropic) {
                headers.emplace("x-api-key", settings_.api_key);
                headers.emplace("anthropic-version", "2023-06-01");
            } else {
                headers.emplace("Authorization", "Bearer " + settings_.api_key);
            }
        }

        auto response = client.Post(endpoint, headers,
                                    payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                                    "application/json");
        if (!response) {
            const auto err = response.error();
            const auto err_text = httplib::to_string(err);
            sink_->Log(utils::LogLevel::kError, "llm", "request failed", {{"error", err_text}});
            return ErrorResponse("Error calling LLM: request failed (httplib error=" +
                                 std::to_string(static_cast<int>(err)) + ", " + err_text + ")");
        }
        if (response->status >= 400) {
            sink_->Log(utils::LogLevel::kError, "llm", "HTTP error", {
                {"status", std::to_string(response->status)},
                {"content", response->body}
            });
            return ErrorResponse("Error calling LLM: HTTP " + std::to_string(response->status));
        }

        auto body = nlohmann::json::parse(response->body, nullptr, false);
        if (body.is_discarded()) {
            return ErrorResponse("Error calling LLM: invalid response");
        }
        return ParseChatResponse(settings_.style, body);
    } catch (const std::exception& ex) {
        return ErrorResponse(std::string("Error calling LLM: ") + ex.what());
    }
}

}  // namespace librarian::providers
