#include "providers/semantic_bridge.hpp"

#include <vector>

namespace librarian::providers {

const char* const kAnalyzerSystemPrompt =
    "You are a stateless Functional Analyzer. You are a component of a larger recursive search.\n"
    "1. **Input**: You will receive a code snippet and a specific instruction.\n"
    "2. **Constraint**: You have NO access to tools. You must answer based ONLY on the provided text.\n"
    "3. **Output**: Be extremely concise. If the instruction asks for a boolean or a specific extraction, "
    "provide ONLY that. No conversational filler.";

std::string BuildAnalyzerInput(const std::string& instruction, const std::string& data) {
    return "**Instruction:** " + instruction + "\n\n**Data:**\n" + data;
}

std::string WrapLlmOutput(const std::string& content) {
    return std::string(kLlmOutputOpen) + "\n" + content + "\n" + kLlmOutputClose;
}

std::string StripLlmOutput(const std::string& text) {
    const std::string open = std::string(kLlmOutputOpen) + "\n";
    const std::string close = std::string("\n") + kLlmOutputClose;
    if (text.size() < open.size() + close.size() ||
        text.compare(0, open.size(), open) != 0 ||
        text.compare(text.size() - close.size(), close.size(), close) != 0) {
        return text;
    }
    return text.substr(open.size(), text.size() - open.size() - close.size());
}

sandbox::LlmQuery MakeLlmQuery(std::shared_ptr<LLMProvider> provider,
                               std::string model,
                               int max_tokens,
                               std::shared_ptr<utils::LogSink> sink) {
    if (!sink) {
        sink = std::make_shared<utils::NullLogSink>();
    }
    return [provider = std::move(provider), model = std::move(model), max_tokens, sink = std::move(sink)](
               const std::string& instruction, const std::string& data) -> std::string {
        if (!provider) {
            throw LlmQueryError("llm_query has no provider configured");
        }
        sink->Log(utils::LogLevel::kDebug, "llm_query", "invoked", {
            {"model", model.empty() ? provider->GetDefaultModel() : model},
            {"instruction", instruction},
            {"data", data}
        });

        const std::vector<Message> messages = {
            {"system", kAnalyzerSystemPrompt},
            {"user", BuildAnalyzerInput(instruction, data)}
        };
        const auto response = provider->Chat(messages, model, max_tokens, 0.0);
        if (response.IsError()) {
            sink->Log(utils::LogLevel::kError, "llm_query", "failed", {{"error", response.content}});
            throw LlmQueryError(response.content);
        }

        sink->Log(utils::LogLevel::kDebug, "llm_query", "completed", {
            {"response_length", std::to_string(response.content.size())}
        });
        return WrapLlmOutput(response.content);
    };
}

}  // namespace librarian::providers
