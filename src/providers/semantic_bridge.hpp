#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include "providers/llm_provider.hpp"
#include "sandbox/execution_context.hpp"
#include "utils/logging.hpp"

namespace librarian::providers {

inline constexpr const char* kLlmOutputOpen = "<LLM_QUERY_OUTPUT>";
inline constexpr const char* kLlmOutputClose = "</LLM_QUERY_OUTPUT>";

extern const char* const kAnalyzerSystemPrompt;

class LlmQueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string BuildAnalyzerInput(const std::string& instruction, const std::string& data);

std::string WrapLlmOutput(const std::string& content);

// Removes one surrounding delimiter pair; other text is returned unchanged.
std::string StripLlmOutput(const std::string& text);

// Binds provider and model into the stateless llm_query used by scripts.
// The returned function throws LlmQueryError when the provider fails.
sandbox::LlmQuery MakeLlmQuery(std::shared_ptr<LLMProvider> provider,
                               std::string model,
                               int max_tokens,
                               std::shared_ptr<utils::LogSink> sink);

}  // namespace librarian::providers
