#include "agent/script_session.hpp"

#include <sstream>

#include "utils/common.hpp"

namespace librarian::agent {
namespace {

constexpr std::size_t kBufferPreviewChars = 200;
constexpr std::size_t kSummaryValueChars = 500;
constexpr std::size_t kSummaryStdoutChars = 2000;

std::string BufferText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

ScriptSession::ScriptSession(std::shared_ptr<const sandbox::SandboxRuntime> runtime,
                             std::shared_ptr<repo::RepoApi> repo,
                             sandbox::LlmQuery llm_query,
                             std::optional<std::string> corpus,
                             config::SessionConfig options,
                             std::shared_ptr<utils::LogSink> sink)
    : runtime_(std::move(runtime))
    , repo_(std::move(repo))
    , llm_query_(std::move(llm_query))
    , corpus_(std::move(corpus))
    , options_(options)
    , sink_(sink ? std::move(sink) : std::make_shared<utils::NullLogSink>()) {}

void ScriptSession::SetObservers(sandbox::ExecutionContext observers) {
    observers_ = std::move(observers);
}

SessionStep ScriptSession::Step(const std::string& script) {
    sink_->Log(utils::LogLevel::kInfo, "session", "Iteration " + std::to_string(iteration_ + 1) + " executing script", {
        {"script", script}
    });
    error_feedback_.reset();

    sandbox::ExecutionContext context = observers_;
    context.corpus = corpus_;
    context.buffers = buffers_;

    SessionStep step{};
    step.result = runtime_->Execute(script, repo_, llm_query_, context);
    buffers_ = step.result.buffers;
    // A return value belongs to its own step only.
    buffers_.erase(sandbox::kReturnValueKey);
    stdout_ = step.result.stdout_text;
    ++iteration_;

    if (step.result.error) {
        error_feedback_ = *step.result.error;
        sink_->Log(utils::LogLevel::kWarn, "session", "Script execution error", {
            {"error_kind", sandbox::ToString(step.result.error_kind)}
        });
    }

    if (step.result.final_answer) {
        step.is_complete = true;
        step.final_answer = step.result.final_answer;
        sink_->Log(utils::LogLevel::kInfo, "session", "Completed with final answer", {
            {"iterations", std::to_string(iteration_)}
        });
        return step;
    }

    if (iteration_ >= options_.max_iterations) {
        sink_->Log(utils::LogLevel::kWarn, "session", "Max iterations reached", {
            {"iterations", std::to_string(iteration_)}
        });
        step.is_complete = true;
        step.final_answer = "Max iterations (" + std::to_string(options_.max_iterations) + ") reached.\n\n" +
            IterationSummary();
    }
    return step;
}

nlohmann::json ScriptSession::Metadata() const {
    nlohmann::json keys = nlohmann::json::array();
    nlohmann::json summary = nlohmann::json::array();
    for (const auto& [key, value] : buffers_.items()) {
        const auto text = BufferText(value);
        keys.push_back(key);
        summary.push_back({
            {"key", key},
            {"preview", utils::Utf8Prefix(text, kBufferPreviewChars)},
            {"size", text.size()}
        });
    }

    nlohmann::json metadata = {
        {"iteration", iteration_},
        {"stdoutPreview", utils::Utf8Suffix(stdout_, options_.stdout_preview_chars)},
        {"stdoutLength", stdout_.size()},
        {"bufferKeys", keys},
        {"bufferSummary", summary},
        {"hasContext", corpus_.has_value()}
    };
    if (error_feedback_) {
        metadata["errorFeedback"] = *error_feedback_;
    }
    return metadata;
}

std::string ScriptSession::IterationSummary() const {
    std::ostringstream oss;
    oss << "=== Iteration Summary ===\n";
    oss << "Total iterations: " << iteration_ << "\n";
    oss << "\n=== Buffers (" << buffers_.size() << ") ===";
    for (const auto& [key, value] : buffers_.items()) {
        const auto text = BufferText(value);
        oss << "\n\n" << key << " (" << text.size() << " chars):\n";
        oss << utils::Utf8Prefix(text, kSummaryValueChars);
        if (text.size() > kSummaryValueChars) {
            oss << "\n... (truncated)";
        }
    }
    if (!stdout_.empty()) {
        oss << "\n\n=== Last Output ===\n" << utils::Utf8Suffix(stdout_, kSummaryStdoutChars);
    }
    return oss.str();
}

}  // namespace librarian::agent
