#pragma once

#include <memory>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "repo/repo_api.hpp"
#include "sandbox/execution_context.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "utils/logging.hpp"

namespace librarian::agent {

struct SessionStep {
    sandbox::ExecutionResult result;
    bool is_complete = false;
    std::optional<std::string> final_answer;
};

// Carries buffers, stdout and error feedback from one script run to the next.
// Each Step gets a fresh isolate; only value snapshots cross the boundary.
class ScriptSession {
public:
    ScriptSession(std::shared_ptr<const sandbox::SandboxRuntime> runtime,
                  std::shared_ptr<repo::RepoApi> repo,
                  sandbox::LlmQuery llm_query,
                  std::optional<std::string> corpus,
                  config::SessionConfig options,
                  std::shared_ptr<utils::LogSink> sink);

    SessionStep Step(const std::string& script);

    // Constant-size view of the session for the next prompt.
    nlohmann::json Metadata() const;

    void SetErrorFeedback(std::string feedback) { error_feedback_ = std::move(feedback); }
    void SetObservers(sandbox::ExecutionContext observers);

    int Iteration() const { return iteration_; }
    const nlohmann::json& Buffers() const { return buffers_; }
    const std::string& LastStdout() const { return stdout_; }

private:
    std::string IterationSummary() const;

    std::shared_ptr<const sandbox::SandboxRuntime> runtime_;
    std::shared_ptr<repo::RepoApi> repo_;
    sandbox::LlmQuery llm_query_;
    std::optional<std::string> corpus_;
    config::SessionConfig options_;
    std::shared_ptr<utils::LogSink> sink_;

    sandbox::ExecutionContext observers_;
    nlohmann::json buffers_ = nlohmann::json::object();
    std::string stdout_;
    std::optional<std::string> error_feedback_;
    int iteration_ = 0;
};

}  // namespace librarian::agent
