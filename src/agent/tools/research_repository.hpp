#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "agent/tools/tool.hpp"
#include "sandbox/execution_context.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "utils/logging.hpp"

namespace librarian::agent::tools {

inline constexpr std::size_t kMaxToolScriptChars = 100000;

// Text handed back to the caller: error, final answer, stdout, return value.
std::string FormatToolResult(const sandbox::ExecutionResult& result);

class ResearchRepositoryTool : public Tool {
public:
    ResearchRepositoryTool(std::shared_ptr<const sandbox::SandboxRuntime> runtime,
                           std::filesystem::path working_dir,
                           sandbox::LlmQuery llm_query,
                           std::shared_ptr<utils::LogSink> sink);

    std::string Name() const override { return "research_repository"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    std::string Execute(const std::unordered_map<std::string, std::string>& params) override;

private:
    std::shared_ptr<const sandbox::SandboxRuntime> runtime_;
    std::filesystem::path working_dir_;
    sandbox::LlmQuery llm_query_;
    std::shared_ptr<utils::LogSink> sink_;
};

}  // namespace librarian::agent::tools
