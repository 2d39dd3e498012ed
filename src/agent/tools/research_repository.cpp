#include "agent/tools/research_repository.hpp"

#include "repo/repo_api.hpp"
#include "utils/common.hpp"

namespace librarian::agent::tools {

std::string FormatToolResult(const sandbox::ExecutionResult& result) {
    if (result.error) {
        return "Script execution error: " + *result.error;
    }
    if (result.final_answer) {
        return *result.final_answer;
    }
    if (!utils::Trim(result.stdout_text).empty()) {
        return result.stdout_text;
    }
    const auto it = result.buffers.find(sandbox::kReturnValueKey);
    if (it != result.buffers.end() && !it->is_null()) {
        return it->is_string()
            ? it->get<std::string>()
            : it->dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return "Script completed with no output.";
}

ResearchRepositoryTool::ResearchRepositoryTool(
    std::shared_ptr<const sandbox::SandboxRuntime> runtime,
    std::filesystem::path working_dir,
    sandbox::LlmQuery llm_query,
    std::shared_ptr<utils::LogSink> sink)
    : runtime_(std::move(runtime))
    , working_dir_(std::move(working_dir))
    , llm_query_(std::move(llm_query))
    , sink_(sink ? std::move(sink) : std::make_shared<utils::NullLogSink>()) {}

std::string ResearchRepositoryTool::Description() const {
    return "Execute a complete exploration strategy as a script against the repository.\n\n"
           "The script runs as the body of an async function with these globals:\n"
           "- repo.list({ directoryPath?, includeHidden?, recursive?, maxDepth? }): directory tree.\n"
           "- repo.view({ filePath, viewRange? }): file text with line numbers.\n"
           "- repo.find({ searchPath?, patterns, exclude?, recursive?, maxResults?, includeHidden? }): "
           "array of matching paths, or a message when nothing matches.\n"
           "- repo.grep({ searchPath?, query, patterns?, caseSensitive?, regex?, recursive?, maxResults?, "
           "contextBefore?, contextAfter?, exclude?, includeHidden? }): matches with context.\n"
           "- llm_query(instruction, data): stateless semantic analysis, answer wrapped in "
           "<LLM_QUERY_OUTPUT> tags.\n"
           "- print(...), FINAL(answer), FINAL_VAR(name), chunk(data, size), batch(items, size), buffers.\n\n"
           "Use return or FINAL to provide the result.";
}

std::string ResearchRepositoryTool::ParametersJson() const {
    return R"({"type":"object","properties":{"script":{"type":"string","maxLength":100000,)"
           R"json("description":"The exploration script to execute in the sandbox (max 100KB)"}},"required":["script"]})json";
}

std::string ResearchRepositoryTool::Execute(const std::unordered_map<std::string, std::string>& params) {
    const auto it = params.find("script");
    if (it == params.end() || utils::Trim(it->second).empty()) {
        return "Error: script is required";
    }
    const auto& script = it->second;
    if (script.size() > kMaxToolScriptChars) {
        return "Error: Script exceeds maximum size of 100KB";
    }

    sink_->Log(utils::LogLevel::kInfo, "research_repository", "called", {{"script", script}});

    std::shared_ptr<repo::RepoApi> repo;
    try {
        repo = repo::RepoApi::ForDirectory(working_dir_, sink_);
    } catch (const std::exception& ex) {
        return std::string("Error: ") + ex.what();
    }

    const sandbox::ExecutionContext context{};
    const auto result = runtime_->Execute(script, repo, llm_query_, context);
    return FormatToolResult(result);
}

}  // namespace librarian::agent::tools
