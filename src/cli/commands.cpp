#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "agent/tools/research_repository.hpp"
#include "agent/tools/tool_registry.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "providers/llm_provider.hpp"
#include "providers/semantic_bridge.hpp"
#include "repo/repo_api.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string command;
    std::string script_path;
    std::optional<std::string> root;
    std::optional<std::string> context_path;
    std::optional<std::string> buffers_path;
    std::optional<int> timeout_ms;
    bool no_llm = false;
};

void PrintUsage() {
    std::cerr << "Usage:\n"
              << "  librarian-sandbox run <script-file> [--root DIR] [--context FILE] [--buffers FILE]"
                 " [--timeout-ms N] [--no-llm]\n"
              << "  librarian-sandbox tool <script-file> [--root DIR] [--no-llm]\n"
              << "  librarian-sandbox config" << std::endl;
}

bool ParseArgs(int argc, char** argv, CliOptions& options, std::string& error) {
    if (argc < 2) {
        error = "missing command";
        return false;
    }
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "--root") {
            if (!next(value)) return false;
            options.root = value;
        } else if (arg == "--context") {
            if (!next(value)) return false;
            options.context_path = value;
        } else if (arg == "--buffers") {
            if (!next(value)) return false;
            options.buffers_path = value;
        } else if (arg == "--timeout-ms") {
            if (!next(value)) return false;
            try {
                options.timeout_ms = std::stoi(value);
            } catch (const std::exception&) {
                error = "--timeout-ms expects an integer";
                return false;
            }
            if (*options.timeout_ms <= 0) {
                error = "--timeout-ms must be positive";
                return false;
            }
        } else if (arg == "--no-llm") {
            options.no_llm = true;
        } else if (!arg.empty() && arg[0] == '-') {
            error = "unknown option " + arg;
            return false;
        } else if (options.script_path.empty()) {
            options.script_path = arg;
        } else {
            error = "unexpected argument " + arg;
            return false;
        }
    }
    if ((options.command == "run" || options.command == "tool") && options.script_path.empty()) {
        error = options.command + " requires a script file";
        return false;
    }
    return true;
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::shared_ptr<librarian::utils::LogSink> MakeSink(const librarian::config::Config& config) {
    librarian::utils::LogConfig log_config{};
    librarian::utils::ParseLogLevel(config.logging.level, log_config.min_level);
    return std::make_shared<librarian::utils::StderrLogSink>(log_config);
}

// Empty when disabled or no credentials are configured; scripts then see
// llm_query reject.
librarian::sandbox::LlmQuery MakeQuery(const librarian::config::Config& config,
                                       bool disabled,
                                       const std::shared_ptr<librarian::utils::LogSink>& sink) {
    if (disabled || (config.llm.api_key.empty() && config.llm.base_url.empty())) {
        return {};
    }
    std::shared_ptr<librarian::providers::LLMProvider> provider =
        librarian::providers::CreateProvider(config.llm, sink);
    return librarian::providers::MakeLlmQuery(provider, config.llm.model, config.llm.max_tokens, sink);
}

int RunScript(const CliOptions& options, librarian::config::Config config) {
    auto sink = MakeSink(config);
    const auto script = ReadFile(options.script_path);
    if (!script) {
        std::cerr << "Error: cannot read script file " << options.script_path << std::endl;
        return kExitUsage;
    }

    librarian::sandbox::ExecutionContext context{};
    if (options.context_path) {
        context.corpus = ReadFile(*options.context_path);
        if (!context.corpus) {
            std::cerr << "Error: cannot read context file " << *options.context_path << std::endl;
            return kExitUsage;
        }
    }
    if (options.buffers_path) {
        const auto text = ReadFile(*options.buffers_path);
        auto buffers = text ? nlohmann::json::parse(*text, nullptr, false) : nlohmann::json();
        if (!buffers.is_object()) {
            std::cerr << "Error: buffers file must contain a JSON object" << std::endl;
            return kExitUsage;
        }
        context.buffers = std::move(buffers);
    }
    if (options.timeout_ms) {
        config.sandbox.timeout_ms = *options.timeout_ms;
    }

    std::shared_ptr<librarian::repo::RepoApi> repo;
    librarian::sandbox::LlmQuery query;
    try {
        repo = librarian::repo::RepoApi::ForDirectory(options.root.value_or(config.working_dir), sink);
        query = MakeQuery(config, options.no_llm, sink);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return kExitUsage;
    }

    const librarian::sandbox::SandboxRuntime runtime(
        librarian::sandbox::SandboxOptions::FromConfig(config.sandbox), sink);
    const auto result = runtime.Execute(*script, repo, query, context);
    std::cout << librarian::sandbox::ToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return result.Ok() ? kExitOk : kExitFailed;
}

int RunTool(const CliOptions& options, const librarian::config::Config& config) {
    auto sink = MakeSink(config);
    const auto script = ReadFile(options.script_path);
    if (!script) {
        std::cerr << "Error: cannot read script file " << options.script_path << std::endl;
        return kExitUsage;
    }

    librarian::sandbox::LlmQuery query;
    try {
        query = MakeQuery(config, options.no_llm, sink);
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return kExitUsage;
    }

    std::shared_ptr<const librarian::sandbox::SandboxRuntime> runtime =
        std::make_shared<librarian::sandbox::SandboxRuntime>(
            librarian::sandbox::SandboxOptions::FromConfig(config.sandbox), sink);
    librarian::agent::tools::ToolRegistry registry(sink);
    registry.Register(std::make_unique<librarian::agent::tools::ResearchRepositoryTool>(
        runtime, options.root.value_or(config.working_dir), query, sink));

    const auto output = registry.Execute("research_repository", {{"script", *script}});
    std::cout << output << std::endl;
    const bool failed = output.rfind("Error:", 0) == 0 || output.rfind("Script execution error:", 0) == 0;
    return failed ? kExitFailed : kExitOk;
}

int ShowConfig(const librarian::config::Config& config, const std::vector<std::string>& warnings) {
    nlohmann::json json = {
        {"workingDir", config.working_dir},
        {"sandbox", {
            {"timeoutMs", config.sandbox.timeout_ms},
            {"maxScriptChars", config.sandbox.max_script_chars},
            {"memoryLimitBytes", config.sandbox.memory_limit_bytes},
            {"maxStackBytes", config.sandbox.max_stack_bytes},
            {"maxHostWorkers", config.sandbox.max_host_workers},
            {"returnValueCompat", config.sandbox.return_value_compat}
        }},
        {"llm", {
            {"type", config.llm.type},
            {"apiKey", config.llm.api_key.empty() ? "" : librarian::utils::MaskKey(config.llm.api_key)},
            {"baseURL", config.llm.base_url},
            {"model", config.llm.model},
            {"maxTokens", config.llm.max_tokens},
            {"useProxy", config.llm.use_proxy},
            {"timeoutS", config.llm.timeout_s}
        }},
        {"logging", {{"level", config.logging.level}}},
        {"session", {
            {"maxIterations", config.session.max_iterations},
            {"stdoutPreviewChars", config.session.stdout_preview_chars}
        }}
    };
    std::cout << json.dump(2) << std::endl;

    for (const auto& warning : warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    const auto problems = librarian::config::ValidateConfig(config);
    for (const auto& problem : problems) {
        std::cerr << "Invalid: " << problem << std::endl;
    }
    return problems.empty() ? kExitOk : kExitFailed;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    std::string error;
    if (!ParseArgs(argc, argv, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        PrintUsage();
        return kExitUsage;
    }

    auto loaded = librarian::config::LoadConfig();
    if (options.command == "config") {
        return ShowConfig(loaded.config, loaded.warnings);
    }
    for (const auto& warning : loaded.warnings) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    if (options.command == "run") {
        return RunScript(options, loaded.config);
    }
    if (options.command == "tool") {
        return RunTool(options, loaded.config);
    }

    std::cerr << "Error: unknown command " << options.command << std::endl;
    PrintUsage();
    return kExitUsage;
}
