#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "repo/repo_api.hpp"
#include "sandbox/execution_context.hpp"
#include "utils/logging.hpp"

namespace librarian::sandbox {

struct SandboxOptions {
    std::chrono::milliseconds timeout{30000};
    std::size_t max_script_chars = 100000;
    std::size_t memory_limit_bytes = 256 * 1024 * 1024;
    std::size_t max_stack_bytes = 1024 * 1024;
    std::size_t max_host_workers = 4;
    bool return_value_compat = true;

    static SandboxOptions FromConfig(const config::SandboxConfig& config);
};

// Evaluates untrusted scripts in a fresh QuickJS isolate per call. The
// script body runs as an async function; repo.* and llm_query are its only
// ways out. Execute never throws for script-caused failures.
class SandboxRuntime {
public:
    explicit SandboxRuntime(SandboxOptions options = {},
                            std::shared_ptr<utils::LogSink> sink = nullptr);

    ExecutionResult Execute(const std::string& script,
                            std::shared_ptr<repo::RepoApi> repo,
                            LlmQuery llm_query,
                            const ExecutionContext& context) const;

    const SandboxOptions& Options() const { return options_; }

private:
    SandboxOptions options_;
    std::shared_ptr<utils::LogSink> sink_;
};

}  // namespace librarian::sandbox
