#pragma once

#include <cstddef>
#include <string>

namespace librarian::config {

struct SandboxConfig {
    int timeout_ms = 30000;
    std::size_t max_script_chars = 100000;
    std::size_t memory_limit_bytes = 256 * 1024 * 1024;
    std::size_t max_stack_bytes = 1024 * 1024;
    int max_host_workers = 4;
    bool return_value_compat = true;
};

struct LlmConfig {
    std::string type = "openai";
    std::string api_key;
    std::string base_url;
    std::string model;
    int max_tokens = 1024;
    bool use_proxy = false;
    int timeout_s = 60;
};

struct LoggingConfig {
    std::string level = "info";
};

struct SessionConfig {
    int max_iterations = 10;
    std::size_t stdout_preview_chars = 1000;
};

struct Config {
    std::string working_dir = ".";
    SandboxConfig sandbox;
    LlmConfig llm;
    LoggingConfig logging;
    SessionConfig session;
};

}  // namespace librarian::config
