#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace librarian::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        return fallback;
    }
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadSize(const nlohmann::json& source, const char* key, std::size_t& target) {
    if (source.contains(key) && source[key].is_number_unsigned()) {
        target = source[key].get<std::size_t>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

}  // namespace

std::filesystem::path DefaultConfigPath() {
    return GetHomePath() / ".librarian" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    ReadString(data, "workingDir", config.working_dir);

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadInt(sandbox, "timeoutMs", config.sandbox.timeout_ms);
        ReadSize(sandbox, "maxScriptChars", config.sandbox.max_script_chars);
        ReadSize(sandbox, "memoryLimitBytes", config.sandbox.memory_limit_bytes);
        ReadSize(sandbox, "maxStackBytes", config.sandbox.max_stack_bytes);
        ReadInt(sandbox, "maxHostWorkers", config.sandbox.max_host_workers);
        ReadBool(sandbox, "returnValueCompat", config.sandbox.return_value_compat);
    }

    if (data.contains("llm") && data["llm"].is_object()) {
        const auto& llm = data["llm"];
        ReadString(llm, "type", config.llm.type);
        ReadString(llm, "apiKey", config.llm.api_key);
        ReadString(llm, "baseURL", config.llm.base_url);
        ReadString(llm, "model", config.llm.model);
        ReadInt(llm, "maxTokens", config.llm.max_tokens);
        ReadBool(llm, "useProxy", config.llm.use_proxy);
        ReadInt(llm, "timeoutS", config.llm.timeout_s);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }

    if (data.contains("session") && data["session"].is_object()) {
        const auto& session = data["session"];
        ReadInt(session, "maxIterations", config.session.max_iterations);
        ReadSize(session, "stdoutPreviewChars", config.session.stdout_preview_chars);
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto working_dir = GetEnvFallback("LIBRARIAN_WORKING_DIR", "LIBRARIAN_ROOT");
    if (!working_dir.empty()) {
        config.working_dir = working_dir;
    }

    const auto timeout_ms = GetEnvFallback(
        "LIBRARIAN_SANDBOX__TIMEOUT_MS",
        "LIBRARIAN_SANDBOX_TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        config.sandbox.timeout_ms = ParseInt(timeout_ms, config.sandbox.timeout_ms);
    }

    const auto max_script_chars = GetEnvFallback(
        "LIBRARIAN_SANDBOX__MAX_SCRIPT_CHARS",
        "LIBRARIAN_SANDBOX_MAX_SCRIPT_CHARS");
    if (!max_script_chars.empty()) {
        config.sandbox.max_script_chars = ParseSize(max_script_chars, config.sandbox.max_script_chars);
    }

    const auto memory_limit = GetEnvFallback(
        "LIBRARIAN_SANDBOX__MEMORY_LIMIT_BYTES",
        "LIBRARIAN_SANDBOX_MEMORY_LIMIT_BYTES");
    if (!memory_limit.empty()) {
        config.sandbox.memory_limit_bytes = ParseSize(memory_limit, config.sandbox.memory_limit_bytes);
    }

    const auto host_workers = GetEnvFallback(
        "LIBRARIAN_SANDBOX__MAX_HOST_WORKERS",
        "LIBRARIAN_SANDBOX_MAX_HOST_WORKERS");
    if (!host_workers.empty()) {
        config.sandbox.max_host_workers = ParseInt(host_workers, config.sandbox.max_host_workers);
    }

    const auto return_compat = GetEnvFallback(
        "LIBRARIAN_SANDBOX__RETURN_VALUE_COMPAT",
        "LIBRARIAN_SANDBOX_RETURN_VALUE_COMPAT");
    if (!return_compat.empty()) {
        config.sandbox.return_value_compat = ParseBool(return_compat);
    }

    const auto llm_type = GetEnvFallback("LIBRARIAN_LLM__TYPE", "LIBRARIAN_LLM_TYPE");
    if (!llm_type.empty()) {
        config.llm.type = llm_type;
    }

    const auto api_key = GetEnvFallback("LIBRARIAN_LLM__API_KEY", "LIBRARIAN_API_KEY");
    if (!api_key.empty()) {
        config.llm.api_key = api_key;
    }

    const auto base_url = GetEnvFallback("LIBRARIAN_LLM__BASE_URL", "LIBRARIAN_LLM_BASE_URL");
    if (!base_url.empty()) {
        config.llm.base_url = base_url;
    }

    const auto model = GetEnvFallback("LIBRARIAN_LLM__MODEL", "LIBRARIAN_LLM_MODEL");
    if (!model.empty()) {
        config.llm.model = model;
    }

    const auto max_tokens = GetEnvFallback("LIBRARIAN_LLM__MAX_TOKENS", "LIBRARIAN_LLM_MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.llm.max_tokens = ParseInt(max_tokens, config.llm.max_tokens);
    }

    const auto use_proxy = GetEnvFallback("LIBRARIAN_LLM__USE_PROXY", "LIBRARIAN_LLM_USE_PROXY");
    if (!use_proxy.empty()) {
        config.llm.use_proxy = ParseBool(use_proxy);
    }

    const auto log_level = GetEnvFallback("LIBRARIAN_LOGGING__LEVEL", "LIBRARIAN_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    const auto max_iterations = GetEnvFallback(
        "LIBRARIAN_SESSION__MAX_ITERATIONS",
        "LIBRARIAN_SESSION_MAX_ITERATIONS");
    if (!max_iterations.empty()) {
        config.session.max_iterations = ParseInt(max_iterations, config.session.max_iterations);
    }
}

ConfigLoadResult LoadConfigFrom(const std::filesystem::path& path) {
    ConfigLoadResult result{};
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            result.warnings.push_back("Ignoring unparsable config file: " + path.string());
        } else {
            ApplyConfigFromJson(result.config, data);
        }
    }
    ApplyEnvOverrides(result.config);
    return result;
}

ConfigLoadResult LoadConfig() {
    return LoadConfigFrom(DefaultConfigPath());
}

std::vector<std::string> ValidateConfig(const Config& config) {
    std::vector<std::string> problems;
    const auto& type = config.llm.type;
    if (type != "openai" && type != "anthropic" && type != "google" &&
        type != "openai-compatible" && type != "anthropic-compatible") {
        problems.push_back("llm.type must be one of openai, anthropic, google, "
                           "openai-compatible, anthropic-compatible (got \"" + type + "\")");
    }
    if ((type == "openai-compatible" || type == "anthropic-compatible") && config.llm.base_url.empty()) {
        problems.push_back("llm.baseURL is required for provider type " + type);
    }
    if (config.llm.max_tokens <= 0) {
        problems.push_back("llm.maxTokens must be positive");
    }
    if (config.sandbox.timeout_ms <= 0) {
        problems.push_back("sandbox.timeoutMs must be positive");
    }
    if (config.sandbox.max_host_workers <= 0) {
        problems.push_back("sandbox.maxHostWorkers must be positive");
    }
    if (config.session.max_iterations <= 0) {
        problems.push_back("session.maxIterations must be positive");
    }
    utils::LogLevel level{};
    if (!utils::ParseLogLevel(config.logging.level, level)) {
        problems.push_back("logging.level must be debug, info, warn or error");
    }
    return problems;
}

}  // namespace librarian::config
