#pragma once

#include <functional>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace librarian::sandbox {

// Buffer key that receives the script's implicit return value.
inline constexpr const char* kReturnValueKey = "__returnValue";

inline constexpr const char* kTimeoutMessage = "Script execution timed out";

// Stateless semantic sub-query: (instruction, data) -> annotated answer.
// Throwing rejects the promise seen by the script.
using LlmQuery = std::function<std::string(const std::string& instruction, const std::string& data)>;

struct ExecutionContext {
    std::optional<std::string> corpus;
    nlohmann::json buffers = nlohmann::json::object();
    std::function<void(const std::string& output)> on_print;
    std::function<void(const std::string& answer)> on_final;
    std::function<void(const std::string& name)> on_final_var;
};

enum class ErrorKind {
    kNone,
    kSyntax,
    kRuntime,
    kTimeout,
    kInvalidInput,
    kInternal
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kSyntax: return "syntax";
        case ErrorKind::kRuntime: return "runtime";
        case ErrorKind::kTimeout: return "timeout";
        case ErrorKind::kInvalidInput: return "invalid_input";
        case ErrorKind::kInternal: return "internal";
    }
    return "unknown";
}

struct ExecutionResult {
    std::string stdout_text;
    nlohmann::json buffers = nlohmann::json::object();
    std::optional<std::string> final_answer;
    std::optional<std::string> error;
    ErrorKind error_kind = ErrorKind::kNone;

    bool Ok() const { return !error.has_value(); }
};

nlohmann::json ToJson(const ExecutionResult& result);

}  // namespace librarian::sandbox
