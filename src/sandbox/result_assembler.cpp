#include "sandbox/result_assembler.hpp"

#include "utils/common.hpp"

namespace librarian::sandbox {

ExecutionResult AssembleResult(RunOutcome outcome) {
    ExecutionResult result{};
    result.stdout_text = utils::Join(outcome.stdout_lines, "\n");

    if (outcome.buffers && outcome.buffers->is_object()) {
        result.buffers = std::move(*outcome.buffers);
    } else {
        result.buffers = outcome.seed_buffers.is_object()
            ? std::move(outcome.seed_buffers)
            : nlohmann::json::object();
    }

    if (outcome.error_kind == ErrorKind::kNone) {
        if (outcome.return_value_compat && outcome.return_value) {
            result.buffers[kReturnValueKey] = std::move(*outcome.return_value);
        }
    } else {
        result.error_kind = outcome.error_kind;
        result.error = outcome.error_kind == ErrorKind::kTimeout
            ? std::string(kTimeoutMessage)
            : std::move(outcome.error_message);
    }

    // A final answer set before a failure is still reported.
    result.final_answer = std::move(outcome.final_answer);
    return result;
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json json = {
        {"stdout", result.stdout_text},
        {"buffers", result.buffers}
    };
    if (result.final_answer) {
        json["finalAnswer"] = *result.final_answer;
    }
    if (result.error) {
        json["error"] = *result.error;
        json["errorKind"] = ToString(result.error_kind);
    }
    return json;
}

}  // namespace librarian::sandbox
