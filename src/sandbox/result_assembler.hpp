#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/execution_context.hpp"

namespace librarian::sandbox {

// Everything a run produced, before normalisation.
struct RunOutcome {
    std::vector<std::string> stdout_lines;
    // Post-run snapshot; empty when the snapshot itself failed.
    std::optional<nlohmann::json> buffers;
    nlohmann::json seed_buffers = nlohmann::json::object();
    std::optional<std::string> final_answer;
    std::optional<nlohmann::json> return_value;
    bool return_value_compat = true;
    ErrorKind error_kind = ErrorKind::kNone;
    std::string error_message;
};

ExecutionResult AssembleResult(RunOutcome outcome);

}  // namespace librarian::sandbox
