#include "remote_fleet/execution_result.hpp"

#include <utility>

namespace remote_fleet {

ExecutionResult make_completed_result(std::string target,
                                      std::string command,
                                      std::string output,
                                      std::string error,
                                      int exit_code,
                                      Duration duration) {
    ExecutionResult result{};
    result.target = std::move(target);
    result.command = std::move(command);
    result.output = std::move(output);
    result.error = std::move(error);
    result.exit_code = exit_code;
    result.duration = duration;
    result.timestamp = SystemClock::now();
    result.success = result.exit_code == 0 && result.error.empty();
    result.outcome = ExecutionOutcome::Completed;
    return result;
}

ExecutionResult make_unrun_result(std::string target,
                                  std::string command,
                                  ExecutionOutcome outcome,
                                  std::string error) {
    ExecutionResult result{};
    result.target = std::move(target);
    result.command = std::move(command);
    result.error = std::move(error);
    result.exit_code = k_exit_code_not_run;
    result.timestamp = SystemClock::now();
    result.success = false;
    result.outcome = outcome;
    return result;
}

std::string_view to_string(ExecutionOutcome outcome) noexcept {
    switch (outcome) {
        case ExecutionOutcome::Completed:
            return "completed";
        case ExecutionOutcome::ConnectionFailed:
            return "connection_failed";
        case ExecutionOutcome::Cancelled:
            return "cancelled";
        case ExecutionOutcome::Disabled:
            return "disabled";
        case ExecutionOutcome::TransportError:
            return "transport_error";
    }
    return "unknown";
}

}  // namespace remote_fleet
