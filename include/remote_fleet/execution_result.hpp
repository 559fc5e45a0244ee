// === Execution Result ========================================================
//
// Value type describing the outcome of one command on one target, plus the
// ordered per-target map every fan-out returns.

#pragma once

#include <map>
#include <string>
#include <string_view>

#include "remote_fleet/types.hpp"

namespace remote_fleet {

/**
 * @brief Distinguishes how far an execution got.
 *
 * A non-zero exit code is still `Completed`: the command ran and reported a
 * failure. The other values mean the command never produced an exit code and
 * carry exit code k_exit_code_not_run.
 */
enum class ExecutionOutcome {
    Completed,         /**< The transport returned an exit code. */
    ConnectionFailed,  /**< No session could be established after all retries. */
    Cancelled,         /**< The shared deadline elapsed first. */
    Disabled,          /**< The target is disabled and was not contacted. */
    TransportError     /**< The transport failed for a reason other than the connection. */
};

inline constexpr int k_exit_code_not_run{-1};

/**
 * @brief Outcome of running one command on one target.
 *
 * Immutable once returned by the executor. `success` is true exactly when the
 * exit code is zero and the error text is empty.
 */
struct ExecutionResult final {
    std::string target{};                                    /**< Target name. */
    std::string command{};                                   /**< Command text as submitted. */
    std::string output{};                                    /**< Captured standard output. */
    std::string error{};                                     /**< Error text; empty on success. */
    int exit_code{k_exit_code_not_run};                      /**< Remote exit status. */
    Duration duration{};                                     /**< Wall time spent on the execution. */
    WallTime timestamp{};                                    /**< Completion time. */
    bool success{false};                                     /**< Derived from exit code and error. */
    ExecutionOutcome outcome{ExecutionOutcome::Completed};  /**< How far the execution got. */
    int attempts{0};                                         /**< Connection attempts consumed. */
};

/** @brief Per-target results, ordered by target name. */
using ResultMap = std::map<std::string, ExecutionResult>;

/**
 * @brief Build the result of a command that ran to completion.
 */
[[nodiscard]] ExecutionResult make_completed_result(std::string target,
                                                    std::string command,
                                                    std::string output,
                                                    std::string error,
                                                    int exit_code,
                                                    Duration duration);

/**
 * @brief Build the result of a command that never produced an exit code.
 */
[[nodiscard]] ExecutionResult make_unrun_result(std::string target,
                                                std::string command,
                                                ExecutionOutcome outcome,
                                                std::string error);

[[nodiscard]] std::string_view to_string(ExecutionOutcome outcome) noexcept;

}  // namespace remote_fleet
