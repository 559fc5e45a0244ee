// === Batch Execution =========================================================
//
// Input and output types for running an ordered list of commands across a
// target set. The report keeps results per command, per target, and offers the
// derived statistics callers print after a run.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "remote_fleet/execution_result.hpp"
#include "remote_fleet/target_config.hpp"

namespace remote_fleet {

/** @brief One named step of a batch. */
struct BatchCommand final {
    std::string name{};                    /**< Step name; defaults to `command_<n>`. */
    std::string command{};                 /**< Command text. */
    std::string description{};
    std::optional<Duration> timeout{};     /**< Overrides the executor deadline for this step. */
};

/** @brief An ordered list of commands to run across a target set. */
struct BatchSpec final {
    std::string name{};
    std::string description{};
    std::vector<TargetConfig> targets{};
    std::vector<BatchCommand> commands{};
    bool stop_on_failure{false};           /**< Halt after the first step with a non-zero exit code. */
};

/** @brief Totals across every step that ran. */
struct BatchStatistics final {
    std::size_t total_commands{};
    std::size_t total_targets{};
    std::size_t total_executions{};
    std::size_t successful_executions{};
    std::size_t failed_executions{};
    double success_rate{};                 /**< Percent, 0..100. */
    Duration duration{};
    bool completed{};
};

/** @brief Totals for a single step. */
struct CommandStatistics final {
    std::size_t successful_count{};
    std::size_t failed_count{};
    double success_rate{};                 /**< Percent, 0..100. */
    Duration average_duration{};
};

/**
 * @brief Outcome of a batch run.
 *
 * `results` holds only steps that ran. When `completed` is false, `failed_at`
 * names the step that triggered the stop.
 */
struct BatchReport final {
    std::string batch_name{};
    std::size_t total_targets{};
    std::map<std::string, ResultMap> results{};
    std::vector<std::string> command_order{};   /**< Step names in execution order. */
    WallTime start_time{};
    Duration duration{};
    bool completed{false};
    std::optional<std::string> failed_at{};

    [[nodiscard]] BatchStatistics overall_stats() const;
    /** @brief Targets with a non-zero exit code in any step, sorted. */
    [[nodiscard]] std::vector<std::string> failed_targets() const;
    [[nodiscard]] std::map<std::string, CommandStatistics> command_stats() const;
};

/** @brief Step name used in reports: the given name, or `command_<index + 1>`. */
[[nodiscard]] std::string batch_command_name(const BatchCommand& command, std::size_t index);

}  // namespace remote_fleet
