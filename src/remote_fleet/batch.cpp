#include "remote_fleet/batch.hpp"

#include <set>

#include <fmt/format.h>

namespace remote_fleet {

namespace {
double percent(std::size_t part, std::size_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}
}  // namespace

BatchStatistics BatchReport::overall_stats() const {
    BatchStatistics stats{};
    stats.total_commands = results.size();
    stats.total_targets = total_targets;
    stats.duration = duration;
    stats.completed = completed;
    for (const auto& [command_name, command_results] : results) {
        for (const auto& [target_name, result] : command_results) {
            ++stats.total_executions;
            if (result.exit_code == 0) {
                ++stats.successful_executions;
            } else {
                ++stats.failed_executions;
            }
        }
    }
    stats.success_rate = percent(stats.successful_executions, stats.total_executions);
    return stats;
}

std::vector<std::string> BatchReport::failed_targets() const {
    std::set<std::string> set_failed;
    for (const auto& [command_name, command_results] : results) {
        for (const auto& [target_name, result] : command_results) {
            if (result.exit_code != 0) {
                set_failed.insert(target_name);
            }
        }
    }
    return {set_failed.begin(), set_failed.end()};
}

std::map<std::string, CommandStatistics> BatchReport::command_stats() const {
    std::map<std::string, CommandStatistics> map_stats;
    for (const auto& [command_name, command_results] : results) {
        CommandStatistics stats{};
        Duration total_duration{};
        for (const auto& [target_name, result] : command_results) {
            if (result.exit_code == 0) {
                ++stats.successful_count;
            } else {
                ++stats.failed_count;
            }
            total_duration += result.duration;
        }
        const std::size_t result_count = command_results.size();
        if (result_count > 0) {
            stats.average_duration = total_duration / static_cast<double>(result_count);
        }
        stats.success_rate = percent(stats.successful_count, result_count);
        map_stats.emplace(command_name, stats);
    }
    return map_stats;
}

std::string batch_command_name(const BatchCommand& command, std::size_t index) {
    if (!command.name.empty()) {
        return command.name;
    }
    return fmt::format("command_{}", index + 1);
}

}  // namespace remote_fleet
