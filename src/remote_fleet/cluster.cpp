#include "remote_fleet/cluster.hpp"

#include <fmt/format.h>

namespace remote_fleet {

namespace {
constexpr double k_healthy_threshold_percent{90.0};
constexpr double k_issues_threshold_percent{70.0};

Duration mean_duration(const ResultMap& results) {
    if (results.empty()) {
        return Duration{};
    }
    Duration total{};
    for (const auto& [name, result] : results) {
        total += result.duration;
    }
    return total / static_cast<double>(results.size());
}
}  // namespace

std::string ClusterHealth::summary() const {
    const std::string counts = fmt::format("{}/{} targets online", online_targets, total_targets);
    if (healthy_percent >= k_healthy_threshold_percent) {
        return fmt::format("Cluster is healthy ({})", counts);
    }
    if (healthy_percent >= k_issues_threshold_percent) {
        return fmt::format("Cluster has some issues ({})", counts);
    }
    return fmt::format("Cluster has serious issues ({})", counts);
}

double ClusterExecutionReport::success_rate() const noexcept {
    if (total_targets == 0) {
        return 0.0;
    }
    return static_cast<double>(successful_count) / static_cast<double>(total_targets) * 100.0;
}

std::vector<std::string> ClusterExecutionReport::failed_targets() const {
    std::vector<std::string> list_names;
    for (const auto& [name, result] : results) {
        if (result.exit_code != 0) {
            list_names.push_back(name);
        }
    }
    return list_names;
}

std::vector<std::string> ClusterExecutionReport::successful_targets() const {
    std::vector<std::string> list_names;
    for (const auto& [name, result] : results) {
        if (result.exit_code == 0) {
            list_names.push_back(name);
        }
    }
    return list_names;
}

ClusterHealth compute_cluster_health(const ResultMap& results) {
    ClusterHealth health{};
    health.total_targets = results.size();
    for (const auto& [name, result] : results) {
        if (result.exit_code == 0) {
            ++health.online_targets;
        }
    }
    health.offline_targets = health.total_targets - health.online_targets;
    if (health.total_targets > 0) {
        health.healthy_percent = static_cast<double>(health.online_targets) / static_cast<double>(health.total_targets) * 100.0;
    }
    if (health.total_targets > 0 && health.online_targets == health.total_targets) {
        health.overall_status = ClusterStatus::Online;
    } else if (health.online_targets == 0) {
        health.overall_status = ClusterStatus::Offline;
    } else {
        health.overall_status = ClusterStatus::Degraded;
    }
    health.response_time = mean_duration(results);
    health.checked_at = SystemClock::now();
    return health;
}

ClusterExecutionReport make_cluster_report(std::string cluster_name, std::string command, ResultMap results) {
    ClusterExecutionReport report{};
    report.cluster_name = std::move(cluster_name);
    report.command = std::move(command);
    report.total_targets = results.size();
    for (const auto& [name, result] : results) {
        if (result.exit_code == 0) {
            ++report.successful_count;
        } else {
            ++report.failed_count;
        }
    }
    report.average_duration = mean_duration(results);
    report.results = std::move(results);
    report.executed_at = SystemClock::now();
    return report;
}

std::string_view to_string(ClusterStatus status) noexcept {
    switch (status) {
        case ClusterStatus::Online:
            return "online";
        case ClusterStatus::Degraded:
            return "degraded";
        case ClusterStatus::Offline:
            return "offline";
    }
    return "unknown";
}

}  // namespace remote_fleet
