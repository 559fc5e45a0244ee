// === Cluster =================================================================
//
// Named groups of targets and the value types produced when a command or a
// health check is run across one: the per-cluster execution report and the
// aggregated health snapshot.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remote_fleet/execution_result.hpp"
#include "remote_fleet/types.hpp"

namespace remote_fleet {

/** @brief Aggregate availability of a cluster. */
enum class ClusterStatus {
    Online,    /**< Every member answered. */
    Degraded,  /**< Some members answered. */
    Offline    /**< No member answered. */
};

/** @brief Health snapshot produced by a liveness check across all members. */
struct ClusterHealth final {
    std::size_t online_targets{};
    std::size_t offline_targets{};
    std::size_t total_targets{};
    double healthy_percent{};                    /**< online / total x 100. */
    ClusterStatus overall_status{ClusterStatus::Offline};
    Duration response_time{};                    /**< Mean duration of the check results. */
    WallTime checked_at{};

    /** @brief One-line human readable verdict. */
    [[nodiscard]] std::string summary() const;
};

/** @brief Per-cluster execution policy. */
struct ClusterConfig final {
    Duration health_check_interval{Duration{30.0}};
    Duration command_timeout{Duration{60.0}};
    std::size_t max_concurrency{10};
    int retry_attempts{3};
    Duration retry_delay{Duration{5.0}};
};

/** @brief A named group of registered targets. */
struct Cluster final {
    std::string name{};
    std::string description{};
    std::vector<std::string> members{};          /**< Target names, insertion order. */
    std::vector<std::string> tags{};
    WallTime created_at{};
    WallTime updated_at{};
    std::optional<ClusterHealth> last_health{};  /**< Empty until the first health check. */
    ClusterConfig config{};
};

/** @brief Result of running one command across every member of a cluster. */
struct ClusterExecutionReport final {
    std::string cluster_name{};
    std::string command{};
    ResultMap results{};
    std::size_t total_targets{};
    std::size_t successful_count{};
    std::size_t failed_count{};
    Duration average_duration{};
    WallTime executed_at{};

    /** @brief successful / total x 100; 0 for an empty report. */
    [[nodiscard]] double success_rate() const noexcept;
    /** @brief Members with a non-zero exit code, sorted. */
    [[nodiscard]] std::vector<std::string> failed_targets() const;
    /** @brief Members with a zero exit code, sorted. */
    [[nodiscard]] std::vector<std::string> successful_targets() const;
};

/** @brief Counts across the registry, derived on demand. */
struct ClusterStatistics final {
    std::size_t total_clusters{};
    std::size_t total_members{};
    std::size_t online{};
    std::size_t degraded{};
    std::size_t offline{};
    std::size_t unchecked{};                     /**< Clusters never health-checked. */
};

/**
 * @brief Fold liveness check results into a health snapshot.
 *
 * A member is online when its exit code is zero.
 */
[[nodiscard]] ClusterHealth compute_cluster_health(const ResultMap& results);

/** @brief Build an execution report from the results of one fan-out. */
[[nodiscard]] ClusterExecutionReport make_cluster_report(std::string cluster_name, std::string command, ResultMap results);

[[nodiscard]] std::string_view to_string(ClusterStatus status) noexcept;

}  // namespace remote_fleet
