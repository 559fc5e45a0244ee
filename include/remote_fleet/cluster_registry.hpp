// === Cluster Registry ========================================================
//
// Owns every Cluster and its last health snapshot. Membership is validated
// against the TargetRegistry; command execution and liveness checks are
// delegated to the ParallelExecutor. The registry lock is never held while a
// fan-out is running.

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "remote_fleet/batch.hpp"
#include "remote_fleet/cluster.hpp"
#include "remote_fleet/logging.hpp"
#include "remote_fleet/parallel_executor.hpp"
#include "remote_fleet/target_registry.hpp"

namespace remote_fleet {

inline constexpr char k_health_check_command[] = "echo 'health_check'";

/** @brief Thread-safe registry of clusters keyed by name. */
class ClusterRegistry final {
  public:
    ClusterRegistry(const TargetRegistry& targets, ParallelExecutor& executor);

    /**
     * @brief Create a cluster over registered targets.
     *
     * Throws ValidationError for an empty name or a repeated member,
     * EmptyMembersError without members, DuplicateNameError if the name is
     * taken and NotFoundError for an unregistered member.
     */
    Cluster create_cluster(const std::string& name,
                           const std::string& description,
                           const std::vector<std::string>& members,
                           const std::vector<std::string>& tags = {},
                           ClusterConfig config = {});
    /** @brief Remove @p name and return it. Throws NotFoundError. */
    Cluster delete_cluster(const std::string& name);
    /** @brief Throws NotFoundError or DuplicateMemberError. */
    void add_member(const std::string& cluster_name, const std::string& target_name);
    /**
     * @brief Throws NotFoundError when either name is unknown to the cluster and
     * EmptyMembersError when @p target_name is the last member.
     */
    void remove_member(const std::string& cluster_name, const std::string& target_name);
    void update_cluster_config(const std::string& name, ClusterConfig config);

    /** @brief All clusters sorted by name. */
    [[nodiscard]] std::vector<Cluster> list_clusters() const;
    /** @brief Throws NotFoundError. */
    [[nodiscard]] Cluster get_cluster(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> cluster_names() const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const;

    /** @brief Run @p command on every member with the cluster's concurrency and timeout. */
    [[nodiscard]] ClusterExecutionReport execute_on_cluster(const std::string& name, const std::string& command);
    /** @brief Run @p commands in order on every member. */
    [[nodiscard]] BatchReport execute_batch_on_cluster(const std::string& name,
                                                       const std::vector<BatchCommand>& commands,
                                                       bool stop_on_failure);
    /** @brief Probe every member and overwrite the stored snapshot. */
    ClusterHealth check_cluster_health(const std::string& name);
    [[nodiscard]] ClusterStatistics cluster_stats() const;

    /** @brief Clusters in which @p target_name is the only member, sorted. */
    [[nodiscard]] std::vector<std::string> clusters_where_sole_member(const std::string& target_name) const;
    /**
     * @brief Drop @p target_name from every cluster that lists it.
     *
     * Returns the affected cluster names. Throws EmptyMembersError, changing
     * nothing, when that would leave a cluster without members.
     */
    std::vector<std::string> remove_target_everywhere(const std::string& target_name);

  private:
    [[nodiscard]] std::vector<TargetConfig> resolve_members(const Cluster& cluster) const;

    const TargetRegistry& targets_;
    ParallelExecutor& executor_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Cluster> map_clusters_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace remote_fleet
