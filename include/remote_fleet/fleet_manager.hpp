// === Fleet Manager ===========================================================
//
// Top-level facade wiring the target registry, connection pool, parallel
// executor, cluster registry, event bus and health monitor together. Owns all
// of them; nothing in the library keeps global mutable state besides the
// shared logger. Lifecycle events are published on the event bus after each
// successful mutation.

#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "remote_fleet/batch.hpp"
#include "remote_fleet/cluster.hpp"
#include "remote_fleet/cluster_health_monitor.hpp"
#include "remote_fleet/cluster_registry.hpp"
#include "remote_fleet/connection_pool.hpp"
#include "remote_fleet/fleet_event_bus.hpp"
#include "remote_fleet/logging.hpp"
#include "remote_fleet/parallel_executor.hpp"
#include "remote_fleet/target_registry.hpp"

namespace remote_fleet {

/** @brief Settings for every component the manager composes. */
struct FleetManagerConfig final {
    PoolConfig pool{};
    ExecutorConfig executor{};
    Duration health_check_interval{Duration{30.0}};   /**< Health monitor poll period. */
    std::size_t event_capacity{1000};                 /**< Undrained events kept before the oldest are dropped. */
};

enum class TargetStatus {
    Online,    /**< A connected pooled session exists. */
    Unknown,   /**< Not contacted recently. */
    Disabled
};

/** @brief Target configuration plus what the pool knows about it. */
struct TargetInfo final {
    TargetConfig config{};
    TargetStatus status{TargetStatus::Unknown};
    std::optional<WallTime> last_activity{};
};

/** @brief Pool-level diagnostics. */
struct ConnectionStats final {
    std::size_t total_targets{};
    std::size_t active_sessions{};
    std::size_t idle_sessions{};
    std::size_t pool_size{};
};

/** @brief Facade over the whole execution core. */
class FleetManager final {
  public:
    FleetManager(FleetManagerConfig config, TransportFactory transport_factory);
    ~FleetManager();

    FleetManager(const FleetManager&) = delete;
    FleetManager& operator=(const FleetManager&) = delete;

    /** @brief Start the pool sweeper and the cluster health monitor. */
    void start();
    /** @brief Stop background work and close every session. Idempotent. */
    void shutdown();

    TargetConfig add_target(TargetConfig config);
    /**
     * @brief Remove a target, drop it from every cluster and close its sessions.
     *
     * Throws NotFoundError for an unknown target and EmptyMembersError when it
     * is the last member of a cluster.
     */
    void remove_target(const std::string& name);
    /** @brief Replace a target's configuration and retire sessions of its old endpoint. */
    TargetConfig update_target(const std::string& name, TargetConfig config);
    [[nodiscard]] std::vector<TargetInfo> list_targets() const;
    [[nodiscard]] TargetInfo get_target(const std::string& name) const;
    /** @brief Try to check out a session; false when the target cannot be reached. */
    [[nodiscard]] bool test_connection(const std::string& name);

    [[nodiscard]] ExecutionResult execute_command(const std::string& target_name, const std::string& command);
    [[nodiscard]] ResultMap execute_on_targets(const std::vector<std::string>& target_names, const std::string& command);
    [[nodiscard]] BatchReport execute_batch(const std::string& batch_name,
                                            const std::vector<std::string>& target_names,
                                            const std::vector<BatchCommand>& commands,
                                            bool stop_on_failure);
    [[nodiscard]] ClusterExecutionReport execute_on_cluster(const std::string& cluster_name, const std::string& command);
    [[nodiscard]] BatchReport execute_batch_on_cluster(const std::string& cluster_name,
                                                       const std::vector<BatchCommand>& commands,
                                                       bool stop_on_failure);

    void upload_file(const std::string& target_name, const std::filesystem::path& local_path, const std::string& remote_path);
    void download_file(const std::string& target_name, const std::string& remote_path, const std::filesystem::path& local_path);
    void create_tunnel(const std::string& target_name, int local_port, const std::string& remote_host, int remote_port);

    Cluster create_cluster(const std::string& name,
                           const std::string& description,
                           const std::vector<std::string>& members,
                           const std::vector<std::string>& tags = {},
                           ClusterConfig config = {});
    void delete_cluster(const std::string& name);
    void add_cluster_member(const std::string& cluster_name, const std::string& target_name);
    void remove_cluster_member(const std::string& cluster_name, const std::string& target_name);
    void update_cluster_config(const std::string& name, ClusterConfig config);
    [[nodiscard]] std::vector<Cluster> list_clusters() const;
    [[nodiscard]] Cluster get_cluster(const std::string& name) const;
    ClusterHealth check_cluster_health(const std::string& name);
    [[nodiscard]] ClusterStatistics cluster_stats() const;

    [[nodiscard]] ConnectionStats connection_stats() const;
    [[nodiscard]] ExecutionStatistics execution_stats() const;

    [[nodiscard]] FleetEventBus& events() noexcept;
    [[nodiscard]] ClusterHealthMonitor& health_monitor() noexcept;
    [[nodiscard]] ParallelExecutor& executor() noexcept;
    [[nodiscard]] const FleetManagerConfig& config() const noexcept;

  private:
    [[nodiscard]] TargetInfo describe(const TargetConfig& config) const;
    /** @brief Resolve an enabled target for a direct session operation. */
    [[nodiscard]] TargetConfig require_enabled(const std::string& name) const;

    FleetManagerConfig config_;
    TargetRegistry targets_;
    ConnectionPool pool_;
    ParallelExecutor executor_;
    ClusterRegistry clusters_;
    FleetEventBus events_;
    ClusterHealthMonitor monitor_;
    /** @brief Held while a target is removed or becomes a cluster member. */
    std::mutex membership_mutex_;
    std::atomic<bool> flag_running_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

[[nodiscard]] std::string_view to_string(TargetStatus status) noexcept;

}  // namespace remote_fleet
