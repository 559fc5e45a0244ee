// === Cluster Health Monitor ==================================================
//
// Background loop that checks every cluster once its own health-check interval
// has elapsed and publishes a `health_changed` event whenever the overall
// status of a cluster differs from the previous check. Failures are logged and
// counted; they never leave the loop.

#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "remote_fleet/cluster_registry.hpp"
#include "remote_fleet/fleet_event_bus.hpp"
#include "remote_fleet/logging.hpp"

namespace remote_fleet {

/** @brief Periodic cluster liveness checker. */
class ClusterHealthMonitor final {
  public:
    /** @brief @p poll_interval is how often the loop looks for clusters that are due. */
    ClusterHealthMonitor(ClusterRegistry& clusters, FleetEventBus& events, Duration poll_interval);
    ~ClusterHealthMonitor();

    ClusterHealthMonitor(const ClusterHealthMonitor&) = delete;
    ClusterHealthMonitor& operator=(const ClusterHealthMonitor&) = delete;

    /** @brief Start the background loop. Idempotent. */
    void start();
    /** @brief Stop and join the background loop. Idempotent. */
    void stop();
    [[nodiscard]] bool running() const noexcept;

    /**
     * @brief Probe every cluster that is due at @p now. Returns the number checked.
     *
     * State kept for clusters that no longer exist is dropped first, so a
     * re-created cluster starts over with an immediate check.
     */
    std::size_t run_once(TimePoint now);
    /** @brief Probes that ended in an exception since construction. */
    [[nodiscard]] std::size_t error_count() const noexcept;
    /** @brief Drop the schedule and last status kept for @p cluster_name. */
    void forget_cluster(const std::string& cluster_name);
    /** @brief Clusters the monitor currently keeps scheduling state for. */
    [[nodiscard]] std::size_t tracked_cluster_count();

  private:
    void monitor_loop();

    ClusterRegistry& clusters_;
    FleetEventBus& events_;
    Duration poll_interval_;
    std::mutex state_mutex_;
    std::map<std::string, TimePoint> map_next_due_;
    std::map<std::string, ClusterStatus> map_last_status_;
    std::atomic<std::size_t> error_count_{0};

    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool flag_stop_{false};
    std::atomic<bool> flag_running_{false};
    std::thread monitor_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace remote_fleet
