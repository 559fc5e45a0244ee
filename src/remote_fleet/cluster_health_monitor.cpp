#include "remote_fleet/cluster_health_monitor.hpp"

#include <set>
#include <vector>

#include <fmt/format.h>

#include "remote_fleet/errors.hpp"

namespace remote_fleet {

ClusterHealthMonitor::ClusterHealthMonitor(ClusterRegistry& clusters, FleetEventBus& events, Duration poll_interval)
    : clusters_(clusters),
      events_(events),
      poll_interval_(poll_interval),
      logger_(get_logger()) {
    if (!is_valid_duration(poll_interval_)) {
        throw ValidationError(fmt::format("health monitor poll interval must be positive and at most {}s", k_max_duration.count()));
    }
}

ClusterHealthMonitor::~ClusterHealthMonitor() {
    stop();
}

void ClusterHealthMonitor::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    {
        std::scoped_lock lock(loop_mutex_);
        flag_stop_ = false;
    }
    logger_->info("Starting cluster health monitor (poll every {}s)", poll_interval_.count());
    monitor_thread_ = std::thread(&ClusterHealthMonitor::monitor_loop, this);
}

void ClusterHealthMonitor::stop() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(loop_mutex_);
        flag_stop_ = true;
    }
    loop_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    logger_->info("Cluster health monitor stopped");
}

bool ClusterHealthMonitor::running() const noexcept {
    return flag_running_.load();
}

std::size_t ClusterHealthMonitor::run_once(TimePoint now) {
    std::vector<Cluster> list_due;
    {
        std::vector<Cluster> list_clusters = clusters_.list_clusters();
        std::set<std::string> set_names;
        for (const Cluster& cluster : list_clusters) {
            set_names.insert(cluster.name);
        }

        std::scoped_lock lock(state_mutex_);
        std::erase_if(map_next_due_, [&set_names](const auto& entry) { return set_names.count(entry.first) == 0; });
        std::erase_if(map_last_status_, [&set_names](const auto& entry) { return set_names.count(entry.first) == 0; });
        for (Cluster& cluster : list_clusters) {
            auto iterator_due = map_next_due_.find(cluster.name);
            if (iterator_due != map_next_due_.end() && iterator_due->second > now) {
                continue;
            }
            map_next_due_[cluster.name] = now + to_steady_duration(cluster.config.health_check_interval);
            list_due.push_back(std::move(cluster));
        }
    }

    std::size_t checked = 0;
    for (const Cluster& cluster : list_due) {
        try {
            const ClusterHealth health = clusters_.check_cluster_health(cluster.name);
            ++checked;

            bool changed = false;
            {
                std::scoped_lock lock(state_mutex_);
                auto iterator_status = map_last_status_.find(cluster.name);
                changed = iterator_status == map_last_status_.end() || iterator_status->second != health.overall_status;
                map_last_status_[cluster.name] = health.overall_status;
            }
            if (changed) {
                events_.publish(FleetEventType::HealthChanged,
                                cluster.name,
                                fmt::format("{}: {}", to_string(health.overall_status), health.summary()));
            }
        } catch (const std::exception& exc) {
            ++error_count_;
            logger_->error(R"({{"component":"health_monitor","cluster":"{}","error":"{}"}})", json_escape(cluster.name), json_escape(exc.what()));
        }
    }
    return checked;
}

std::size_t ClusterHealthMonitor::error_count() const noexcept {
    return error_count_.load();
}

void ClusterHealthMonitor::forget_cluster(const std::string& cluster_name) {
    std::scoped_lock lock(state_mutex_);
    map_next_due_.erase(cluster_name);
    map_last_status_.erase(cluster_name);
}

std::size_t ClusterHealthMonitor::tracked_cluster_count() {
    std::scoped_lock lock(state_mutex_);
    return map_next_due_.size();
}

void ClusterHealthMonitor::monitor_loop() {
    const SteadyClock::duration steady_poll_interval = to_steady_duration(poll_interval_);
    std::unique_lock lock(loop_mutex_);
    while (!flag_stop_) {
        lock.unlock();
        run_once(SteadyClock::now());
        lock.lock();
        loop_cv_.wait_for(lock, steady_poll_interval, [this]() { return flag_stop_; });
    }
}

}  // namespace remote_fleet
