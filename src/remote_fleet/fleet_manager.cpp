#include "remote_fleet/fleet_manager.hpp"

#include <mutex>
#include <utility>

#include <fmt/format.h>

#include "remote_fleet/errors.hpp"

namespace remote_fleet {

namespace {
constexpr int k_max_port{65535};

WallTime to_wall_time(TimePoint steady_time) {
    const auto age = SteadyClock::now() - steady_time;
    return SystemClock::now() - std::chrono::duration_cast<SystemClock::duration>(age);
}

void validate_port(int port, const char* label) {
    if (port < 1 || port > k_max_port) {
        throw ValidationError(fmt::format("{} {} is outside 1..{}", label, port, k_max_port));
    }
}
}  // namespace

FleetManager::FleetManager(FleetManagerConfig config, TransportFactory transport_factory)
    : config_(config),
      targets_(),
      pool_(config_.pool, std::move(transport_factory)),
      executor_(pool_, config_.executor),
      clusters_(targets_, executor_),
      events_(config_.event_capacity),
      monitor_(clusters_, events_, config_.health_check_interval),
      logger_(get_logger()) {}

FleetManager::~FleetManager() {
    shutdown();
}

void FleetManager::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting fleet manager");
    pool_.start_sweeper();
    monitor_.start();
}

void FleetManager::shutdown() {
    monitor_.stop();
    pool_.stop_sweeper();
    pool_.close_all();
    if (flag_running_.exchange(false)) {
        logger_->info("Fleet manager shut down");
    }
}

TargetConfig FleetManager::add_target(TargetConfig config) {
    TargetConfig stored = targets_.add_target(std::move(config));
    events_.publish(FleetEventType::TargetAdded, stored.name, connection_string(stored));
    return stored;
}

void FleetManager::remove_target(const std::string& name) {
    TargetConfig target{};
    std::vector<std::string> list_clusters;
    {
        std::scoped_lock lock(membership_mutex_);
        target = targets_.get_target(name);
        list_clusters = clusters_.remove_target_everywhere(name);
        targets_.remove_target(name);
    }
    const std::size_t retired = pool_.retire_endpoint(target);

    for (const std::string& cluster_name : list_clusters) {
        events_.publish(FleetEventType::MemberRemoved, cluster_name, name);
    }
    events_.publish(FleetEventType::TargetRemoved, name, fmt::format("{} sessions retired", retired));
}

TargetConfig FleetManager::update_target(const std::string& name, TargetConfig config) {
    TargetConfig previous = targets_.update_target(name, std::move(config));
    const std::size_t retired = pool_.retire_endpoint(previous);
    logger_->info(R"({{"component":"fleet","action":"update_target","target":"{}","retired_sessions":{}}})", name, retired);
    events_.publish(FleetEventType::TargetUpdated, name, connection_string(targets_.get_target(name)));
    return previous;
}

std::vector<TargetInfo> FleetManager::list_targets() const {
    std::vector<TargetInfo> list_info;
    for (const TargetConfig& target : targets_.list_targets()) {
        list_info.push_back(describe(target));
    }
    return list_info;
}

TargetInfo FleetManager::get_target(const std::string& name) const {
    return describe(targets_.get_target(name));
}

bool FleetManager::test_connection(const std::string& name) {
    const TargetConfig target = targets_.get_target(name);
    if (!target.enabled) {
        logger_->warn("Connection test skipped for disabled target {}", name);
        return false;
    }
    try {
        SessionLease lease{pool_, target};
        return lease.transport().is_connected();
    } catch (const ConnectionError& exc) {
        logger_->warn(R"({{"component":"fleet","action":"test_connection","target":"{}","error":"{}"}})", name, json_escape(exc.what()));
        return false;
    }
}

ExecutionResult FleetManager::execute_command(const std::string& target_name, const std::string& command) {
    const TargetConfig target = targets_.get_target(target_name);
    ResultMap results = executor_.execute_on_targets({target}, command);
    return std::move(results.at(target_name));
}

ResultMap FleetManager::execute_on_targets(const std::vector<std::string>& target_names, const std::string& command) {
    if (target_names.empty()) {
        throw ValidationError("no targets specified");
    }
    return executor_.execute_on_targets(targets_.resolve(target_names), command);
}

BatchReport FleetManager::execute_batch(const std::string& batch_name,
                                        const std::vector<std::string>& target_names,
                                        const std::vector<BatchCommand>& commands,
                                        bool stop_on_failure) {
    BatchSpec spec{};
    spec.name = batch_name;
    spec.targets = targets_.resolve(target_names);
    spec.commands = commands;
    spec.stop_on_failure = stop_on_failure;
    return executor_.execute_batch(spec);
}

ClusterExecutionReport FleetManager::execute_on_cluster(const std::string& cluster_name, const std::string& command) {
    return clusters_.execute_on_cluster(cluster_name, command);
}

BatchReport FleetManager::execute_batch_on_cluster(const std::string& cluster_name,
                                                   const std::vector<BatchCommand>& commands,
                                                   bool stop_on_failure) {
    return clusters_.execute_batch_on_cluster(cluster_name, commands, stop_on_failure);
}

void FleetManager::upload_file(const std::string& target_name, const std::filesystem::path& local_path, const std::string& remote_path) {
    const TargetConfig target = require_enabled(target_name);
    SessionLease lease{pool_, target};
    try {
        lease.transport().upload_file(local_path, remote_path);
    } catch (const ConnectionError&) {
        lease.discard();
        throw;
    }
    logger_->info(R"({{"component":"fleet","action":"upload","target":"{}","remote_path":"{}"}})", target_name, json_escape(remote_path));
}

void FleetManager::download_file(const std::string& target_name, const std::string& remote_path, const std::filesystem::path& local_path) {
    const TargetConfig target = require_enabled(target_name);
    SessionLease lease{pool_, target};
    try {
        lease.transport().download_file(remote_path, local_path);
    } catch (const ConnectionError&) {
        lease.discard();
        throw;
    }
    logger_->info(R"({{"component":"fleet","action":"download","target":"{}","remote_path":"{}"}})", target_name, json_escape(remote_path));
}

void FleetManager::create_tunnel(const std::string& target_name, int local_port, const std::string& remote_host, int remote_port) {
    validate_port(local_port, "local port");
    validate_port(remote_port, "remote port");
    if (remote_host.empty()) {
        throw ValidationError("tunnel remote host must not be empty");
    }
    const TargetConfig target = require_enabled(target_name);
    SessionLease lease{pool_, target};
    try {
        lease.transport().create_tunnel(local_port, remote_host, remote_port);
    } catch (const ConnectionError&) {
        lease.discard();
        throw;
    }
    logger_->info(R"({{"component":"fleet","action":"tunnel","target":"{}","local_port":{},"remote":"{}:{}"}})",
                  target_name,
                  local_port,
                  remote_host,
                  remote_port);
}

Cluster FleetManager::create_cluster(const std::string& name,
                                     const std::string& description,
                                     const std::vector<std::string>& members,
                                     const std::vector<std::string>& tags,
                                     ClusterConfig config) {
    Cluster cluster{};
    {
        std::scoped_lock lock(membership_mutex_);
        cluster = clusters_.create_cluster(name, description, members, tags, config);
    }
    events_.publish(FleetEventType::ClusterCreated, name, fmt::format("{} members", cluster.members.size()));
    return cluster;
}

void FleetManager::delete_cluster(const std::string& name) {
    clusters_.delete_cluster(name);
    monitor_.forget_cluster(name);
    events_.publish(FleetEventType::ClusterDeleted, name, "");
}

void FleetManager::add_cluster_member(const std::string& cluster_name, const std::string& target_name) {
    {
        std::scoped_lock lock(membership_mutex_);
        clusters_.add_member(cluster_name, target_name);
    }
    events_.publish(FleetEventType::MemberAdded, cluster_name, target_name);
}

void FleetManager::remove_cluster_member(const std::string& cluster_name, const std::string& target_name) {
    clusters_.remove_member(cluster_name, target_name);
    events_.publish(FleetEventType::MemberRemoved, cluster_name, target_name);
}

void FleetManager::update_cluster_config(const std::string& name, ClusterConfig config) {
    clusters_.update_cluster_config(name, config);
}

std::vector<Cluster> FleetManager::list_clusters() const {
    return clusters_.list_clusters();
}

Cluster FleetManager::get_cluster(const std::string& name) const {
    return clusters_.get_cluster(name);
}

ClusterHealth FleetManager::check_cluster_health(const std::string& name) {
    return clusters_.check_cluster_health(name);
}

ClusterStatistics FleetManager::cluster_stats() const {
    return clusters_.cluster_stats();
}

ConnectionStats FleetManager::connection_stats() const {
    const PoolStatistics pool_stats = pool_.statistics();
    ConnectionStats stats{};
    stats.total_targets = targets_.size();
    stats.active_sessions = pool_stats.active_sessions;
    stats.idle_sessions = pool_stats.idle_sessions;
    stats.pool_size = pool_stats.total_sessions;
    return stats;
}

ExecutionStatistics FleetManager::execution_stats() const {
    return executor_.statistics();
}

FleetEventBus& FleetManager::events() noexcept {
    return events_;
}

ClusterHealthMonitor& FleetManager::health_monitor() noexcept {
    return monitor_;
}

ParallelExecutor& FleetManager::executor() noexcept {
    return executor_;
}

const FleetManagerConfig& FleetManager::config() const noexcept {
    return config_;
}

TargetInfo FleetManager::describe(const TargetConfig& config) const {
    TargetInfo info{};
    info.config = config;
    if (!config.enabled) {
        info.status = TargetStatus::Disabled;
    } else if (pool_.has_live_session(config)) {
        info.status = TargetStatus::Online;
    }
    if (const std::optional<TimePoint> optional_activity = pool_.last_activity(config); optional_activity.has_value()) {
        info.last_activity = to_wall_time(optional_activity.value());
    }
    return info;
}

TargetConfig FleetManager::require_enabled(const std::string& name) const {
    TargetConfig target = targets_.get_target(name);
    if (!target.enabled) {
        throw ValidationError(fmt::format("target '{}' is disabled", name));
    }
    return target;
}

std::string_view to_string(TargetStatus status) noexcept {
    switch (status) {
        case TargetStatus::Online:
            return "online";
        case TargetStatus::Unknown:
            return "unknown";
        case TargetStatus::Disabled:
            return "disabled";
    }
    return "unknown";
}

}  // namespace remote_fleet
