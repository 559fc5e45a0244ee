#include "remote_fleet/cluster_registry.hpp"

#include <algorithm>
#include <mutex>
#include <set>

#include <fmt/format.h>

#include "remote_fleet/errors.hpp"

namespace remote_fleet {

namespace {
FanOutPolicy make_policy(const ClusterConfig& config) {
    return FanOutPolicy{config.max_concurrency, config.command_timeout, config.retry_attempts, config.retry_delay};
}

void validate_cluster_config(const ClusterConfig& config) {
    if (config.max_concurrency == 0) {
        throw ValidationError("cluster max concurrency must be at least 1");
    }
    if (!is_valid_duration(config.command_timeout)) {
        throw ValidationError(fmt::format("cluster command timeout must be positive and at most {}s", k_max_duration.count()));
    }
    if (!is_valid_duration(config.health_check_interval)) {
        throw ValidationError(fmt::format("cluster health check interval must be positive and at most {}s", k_max_duration.count()));
    }
    if (config.retry_delay != Duration::zero() && !is_valid_duration(config.retry_delay)) {
        throw ValidationError("cluster retry delay must be finite and not negative");
    }
    if (config.retry_attempts < 0) {
        throw ValidationError("cluster retry attempts cannot be negative");
    }
}

bool has_member(const Cluster& cluster, const std::string& target_name) {
    return std::find(cluster.members.begin(), cluster.members.end(), target_name) != cluster.members.end();
}
}  // namespace

ClusterRegistry::ClusterRegistry(const TargetRegistry& targets, ParallelExecutor& executor)
    : targets_(targets),
      executor_(executor),
      logger_(get_logger()) {}

Cluster ClusterRegistry::create_cluster(const std::string& name,
                                        const std::string& description,
                                        const std::vector<std::string>& members,
                                        const std::vector<std::string>& tags,
                                        ClusterConfig config) {
    if (name.empty()) {
        throw ValidationError("cluster name must not be empty");
    }
    if (members.empty()) {
        throw EmptyMembersError(fmt::format("cluster '{}' needs at least one member", name));
    }
    std::set<std::string> set_members;
    for (const std::string& member : members) {
        if (!set_members.insert(member).second) {
            throw ValidationError(fmt::format("cluster '{}' lists member '{}' more than once", name, member));
        }
    }
    validate_cluster_config(config);

    std::unique_lock lock(mutex_);
    if (map_clusters_.count(name) != 0) {
        throw DuplicateNameError(fmt::format("cluster '{}' already exists", name));
    }
    for (const std::string& member : members) {
        if (!targets_.contains(member)) {
            throw NotFoundError(fmt::format("target '{}' not found", member));
        }
    }

    Cluster cluster{};
    cluster.name = name;
    cluster.description = description;
    cluster.members = members;
    cluster.tags = tags;
    cluster.created_at = SystemClock::now();
    cluster.updated_at = cluster.created_at;
    cluster.config = config;
    map_clusters_.emplace(name, cluster);

    logger_->info(R"({{"component":"clusters","action":"create","cluster":"{}","members":{}}})", name, members.size());
    return cluster;
}

Cluster ClusterRegistry::delete_cluster(const std::string& name) {
    std::unique_lock lock(mutex_);
    auto iterator_cluster = map_clusters_.find(name);
    if (iterator_cluster == map_clusters_.end()) {
        throw NotFoundError(fmt::format("cluster '{}' not found", name));
    }
    Cluster removed = std::move(iterator_cluster->second);
    map_clusters_.erase(iterator_cluster);
    logger_->info(R"({{"component":"clusters","action":"delete","cluster":"{}"}})", name);
    return removed;
}

void ClusterRegistry::add_member(const std::string& cluster_name, const std::string& target_name) {
    std::unique_lock lock(mutex_);
    auto iterator_cluster = map_clusters_.find(cluster_name);
    if (iterator_cluster == map_clusters_.end()) {
        throw NotFoundError(fmt::format("cluster '{}' not found", cluster_name));
    }
    if (!targets_.contains(target_name)) {
        throw NotFoundError(fmt::format("target '{}' not found", target_name));
    }
    Cluster& cluster = iterator_cluster->second;
    if (has_member(cluster, target_name)) {
        throw DuplicateMemberError(fmt::format("target '{}' is already a member of cluster '{}'", target_name, cluster_name));
    }
    cluster.members.push_back(target_name);
    cluster.updated_at = SystemClock::now();
    logger_->info(R"({{"component":"clusters","action":"add_member","cluster":"{}","target":"{}"}})", cluster_name, target_name);
}

void ClusterRegistry::remove_member(const std::string& cluster_name, const std::string& target_name) {
    std::unique_lock lock(mutex_);
    auto iterator_cluster = map_clusters_.find(cluster_name);
    if (iterator_cluster == map_clusters_.end()) {
        throw NotFoundError(fmt::format("cluster '{}' not found", cluster_name));
    }
    Cluster& cluster = iterator_cluster->second;
    auto iterator_member = std::find(cluster.members.begin(), cluster.members.end(), target_name);
    if (iterator_member == cluster.members.end()) {
        throw NotFoundError(fmt::format("target '{}' is not a member of cluster '{}'", target_name, cluster_name));
    }
    if (cluster.members.size() == 1) {
        throw EmptyMembersError(fmt::format("cannot remove '{}', the last member of cluster '{}'", target_name, cluster_name));
    }
    cluster.members.erase(iterator_member);
    cluster.updated_at = SystemClock::now();
    logger_->info(R"({{"component":"clusters","action":"remove_member","cluster":"{}","target":"{}"}})", cluster_name, target_name);
}

void ClusterRegistry::update_cluster_config(const std::string& name, ClusterConfig config) {
    validate_cluster_config(config);
    std::unique_lock lock(mutex_);
    auto iterator_cluster = map_clusters_.find(name);
    if (iterator_cluster == map_clusters_.end()) {
        throw NotFoundError(fmt::format("cluster '{}' not found", name));
    }
    iterator_cluster->second.config = config;
    iterator_cluster->second.updated_at = SystemClock::now();
}

std::vector<Cluster> ClusterRegistry::list_clusters() const {
    std::shared_lock lock(mutex_);
    std::vector<Cluster> list_clusters;
    list_clusters.reserve(map_clusters_.size());
    for (const auto& [name, cluster] : map_clusters_) {
        list_clusters.push_back(cluster);
    }
    return list_clusters;
}

Cluster ClusterRegistry::get_cluster(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto iterator_cluster = map_clusters_.find(name);
    if (iterator_cluster == map_clusters_.end()) {
        throw NotFoundError(fmt::format("cluster '{}' not found", name));
    }
    return iterator_cluster->second;
}

std::vector<std::string> ClusterRegistry::cluster_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> list_names;
    list_names.reserve(map_clusters_.size());
    for (const auto& [name, cluster] : map_clusters_) {
        list_names.push_back(name);
    }
    return list_names;
}

bool ClusterRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return map_clusters_.count(name) != 0;
}

std::size_t ClusterRegistry::size() const {
    std::shared_lock lock(mutex_);
    return map_clusters_.size();
}

ClusterExecutionReport ClusterRegistry::execute_on_cluster(const std::string& name, const std::string& command) {
    const Cluster cluster = get_cluster(name);
    const std::vector<TargetConfig> list_targets = resolve_members(cluster);
    ResultMap results = executor_.execute_with_policy(list_targets, command, make_policy(cluster.config));
    ClusterExecutionReport report = make_cluster_report(name, command, std::move(results));
    logger_->info(R"({{"component":"clusters","action":"execute","cluster":"{}","successful":{},"failed":{}}})",
                  name,
                  report.successful_count,
                  report.failed_count);
    return report;
}

BatchReport ClusterRegistry::execute_batch_on_cluster(const std::string& name,
                                                      const std::vector<BatchCommand>& commands,
                                                      bool stop_on_failure) {
    const Cluster cluster = get_cluster(name);
    BatchSpec spec{};
    spec.name = fmt::format("{}-batch", name);
    spec.description = fmt::format("Batch on cluster {}", name);
    spec.targets = resolve_members(cluster);
    spec.commands = commands;
    for (BatchCommand& step : spec.commands) {
        if (!step.timeout.has_value()) {
            step.timeout = cluster.config.command_timeout;
        }
    }
    spec.stop_on_failure = stop_on_failure;
    return executor_.execute_batch(spec);
}

ClusterHealth ClusterRegistry::check_cluster_health(const std::string& name) {
    const Cluster cluster = get_cluster(name);
    const std::vector<TargetConfig> list_targets = resolve_members(cluster);
    const ResultMap results = executor_.execute_with_policy(list_targets, k_health_check_command, make_policy(cluster.config));
    const ClusterHealth health = compute_cluster_health(results);

    {
        std::unique_lock lock(mutex_);
        auto iterator_cluster = map_clusters_.find(name);
        if (iterator_cluster != map_clusters_.end()) {
            iterator_cluster->second.last_health = health;
        }
    }

    logger_->info(R"({{"component":"clusters","action":"health","cluster":"{}","status":"{}","online":{},"total":{},"healthy_percent":{:.1f}}})",
                  name,
                  to_string(health.overall_status),
                  health.online_targets,
                  health.total_targets,
                  health.healthy_percent);
    return health;
}

ClusterStatistics ClusterRegistry::cluster_stats() const {
    ClusterStatistics stats{};
    std::shared_lock lock(mutex_);
    stats.total_clusters = map_clusters_.size();
    for (const auto& [name, cluster] : map_clusters_) {
        stats.total_members += cluster.members.size();
        if (!cluster.last_health.has_value()) {
            ++stats.unchecked;
            continue;
        }
        switch (cluster.last_health->overall_status) {
            case ClusterStatus::Online:
                ++stats.online;
                break;
            case ClusterStatus::Degraded:
                ++stats.degraded;
                break;
            case ClusterStatus::Offline:
                ++stats.offline;
                break;
        }
    }
    return stats;
}

std::vector<std::string> ClusterRegistry::clusters_where_sole_member(const std::string& target_name) const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> list_names;
    for (const auto& [name, cluster] : map_clusters_) {
        if (cluster.members.size() == 1 && cluster.members.front() == target_name) {
            list_names.push_back(name);
        }
    }
    return list_names;
}

std::vector<std::string> ClusterRegistry::remove_target_everywhere(const std::string& target_name) {
    std::unique_lock lock(mutex_);
    for (const auto& [name, cluster] : map_clusters_) {
        if (cluster.members.size() == 1 && cluster.members.front() == target_name) {
            throw EmptyMembersError(fmt::format("target '{}' is the last member of cluster '{}'", target_name, name));
        }
    }

    std::vector<std::string> list_affected;
    const WallTime now = SystemClock::now();
    for (auto& [name, cluster] : map_clusters_) {
        auto iterator_member = std::find(cluster.members.begin(), cluster.members.end(), target_name);
        if (iterator_member == cluster.members.end()) {
            continue;
        }
        cluster.members.erase(iterator_member);
        cluster.updated_at = now;
        list_affected.push_back(name);
    }
    return list_affected;
}

std::vector<TargetConfig> ClusterRegistry::resolve_members(const Cluster& cluster) const {
    return targets_.resolve(cluster.members);
}

}  // namespace remote_fleet
