#include "remote_fleet/target_registry.hpp"

#include <algorithm>
#include <mutex>

#include <fmt/format.h>

#include "remote_fleet/errors.hpp"

namespace remote_fleet {

namespace {
void sort_by_name(std::vector<TargetConfig>& list_targets) {
    std::sort(list_targets.begin(), list_targets.end(), [](const TargetConfig& lhs, const TargetConfig& rhs) {
        return lhs.name < rhs.name;
    });
}
}  // namespace

TargetRegistry::TargetRegistry()
    : logger_(get_logger()) {}

TargetConfig TargetRegistry::add_target(TargetConfig config) {
    if (config.port == 0) {
        config.port = k_default_ssh_port;
    }
    validate_target_config(config);
    config.created_at = SystemClock::now();

    {
        std::unique_lock lock(mutex_);
        if (map_targets_.count(config.name) != 0) {
            throw DuplicateNameError(fmt::format("target '{}' already exists", config.name));
        }
        map_targets_.emplace(config.name, config);
    }
    logger_->info(R"({{"component":"targets","action":"add","target":"{}","endpoint":"{}"}})",
                  config.name,
                  connection_string(config));
    return config;
}

TargetConfig TargetRegistry::remove_target(const std::string& name) {
    TargetConfig removed{};
    {
        std::unique_lock lock(mutex_);
        const auto iterator_target = map_targets_.find(name);
        if (iterator_target == map_targets_.end()) {
            throw NotFoundError(fmt::format("target '{}' not found", name));
        }
        removed = std::move(iterator_target->second);
        map_targets_.erase(iterator_target);
    }
    logger_->info(R"({{"component":"targets","action":"remove","target":"{}"}})", name);
    return removed;
}

TargetConfig TargetRegistry::update_target(const std::string& name, TargetConfig config) {
    if (config.name.empty()) {
        config.name = name;
    }
    if (config.name != name) {
        throw ValidationError(fmt::format("cannot rename target '{}' to '{}'", name, config.name));
    }
    if (config.port == 0) {
        config.port = k_default_ssh_port;
    }
    validate_target_config(config);

    TargetConfig previous{};
    {
        std::unique_lock lock(mutex_);
        const auto iterator_target = map_targets_.find(name);
        if (iterator_target == map_targets_.end()) {
            throw NotFoundError(fmt::format("target '{}' not found", name));
        }
        previous = iterator_target->second;
        config.created_at = previous.created_at;
        iterator_target->second = std::move(config);
    }
    logger_->info(R"({{"component":"targets","action":"update","target":"{}"}})", name);
    return previous;
}

std::vector<TargetConfig> TargetRegistry::list_targets() const {
    std::vector<TargetConfig> list_targets;
    {
        std::shared_lock lock(mutex_);
        list_targets.reserve(map_targets_.size());
        for (const auto& [name, config] : map_targets_) {
            list_targets.push_back(config);
        }
    }
    sort_by_name(list_targets);
    return list_targets;
}

std::vector<TargetConfig> TargetRegistry::targets_with_tag(const std::string& tag) const {
    std::vector<TargetConfig> list_tagged;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [name, config] : map_targets_) {
            if (has_tag(config, tag)) {
                list_tagged.push_back(config);
            }
        }
    }
    sort_by_name(list_tagged);
    return list_tagged;
}

TargetConfig TargetRegistry::get_target(const std::string& name) const {
    std::optional<TargetConfig> optional_target = find_target(name);
    if (!optional_target.has_value()) {
        throw NotFoundError(fmt::format("target '{}' not found", name));
    }
    return std::move(optional_target.value());
}

std::optional<TargetConfig> TargetRegistry::find_target(const std::string& name) const {
    std::shared_lock lock(mutex_);
    const auto iterator_target = map_targets_.find(name);
    if (iterator_target == map_targets_.end()) {
        return std::nullopt;
    }
    return iterator_target->second;
}

bool TargetRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return map_targets_.count(name) != 0;
}

std::vector<TargetConfig> TargetRegistry::resolve(const std::vector<std::string>& names) const {
    std::vector<TargetConfig> list_resolved;
    list_resolved.reserve(names.size());
    std::shared_lock lock(mutex_);
    for (const std::string& name : names) {
        const auto iterator_target = map_targets_.find(name);
        if (iterator_target == map_targets_.end()) {
            throw NotFoundError(fmt::format("target '{}' not found", name));
        }
        list_resolved.push_back(iterator_target->second);
    }
    return list_resolved;
}

std::size_t TargetRegistry::size() const {
    std::shared_lock lock(mutex_);
    return map_targets_.size();
}

}  // namespace remote_fleet
