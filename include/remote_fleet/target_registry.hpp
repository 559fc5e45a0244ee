// === Target Registry =========================================================
//
// Owns the TargetConfig of every known remote system. A guarded map keyed by
// target name; every mutation validates its input before touching the map.

#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "remote_fleet/logging.hpp"
#include "remote_fleet/target_config.hpp"

namespace remote_fleet {

/** @brief Thread-safe registry of remote targets keyed by name. */
class TargetRegistry final {
  public:
    TargetRegistry();

    /**
     * @brief Register a new target.
     *
     * A port of 0 is replaced by the default SSH port before validation.
     * Throws ValidationError for malformed input and DuplicateNameError if the
     * name is taken. Returns the stored configuration.
     */
    TargetConfig add_target(TargetConfig config);
    /** @brief Remove @p name and return its configuration. Throws NotFoundError. */
    TargetConfig remove_target(const std::string& name);
    /**
     * @brief Replace the configuration of @p name and return the previous one.
     *
     * Renaming is not supported: an empty name in @p config is filled in, a
     * different one is rejected. The original creation time is preserved.
     */
    TargetConfig update_target(const std::string& name, TargetConfig config);

    /** @brief All targets sorted by name. */
    [[nodiscard]] std::vector<TargetConfig> list_targets() const;
    /** @brief Targets carrying @p tag, sorted by name. */
    [[nodiscard]] std::vector<TargetConfig> targets_with_tag(const std::string& tag) const;
    /** @brief Configuration of @p name. Throws NotFoundError. */
    [[nodiscard]] TargetConfig get_target(const std::string& name) const;
    [[nodiscard]] std::optional<TargetConfig> find_target(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;
    /**
     * @brief Resolve @p names to configurations in the given order.
     *
     * Throws NotFoundError naming the first unknown target.
     */
    [[nodiscard]] std::vector<TargetConfig> resolve(const std::vector<std::string>& names) const;
    [[nodiscard]] std::size_t size() const;

  private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TargetConfig> map_targets_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace remote_fleet
