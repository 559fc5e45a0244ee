// === Configuration ===========================================================
//
// Exposes the strongly-typed settings consumed by the fleet manager and its
// components. `ConfigurationLoader` translates environment variables into
// these structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <optional>
#include <string>

#include "remote_fleet/fleet_manager.hpp"
#include "remote_fleet/logging.hpp"

namespace remote_fleet {

/**
 * @brief Runtime knobs for a fleet manager process.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative.
 */
struct Configuration final {
    LogSettings log{};                        /**< Directory and rotation of the structured log file. */
    std::optional<std::string> log_level{};   /**< spdlog level name, when overridden. */
    FleetManagerConfig fleet{};               /**< Pool, executor and monitor settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from `REMOTE_FLEET_*`
 *        environment variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Initialize the shared logger and load every setting. */
    static Configuration load();

  private:
    static LogSettings load_log_settings();
    static PoolConfig load_pool_config();
    static ExecutorConfig load_executor_config();
};

}  // namespace remote_fleet
