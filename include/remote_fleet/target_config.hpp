// === Target Configuration ====================================================
//
// Describes a single remote system: its identity, address, credentials and
// tags. The registry validates every configuration before storing it, and the
// connection pool derives its session key from the endpoint fields.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "remote_fleet/types.hpp"

namespace remote_fleet {

/** @brief Credential kind supplied for a target. */
enum class AuthMethod {
    Key,       /**< Private key file referenced by `key_path`. */
    Password   /**< Inline password. */
};

inline constexpr int k_default_ssh_port{22};

/**
 * @brief Identity, address and credentials of one remote target.
 */
struct TargetConfig final {
    std::string name{};                        /**< Unique identifier within the registry. */
    std::string host{};                        /**< DNS name or address of the target. */
    int port{k_default_ssh_port};              /**< Transport port, 1..65535. */
    std::string username{};                    /**< Remote account used to log in. */
    AuthMethod auth_method{AuthMethod::Key};   /**< Which credential below is in use. */
    std::string key_path{};                    /**< Private key path for key authentication. */
    std::string password{};                    /**< Password for password authentication. */
    std::vector<std::string> tags{};           /**< Free-form labels. */
    bool enabled{true};                        /**< Disabled targets are never contacted. */
    Duration connect_timeout{Duration{10.0}};  /**< Upper bound for establishing a session. */
    WallTime created_at{};                     /**< Stamped by the registry on insertion. */
};

/**
 * @brief Throw ValidationError when @p config violates a target invariant.
 *
 * Checks: non-empty name, host and username; port within [1, 65535]; exactly
 * one credential supplied, matching the declared auth method.
 */
void validate_target_config(const TargetConfig& config);

/** @brief Pool key for the target: `username@host:port`. */
[[nodiscard]] std::string endpoint_key(const TargetConfig& config);

/** @brief Display form: `user@host`, with `:port` appended unless it is 22. */
[[nodiscard]] std::string connection_string(const TargetConfig& config);

[[nodiscard]] std::string_view to_string(AuthMethod method) noexcept;

/** @brief True if @p config carries @p tag. */
[[nodiscard]] bool has_tag(const TargetConfig& config, std::string_view tag);

}  // namespace remote_fleet
