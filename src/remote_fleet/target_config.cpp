#include "remote_fleet/target_config.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "remote_fleet/errors.hpp"

namespace remote_fleet {

namespace {
constexpr int k_min_port{1};
constexpr int k_max_port{65535};

[[noreturn]] void reject(const TargetConfig& config, std::string_view reason) {
    const std::string& subject = config.name.empty() ? config.host : config.name;
    throw ValidationError(fmt::format("invalid target '{}': {}", subject, reason));
}
}  // namespace

void validate_target_config(const TargetConfig& config) {
    if (config.name.empty()) {
        reject(config, "name is required");
    }
    if (config.host.empty()) {
        reject(config, "host is required");
    }
    if (config.port < k_min_port || config.port > k_max_port) {
        reject(config, fmt::format("port {} is outside [{}, {}]", config.port, k_min_port, k_max_port));
    }
    if (config.username.empty()) {
        reject(config, "username is required");
    }

    const bool has_key = !config.key_path.empty();
    const bool has_password = !config.password.empty();
    if (has_key && has_password) {
        reject(config, "supply either a key path or a password, not both");
    }
    if (config.auth_method == AuthMethod::Key && !has_key) {
        reject(config, "key path is required for key authentication");
    }
    if (config.auth_method == AuthMethod::Password && !has_password) {
        reject(config, "password is required for password authentication");
    }
    if (config.connect_timeout.count() <= 0.0) {
        reject(config, "connect timeout must be positive");
    }
}

std::string endpoint_key(const TargetConfig& config) {
    return fmt::format("{}@{}:{}", config.username, config.host, config.port);
}

std::string connection_string(const TargetConfig& config) {
    if (config.port == k_default_ssh_port) {
        return fmt::format("{}@{}", config.username, config.host);
    }
    return endpoint_key(config);
}

std::string_view to_string(AuthMethod method) noexcept {
    switch (method) {
        case AuthMethod::Key:
            return "key";
        case AuthMethod::Password:
            return "password";
    }
    return "unknown";
}

bool has_tag(const TargetConfig& config, std::string_view tag) {
    return std::find(config.tags.begin(), config.tags.end(), tag) != config.tags.end();
}

}  // namespace remote_fleet
