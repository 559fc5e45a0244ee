// === Configuration Loader ====================================================
//
// Parses and validates the environment-driven settings that feed the fleet
// manager. Unset variables take their defaults silently; values that cannot be
// parsed or fall outside their bounds are reported through the logger and
// replaced by the default.
//
// Recognized variables (all prefixed with `REMOTE_FLEET_`):
//   LOG_DIR, LOG_LEVEL, LOG_MAX_BYTES, LOG_MAX_FILES, MAX_CONCURRENCY, TIMEOUT_S, RETRY_ATTEMPTS,
//   RETRY_DELAY_S, HISTORY_CAPACITY, POOL_MAX_IDLE_S, POOL_MAX_LIFE_S,
//   POOL_SWEEP_S, HEALTH_INTERVAL_S, EVENT_CAPACITY.
//
// Note: nothing is read from disk; callers populate the process environment
// ahead of time.

#include "remote_fleet/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include "remote_fleet/logging.hpp"

namespace remote_fleet {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr long k_default_max_concurrency{10};
constexpr double k_default_timeout_s{60.0};
constexpr long k_default_retry_attempts{3};
constexpr double k_default_retry_delay_s{2.0};
constexpr long k_default_history_capacity{1000};
constexpr double k_default_pool_max_idle_s{300.0};
constexpr double k_default_pool_max_life_s{1800.0};
constexpr double k_default_pool_sweep_s{60.0};
constexpr double k_default_health_interval_s{30.0};
constexpr long k_default_event_capacity{1000};
constexpr long k_default_log_max_bytes{10L * 1024 * 1024};
constexpr long k_default_log_max_files{5};
constexpr long k_max_log_bytes{1024L * 1024 * 1024};
constexpr long k_max_log_files{100};
constexpr long k_max_concurrency{4096};
constexpr long k_max_retry_attempts{100};
constexpr long k_max_capacity{1000000};

double parse_seconds(const char* variable, double fallback) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!is_valid_duration(Duration{parsed_value})) {
            get_logger()->warn("{}={} must be positive and at most {}s; using fallback {}",
                               variable,
                               raw_value,
                               k_max_duration.count(),
                               fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as seconds; using fallback {}", variable, raw_value, fallback);
        return fallback;
    }
}

long parse_count(const char* variable, long fallback, long minimum, long maximum) {
    const char* raw_value = std::getenv(variable);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const long parsed_value = std::stol(raw_value, &consumed);
        if (raw_value[consumed] != '\0') {
            get_logger()->warn("Failed to parse {}={} as an integer; using fallback {}", variable, raw_value, fallback);
            return fallback;
        }
        if (parsed_value < minimum || parsed_value > maximum) {
            get_logger()->warn("{}={} is outside {}..{}; using fallback {}", variable, raw_value, minimum, maximum, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {}={} as an integer; using fallback {}", variable, raw_value, fallback);
        return fallback;
    }
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("REMOTE_FLEET_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log = load_log_settings();

    auto logger = initialize_logger(config.log);
    logger->info("Loading configuration from environment");

    if (const char* raw_level = std::getenv("REMOTE_FLEET_LOG_LEVEL"); raw_level != nullptr && *raw_level != '\0') {
        config.log_level = std::string{raw_level};
    }

    config.fleet.pool = load_pool_config();
    config.fleet.executor = load_executor_config();
    config.fleet.health_check_interval = Duration{parse_seconds("REMOTE_FLEET_HEALTH_INTERVAL_S", k_default_health_interval_s)};
    config.fleet.event_capacity = static_cast<std::size_t>(
        parse_count("REMOTE_FLEET_EVENT_CAPACITY", k_default_event_capacity, 1, k_max_capacity)
    );

    logger->info("Configuration loaded: max_concurrency={} timeout_s={} retry_attempts={} retry_delay_s={} pool_max_idle_s={} pool_max_life_s={}",
                 config.fleet.executor.max_concurrency,
                 config.fleet.executor.timeout.count(),
                 config.fleet.executor.retry_attempts,
                 config.fleet.executor.retry_delay.count(),
                 config.fleet.pool.max_idle.count(),
                 config.fleet.pool.max_life.count());
    return config;
}

LogSettings ConfigurationLoader::load_log_settings() {
    LogSettings log{};
    log.directory = parse_log_directory();
    log.max_file_bytes = static_cast<std::size_t>(parse_count("REMOTE_FLEET_LOG_MAX_BYTES", k_default_log_max_bytes, 1024, k_max_log_bytes));
    log.max_files = static_cast<std::size_t>(parse_count("REMOTE_FLEET_LOG_MAX_FILES", k_default_log_max_files, 1, k_max_log_files));
    return log;
}

PoolConfig ConfigurationLoader::load_pool_config() {
    PoolConfig pool{};
    pool.max_idle = Duration{parse_seconds("REMOTE_FLEET_POOL_MAX_IDLE_S", k_default_pool_max_idle_s)};
    pool.max_life = Duration{parse_seconds("REMOTE_FLEET_POOL_MAX_LIFE_S", k_default_pool_max_life_s)};
    pool.sweep_interval = Duration{parse_seconds("REMOTE_FLEET_POOL_SWEEP_S", k_default_pool_sweep_s)};
    return pool;
}

ExecutorConfig ConfigurationLoader::load_executor_config() {
    ExecutorConfig executor{};
    executor.max_concurrency = static_cast<std::size_t>(parse_count("REMOTE_FLEET_MAX_CONCURRENCY", k_default_max_concurrency, 1, k_max_concurrency));
    executor.timeout = Duration{parse_seconds("REMOTE_FLEET_TIMEOUT_S", k_default_timeout_s)};
    executor.retry_attempts = static_cast<int>(parse_count("REMOTE_FLEET_RETRY_ATTEMPTS", k_default_retry_attempts, 0, k_max_retry_attempts));
    executor.retry_delay = Duration{parse_seconds("REMOTE_FLEET_RETRY_DELAY_S", k_default_retry_delay_s)};
    executor.history_capacity = static_cast<std::size_t>(parse_count("REMOTE_FLEET_HISTORY_CAPACITY", k_default_history_capacity, 1, k_max_capacity));
    return executor;
}

}  // namespace remote_fleet
