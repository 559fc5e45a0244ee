// === Parallel Executor =======================================================
//
// Fans one command out to many targets. Each target runs on its own worker
// thread; an AdmissionGate caps how many are actually executing. Connection
// failures are retried with a fixed delay, command failures are not. One
// shared deadline governs the whole fan-out: when it passes, every target that
// has not finished receives a cancellation result and the call returns without
// waiting for stragglers. Straggler threads are parked and joined later.
//
// Every call returns exactly one result per distinct input target.

#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "remote_fleet/batch.hpp"
#include "remote_fleet/connection_pool.hpp"
#include "remote_fleet/execution_result.hpp"
#include "remote_fleet/logging.hpp"

namespace remote_fleet {

/** @brief Concurrency, deadline and retry policy. */
struct ExecutorConfig final {
    std::size_t max_concurrency{10};          /**< Default admission gate size. */
    Duration timeout{Duration{60.0}};         /**< Default shared deadline per fan-out. */
    int retry_attempts{3};                    /**< Retries after the first attempt. */
    Duration retry_delay{Duration{2.0}};      /**< Fixed wait between attempts. */
    std::size_t history_capacity{1000};       /**< Results kept for statistics. */
};

/** @brief Aggregates over the execution history ring buffer. */
struct ExecutionStatistics final {
    std::size_t total_executions{};
    std::size_t successful{};
    std::size_t failed{};
    std::size_t cancelled{};
    std::size_t connection_failures{};
    std::size_t transport_errors{};
    Duration average_duration{};
};

/** @brief Policy applied to one fan-out; overrides the executor defaults. */
struct FanOutPolicy final {
    std::size_t concurrency_limit{10};
    Duration timeout{Duration{60.0}};
    int retry_attempts{3};
    Duration retry_delay{Duration{2.0}};
};

struct FanOutState;

/** @brief Bounded-concurrency, retrying command fan-out. */
class ParallelExecutor final {
  public:
    ParallelExecutor(ConnectionPool& pool, ExecutorConfig config);
    ~ParallelExecutor();

    ParallelExecutor(const ParallelExecutor&) = delete;
    ParallelExecutor& operator=(const ParallelExecutor&) = delete;

    /** @brief Run @p command on @p targets with the configured concurrency and timeout. */
    [[nodiscard]] ResultMap execute_on_targets(const std::vector<TargetConfig>& targets, const std::string& command);
    /**
     * @brief Run @p command on @p targets.
     *
     * At most @p concurrency_limit executions are in flight at once and the
     * call returns no later than @p timeout after it started. Targets are
     * de-duplicated by name. Throws ValidationError for an empty target set.
     */
    [[nodiscard]] ResultMap execute_on_targets(const std::vector<TargetConfig>& targets,
                                               const std::string& command,
                                               std::size_t concurrency_limit,
                                               Duration timeout);
    /** @brief Run @p command on @p targets under an explicit @p policy. */
    [[nodiscard]] ResultMap execute_with_policy(const std::vector<TargetConfig>& targets,
                                                const std::string& command,
                                                const FanOutPolicy& policy);
    /**
     * @brief Run each step of @p spec in order across its targets.
     *
     * Throws ValidationError when the target set or the step list is empty, or
     * when two steps share a name.
     */
    [[nodiscard]] BatchReport execute_batch(const BatchSpec& spec);

    [[nodiscard]] ExecutionStatistics statistics() const;
    /** @brief Oldest-first copy of the history ring buffer. */
    [[nodiscard]] std::vector<ExecutionResult> history() const;
    [[nodiscard]] ExecutorConfig config() const;
    /** @brief Peak in-flight executions observed during the most recent fan-out. */
    [[nodiscard]] std::size_t last_peak_in_flight() const noexcept;
    /** @brief Worker threads still running past an expired deadline. */
    [[nodiscard]] std::size_t parked_worker_count() const;

    void set_retry_policy(int attempts, Duration delay);
    void set_concurrency(std::size_t max_concurrency);
    void set_timeout(Duration timeout);

  private:
    struct ParkedWorkers final {
        std::shared_ptr<FanOutState> state;
        std::vector<std::thread> list_threads;
    };

    /** @brief Worker body: admission, retries, delivery. */
    void run_worker(const std::shared_ptr<FanOutState>& state, const TargetConfig& target, const std::string& command);
    /** @brief Attempt loop for one target; never throws. */
    [[nodiscard]] ExecutionResult execute_with_retry(FanOutState& state, const TargetConfig& target, const std::string& command);
    /**
     * @brief Single attempt through the pool. Throws ConnectionError.
     *
     * The success flag and outcome are recomputed here so every transport
     * yields the same result semantics.
     */
    [[nodiscard]] ExecutionResult execute_once(const TargetConfig& target, const std::string& command);
    /** @brief Sleep out the retry delay. Throws CancellationError with @p reason if the deadline intervenes. */
    void wait_for_retry(FanOutState& state, const std::string& reason);
    void record_history(const ResultMap& results);
    /** @brief Join parked workers; all of them when @p wait_all, otherwise only finished ones. */
    void reap_parked_workers(bool wait_all);

    ConnectionPool& pool_;
    mutable std::mutex config_mutex_;
    ExecutorConfig config_;
    mutable std::mutex history_mutex_;
    std::deque<ExecutionResult> deque_history_;
    mutable std::mutex parked_mutex_;
    std::vector<ParkedWorkers> list_parked_;
    std::atomic<std::size_t> last_peak_in_flight_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace remote_fleet
