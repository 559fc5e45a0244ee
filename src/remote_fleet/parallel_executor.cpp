#include "remote_fleet/parallel_executor.hpp"

#include <algorithm>
#include <condition_variable>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "remote_fleet/admission_gate.hpp"
#include "remote_fleet/errors.hpp"

namespace remote_fleet {

/**
 * @brief Shared between one execute_on_targets() call and its workers.
 *
 * Outlives the call when workers are still running at the deadline. Once
 * `closed` is set, late results are dropped.
 */
struct FanOutState final {
    FanOutState(std::size_t concurrency_limit, TimePoint deadline_at, Duration timeout_value, int attempts, Duration delay)
        : gate(concurrency_limit),
          deadline(deadline_at),
          timeout(timeout_value),
          retry_attempts(attempts),
          retry_delay(delay) {}

    AdmissionGate gate;
    const TimePoint deadline;
    const Duration timeout;
    const int retry_attempts;
    const Duration retry_delay;

    std::mutex mutex;
    std::condition_variable cv_finished;
    std::condition_variable cv_closed;
    ResultMap results;
    std::size_t pending{0};
    bool closed{false};
};

namespace {
ExecutionResult make_cancelled_result(const TargetConfig& target, const std::string& command, const std::string& reason, int attempts) {
    ExecutionResult result = make_unrun_result(target.name, command, ExecutionOutcome::Cancelled, reason);
    result.attempts = attempts;
    return result;
}

void validate_fan_out_durations(Duration timeout, Duration retry_delay) {
    if (!is_valid_duration(timeout)) {
        throw ValidationError(fmt::format("execution timeout must be positive and at most {}s", k_max_duration.count()));
    }
    if (retry_delay != Duration::zero() && !is_valid_duration(retry_delay)) {
        throw ValidationError(fmt::format("retry delay must be between 0 and {}s", k_max_duration.count()));
    }
}

std::vector<TargetConfig> unique_by_name(const std::vector<TargetConfig>& targets) {
    std::vector<TargetConfig> list_unique;
    list_unique.reserve(targets.size());
    std::set<std::string> set_seen;
    for (const TargetConfig& target : targets) {
        if (set_seen.insert(target.name).second) {
            list_unique.push_back(target);
        }
    }
    return list_unique;
}
}  // namespace

ParallelExecutor::ParallelExecutor(ConnectionPool& pool, ExecutorConfig config)
    : pool_(pool),
      config_(config),
      logger_(get_logger()) {}

ParallelExecutor::~ParallelExecutor() {
    reap_parked_workers(true);
}

ResultMap ParallelExecutor::execute_on_targets(const std::vector<TargetConfig>& targets, const std::string& command) {
    const ExecutorConfig snapshot = config();
    return execute_on_targets(targets, command, snapshot.max_concurrency, snapshot.timeout);
}

ResultMap ParallelExecutor::execute_on_targets(const std::vector<TargetConfig>& targets,
                                               const std::string& command,
                                               std::size_t concurrency_limit,
                                               Duration timeout) {
    const ExecutorConfig snapshot = config();
    return execute_with_policy(targets,
                               command,
                               FanOutPolicy{concurrency_limit, timeout, snapshot.retry_attempts, snapshot.retry_delay});
}

ResultMap ParallelExecutor::execute_with_policy(const std::vector<TargetConfig>& targets,
                                                const std::string& command,
                                                const FanOutPolicy& policy) {
    if (targets.empty()) {
        throw ValidationError("no targets specified");
    }
    validate_fan_out_durations(policy.timeout, policy.retry_delay);
    if (policy.retry_attempts < 0) {
        throw ValidationError("retry attempts cannot be negative");
    }
    reap_parked_workers(false);

    const Duration timeout = policy.timeout;
    const std::vector<TargetConfig> list_targets = unique_by_name(targets);
    const TimePoint started_at = SteadyClock::now();
    auto state = std::make_shared<FanOutState>(policy.concurrency_limit,
                                               started_at + to_steady_duration(timeout),
                                               timeout,
                                               policy.retry_attempts,
                                               policy.retry_delay);

    logger_->debug("Fan-out of '{}' to {} targets (limit {}, timeout {}s)", command, list_targets.size(), state->gate.capacity(), timeout.count());

    std::vector<std::thread> list_threads;
    list_threads.reserve(list_targets.size());
    for (const TargetConfig& target : list_targets) {
        if (!target.enabled) {
            std::scoped_lock lock(state->mutex);
            state->results.insert_or_assign(
                target.name,
                make_unrun_result(target.name, command, ExecutionOutcome::Disabled, "target is disabled")
            );
            continue;
        }
        {
            std::scoped_lock lock(state->mutex);
            ++state->pending;
        }
        try {
            list_threads.emplace_back(&ParallelExecutor::run_worker, this, state, target, command);
        } catch (const std::system_error& exc) {
            std::scoped_lock lock(state->mutex);
            --state->pending;
            state->results.insert_or_assign(
                target.name,
                make_unrun_result(target.name, command, ExecutionOutcome::ConnectionFailed, fmt::format("failed to start worker: {}", exc.what()))
            );
        }
    }

    ResultMap results;
    bool all_finished = false;
    {
        std::unique_lock lock(state->mutex);
        all_finished = state->cv_finished.wait_until(lock, state->deadline, [&state]() { return state->pending == 0; });
        if (!all_finished) {
            const std::string reason = fmt::format("cancelled: deadline of {}s elapsed", timeout.count());
            for (const TargetConfig& target : list_targets) {
                if (state->results.count(target.name) == 0) {
                    state->results.emplace(target.name, make_cancelled_result(target, command, reason, 0));
                }
            }
        }
        state->closed = true;
        results = state->results;
    }
    state->cv_closed.notify_all();
    last_peak_in_flight_.store(state->gate.peak_in_flight());

    if (all_finished) {
        for (std::thread& worker : list_threads) {
            worker.join();
        }
    } else {
        logger_->warn(R"({{"component":"executor","action":"deadline","timeout_s":{},"parked_workers":{}}})",
                      timeout.count(),
                      list_threads.size());
        std::scoped_lock lock(parked_mutex_);
        list_parked_.push_back(ParkedWorkers{state, std::move(list_threads)});
    }

    record_history(results);

    std::size_t succeeded = 0;
    for (const auto& [name, result] : results) {
        if (result.success) {
            ++succeeded;
        }
    }
    const Duration elapsed = SteadyClock::now() - started_at;
    logger_->info(R"({{"component":"executor","action":"fan_out","targets":{},"succeeded":{},"failed":{},"elapsed_s":{:.3f}}})",
                  results.size(),
                  succeeded,
                  results.size() - succeeded,
                  elapsed.count());
    return results;
}

BatchReport ParallelExecutor::execute_batch(const BatchSpec& spec) {
    if (spec.targets.empty()) {
        throw ValidationError(fmt::format("batch '{}' has no targets", spec.name));
    }
    if (spec.commands.empty()) {
        throw ValidationError(fmt::format("batch '{}' has no commands", spec.name));
    }
    std::set<std::string> set_names;
    for (std::size_t index = 0; index < spec.commands.size(); ++index) {
        const std::string name = batch_command_name(spec.commands[index], index);
        if (!set_names.insert(name).second) {
            throw ValidationError(fmt::format("batch '{}' has more than one command named '{}'", spec.name, name));
        }
    }

    const ExecutorConfig snapshot = config();
    BatchReport report{};
    report.batch_name = spec.name;
    report.total_targets = unique_by_name(spec.targets).size();
    report.start_time = SystemClock::now();
    const TimePoint started_at = SteadyClock::now();

    for (std::size_t index = 0; index < spec.commands.size(); ++index) {
        const BatchCommand& step = spec.commands[index];
        const std::string name = batch_command_name(step, index);
        const Duration timeout = step.timeout.value_or(snapshot.timeout);

        logger_->info("Batch '{}' step {}/{}: {}", spec.name, index + 1, spec.commands.size(), name);
        ResultMap step_results = execute_on_targets(spec.targets, step.command, snapshot.max_concurrency, timeout);
        const bool step_failed = std::any_of(step_results.begin(), step_results.end(), [](const auto& entry) {
            return entry.second.outcome != ExecutionOutcome::Disabled && entry.second.exit_code != 0;
        });

        report.command_order.push_back(name);
        report.results.emplace(name, std::move(step_results));

        if (spec.stop_on_failure && step_failed) {
            report.failed_at = name;
            logger_->warn(R"({{"component":"executor","action":"batch_stop","batch":"{}","failed_at":"{}"}})", json_escape(spec.name), json_escape(name));
            break;
        }
    }

    report.completed = !report.failed_at.has_value();
    report.duration = SteadyClock::now() - started_at;
    return report;
}

ExecutionStatistics ParallelExecutor::statistics() const {
    ExecutionStatistics stats{};
    Duration total_duration{};
    std::scoped_lock lock(history_mutex_);
    for (const ExecutionResult& result : deque_history_) {
        ++stats.total_executions;
        if (result.success) {
            ++stats.successful;
        } else {
            ++stats.failed;
        }
        if (result.outcome == ExecutionOutcome::Cancelled) {
            ++stats.cancelled;
        } else if (result.outcome == ExecutionOutcome::ConnectionFailed) {
            ++stats.connection_failures;
        } else if (result.outcome == ExecutionOutcome::TransportError) {
            ++stats.transport_errors;
        }
        total_duration += result.duration;
    }
    if (stats.total_executions > 0) {
        stats.average_duration = total_duration / static_cast<double>(stats.total_executions);
    }
    return stats;
}

std::vector<ExecutionResult> ParallelExecutor::history() const {
    std::scoped_lock lock(history_mutex_);
    return {deque_history_.begin(), deque_history_.end()};
}

ExecutorConfig ParallelExecutor::config() const {
    std::scoped_lock lock(config_mutex_);
    return config_;
}

std::size_t ParallelExecutor::last_peak_in_flight() const noexcept {
    return last_peak_in_flight_.load();
}

std::size_t ParallelExecutor::parked_worker_count() const {
    std::size_t running = 0;
    std::scoped_lock lock(parked_mutex_);
    for (const ParkedWorkers& parked : list_parked_) {
        std::scoped_lock state_lock(parked.state->mutex);
        running += parked.state->pending;
    }
    return running;
}

void ParallelExecutor::set_retry_policy(int attempts, Duration delay) {
    if (attempts < 0) {
        throw ValidationError("retry attempts cannot be negative");
    }
    validate_fan_out_durations(config().timeout, delay);
    std::scoped_lock lock(config_mutex_);
    config_.retry_attempts = attempts;
    config_.retry_delay = delay;
}

void ParallelExecutor::set_concurrency(std::size_t max_concurrency) {
    if (max_concurrency == 0) {
        throw ValidationError("concurrency limit must be at least 1");
    }
    std::scoped_lock lock(config_mutex_);
    config_.max_concurrency = max_concurrency;
}

void ParallelExecutor::set_timeout(Duration timeout) {
    validate_fan_out_durations(timeout, Duration::zero());
    std::scoped_lock lock(config_mutex_);
    config_.timeout = timeout;
}

void ParallelExecutor::run_worker(const std::shared_ptr<FanOutState>& state, const TargetConfig& target, const std::string& command) {
    ExecutionResult result{};
    if (!state->gate.acquire_until(state->deadline)) {
        result = make_cancelled_result(target, command, "cancelled: deadline elapsed before execution started", 0);
    } else {
        result = execute_with_retry(*state, target, command);
        state->gate.release();
    }

    {
        std::scoped_lock lock(state->mutex);
        if (!state->closed) {
            state->results.insert_or_assign(target.name, std::move(result));
        } else {
            logger_->debug("Discarding late result for {} after deadline", target.name);
        }
        --state->pending;
    }
    state->cv_finished.notify_all();
}

ExecutionResult ParallelExecutor::execute_with_retry(FanOutState& state, const TargetConfig& target, const std::string& command) {
    const TimePoint started_at = SteadyClock::now();
    const int max_attempts = std::max(0, state.retry_attempts) + 1;
    int attempts = 0;
    std::string str_last_error;

    try {
        while (attempts < max_attempts) {
            if (attempts > 0) {
                wait_for_retry(state, fmt::format("cancelled during retry wait after {} attempts: {}", attempts, str_last_error));
            }
            if (SteadyClock::now() >= state.deadline) {
                throw CancellationError("cancelled: deadline elapsed");
            }

            ++attempts;
            try {
                ExecutionResult result = execute_once(target, command);
                result.attempts = attempts;
                return result;
            } catch (const ConnectionError& exc) {
                str_last_error = exc.what();
                logger_->warn(R"({{"component":"executor","target":"{}","attempt":{},"max_attempts":{},"error":"{}"}})",
                              target.name,
                              attempts,
                              max_attempts,
                              json_escape(str_last_error));
            } catch (const std::exception& exc) {
                logger_->error("Execution on {} failed without a connection error: {}", target.name, exc.what());
                ExecutionResult result = make_unrun_result(target.name, command, ExecutionOutcome::TransportError, exc.what());
                result.attempts = attempts;
                result.duration = SteadyClock::now() - started_at;
                return result;
            }
        }
    } catch (const CancellationError& exc) {
        return make_cancelled_result(target, command, exc.what(), attempts);
    }

    ExecutionResult result = make_unrun_result(
        target.name,
        command,
        ExecutionOutcome::ConnectionFailed,
        fmt::format("failed after {} attempts: {}", attempts, str_last_error)
    );
    result.attempts = attempts;
    result.duration = SteadyClock::now() - started_at;
    return result;
}

ExecutionResult ParallelExecutor::execute_once(const TargetConfig& target, const std::string& command) {
    SessionLease lease{pool_, target};
    const TimePoint started_at = SteadyClock::now();
    try {
        ExecutionResult result = lease.transport().execute(command);
        result.target = target.name;
        if (result.command.empty()) {
            result.command = command;
        }
        result.outcome = ExecutionOutcome::Completed;
        result.success = result.exit_code == 0 && result.error.empty();
        if (result.duration == Duration::zero()) {
            result.duration = SteadyClock::now() - started_at;
        }
        if (result.timestamp == WallTime{}) {
            result.timestamp = SystemClock::now();
        }
        return result;
    } catch (const ConnectionError&) {
        lease.discard();
        throw;
    }
}

void ParallelExecutor::wait_for_retry(FanOutState& state, const std::string& reason) {
    const TimePoint wake_at = SteadyClock::now() + to_steady_duration(state.retry_delay);
    std::unique_lock lock(state.mutex);
    state.cv_closed.wait_until(lock, std::min(wake_at, state.deadline), [&state]() { return state.closed; });
    if (state.closed || SteadyClock::now() >= state.deadline) {
        throw CancellationError(reason);
    }
}

void ParallelExecutor::record_history(const ResultMap& results) {
    const std::size_t capacity = config().history_capacity;
    std::scoped_lock lock(history_mutex_);
    for (const auto& [name, result] : results) {
        deque_history_.push_back(result);
    }
    while (deque_history_.size() > capacity) {
        deque_history_.pop_front();
    }
}

void ParallelExecutor::reap_parked_workers(bool wait_all) {
    std::vector<ParkedWorkers> list_ready;
    {
        std::scoped_lock lock(parked_mutex_);
        for (auto iterator_parked = list_parked_.begin(); iterator_parked != list_parked_.end();) {
            bool finished = false;
            {
                std::scoped_lock state_lock(iterator_parked->state->mutex);
                finished = iterator_parked->state->pending == 0;
            }
            if (wait_all || finished) {
                list_ready.push_back(std::move(*iterator_parked));
                iterator_parked = list_parked_.erase(iterator_parked);
            } else {
                ++iterator_parked;
            }
        }
    }
    for (ParkedWorkers& parked : list_ready) {
        for (std::thread& worker : parked.list_threads) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
}

}  // namespace remote_fleet
