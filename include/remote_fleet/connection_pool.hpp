// === Connection Pool =========================================================
//
// Caches live transport sessions keyed by endpoint (`user@host:port`) so that
// consecutive commands against the same target reuse one session. Sessions are
// checked out exclusively: a session handed out by acquire() is never given to
// a second caller until it is released. A background sweeper evicts free
// sessions that exceeded their maximum lifetime or idle time, or whose
// transport reports it is no longer connected.
//
// The pool lock only guards bookkeeping. Connecting, executing and closing a
// transport always happen outside it.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "remote_fleet/logging.hpp"
#include "remote_fleet/transport.hpp"

namespace remote_fleet {

/** @brief Lifetime bounds and sweep cadence for pooled sessions. */
struct PoolConfig final {
    Duration max_idle{Duration{300.0}};        /**< Longest a free session may sit unused. */
    Duration max_life{Duration{1800.0}};       /**< Longest a session may exist at all. */
    Duration sweep_interval{Duration{60.0}};   /**< Period of the background sweep. */
};

/** @brief A cached transport session bound to one endpoint. */
class PooledSession final {
  public:
    PooledSession(std::uint64_t id, std::string endpoint, TransportPtr transport, TimePoint created_at);

    /** @brief Pool-unique identity; a replacement session always gets a new id. */
    [[nodiscard]] std::uint64_t id() const noexcept;
    [[nodiscard]] const std::string& endpoint() const noexcept;
    [[nodiscard]] TimePoint created_at() const noexcept;
    [[nodiscard]] TimePoint last_used_at() const noexcept;
    [[nodiscard]] std::size_t use_count() const noexcept;
    [[nodiscard]] bool in_use() const noexcept;
    /** @brief Underlying transport. Only valid to drive while checked out. */
    [[nodiscard]] Transport& transport() noexcept;

  private:
    friend class ConnectionPool;

    std::uint64_t id_;
    std::string str_endpoint_;
    TransportPtr transport_;
    TimePoint created_at_;
    std::atomic<TimePoint> last_used_at_;
    std::atomic<std::size_t> use_count_{0};
    std::atomic<bool> flag_in_use_{false};
    bool flag_retired_{false};
};

using PooledSessionPtr = std::shared_ptr<PooledSession>;

/** @brief Point-in-time pool counters. */
struct PoolStatistics final {
    std::size_t total_sessions{};
    std::size_t active_sessions{};
    std::size_t idle_sessions{};
    std::size_t endpoints{};
    std::size_t sessions_created{};
    std::size_t sessions_evicted{};
    Duration max_idle{};
    Duration max_life{};
};

/** @brief Session cache with TTL eviction. */
class ConnectionPool final {
  public:
    ConnectionPool(PoolConfig config, TransportFactory transport_factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Check out a session for @p target.
     *
     * Reuses a free, connected session within its idle and lifetime bounds;
     * otherwise opens a new one. Throws ConnectionError when the transport
     * cannot be established.
     */
    [[nodiscard]] PooledSessionPtr acquire(const TargetConfig& target);
    /**
     * @brief Return a session to the pool.
     *
     * Returns false, and changes nothing, if the session is not checked out.
     */
    bool release(const PooledSessionPtr& session);
    /** @brief Evict and close a checked-out session whose transport failed. */
    void discard(const PooledSessionPtr& session);

    /** @brief Evict stale free sessions as of now. Returns the eviction count. */
    std::size_t sweep();
    /** @brief Evict stale free sessions as of @p now. Returns the eviction count. */
    std::size_t sweep(TimePoint now);

    /** @brief Start the periodic background sweep. Idempotent. */
    void start_sweeper();
    /** @brief Stop and join the background sweep. Idempotent. */
    void stop_sweeper();

    /** @brief Close every session, including checked-out ones, and empty the pool. */
    void close_all();
    /**
     * @brief Drop every session for @p target's endpoint.
     *
     * Free sessions are closed immediately; checked-out ones are closed when
     * released. Returns the number of sessions dropped.
     */
    std::size_t retire_endpoint(const TargetConfig& target);

    /** @brief Whether any pooled session for @p target is connected. */
    [[nodiscard]] bool has_live_session(const TargetConfig& target) const;
    /** @brief Most recent transport activity across @p target's sessions. */
    [[nodiscard]] std::optional<TimePoint> last_activity(const TargetConfig& target) const;
    [[nodiscard]] PoolStatistics statistics() const;
    [[nodiscard]] const PoolConfig& config() const noexcept;

  private:
    /** @brief Whether a free session may be handed out at @p now; caller holds mutex_. */
    [[nodiscard]] bool is_reusable(const PooledSession& session, TimePoint now) const;
    /** @brief Close transports outside the lock, logging failures. */
    void close_sessions(const std::vector<PooledSessionPtr>& list_sessions, const char* reason);
    void sweeper_loop();

    PoolConfig config_;
    TransportFactory transport_factory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<PooledSessionPtr>> map_sessions_;
    std::uint64_t next_session_id_{1};
    std::size_t sessions_created_{0};
    std::size_t sessions_evicted_{0};

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool flag_sweeper_stop_{false};
    std::atomic<bool> flag_sweeper_running_{false};
    std::thread sweeper_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Scoped checkout: acquires on construction, releases on destruction.
 */
class SessionLease final {
  public:
    SessionLease(ConnectionPool& pool, const TargetConfig& target);
    ~SessionLease();

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    [[nodiscard]] Transport& transport() noexcept;
    [[nodiscard]] const PooledSessionPtr& session() const noexcept;
    /** @brief Evict the session instead of releasing it. */
    void discard();

  private:
    ConnectionPool& pool_;
    PooledSessionPtr session_;
};

}  // namespace remote_fleet
