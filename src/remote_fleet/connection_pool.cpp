#include "remote_fleet/connection_pool.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "remote_fleet/errors.hpp"

namespace remote_fleet {

PooledSession::PooledSession(std::uint64_t id, std::string endpoint, TransportPtr transport, TimePoint created_at)
    : id_(id),
      str_endpoint_(std::move(endpoint)),
      transport_(std::move(transport)),
      created_at_(created_at),
      last_used_at_(created_at) {}

std::uint64_t PooledSession::id() const noexcept {
    return id_;
}

const std::string& PooledSession::endpoint() const noexcept {
    return str_endpoint_;
}

TimePoint PooledSession::created_at() const noexcept {
    return created_at_;
}

TimePoint PooledSession::last_used_at() const noexcept {
    return last_used_at_.load();
}

std::size_t PooledSession::use_count() const noexcept {
    return use_count_.load();
}

bool PooledSession::in_use() const noexcept {
    return flag_in_use_.load();
}

Transport& PooledSession::transport() noexcept {
    return *transport_;
}

ConnectionPool::ConnectionPool(PoolConfig config, TransportFactory transport_factory)
    : config_(config),
      transport_factory_(std::move(transport_factory)),
      logger_(get_logger()) {
    if (!transport_factory_) {
        throw ValidationError("connection pool requires a transport factory");
    }
    if (!is_valid_duration(config_.max_idle) || !is_valid_duration(config_.max_life) || !is_valid_duration(config_.sweep_interval)) {
        throw ValidationError(fmt::format("pool idle, life and sweep durations must be positive and at most {}s", k_max_duration.count()));
    }
}

ConnectionPool::~ConnectionPool() {
    stop_sweeper();
    close_all();
}

PooledSessionPtr ConnectionPool::acquire(const TargetConfig& target) {
    const std::string str_key = endpoint_key(target);
    const TimePoint now = SteadyClock::now();
    std::vector<PooledSessionPtr> list_stale;
    PooledSessionPtr reused;

    {
        std::scoped_lock lock(mutex_);
        const auto iterator_endpoint = map_sessions_.find(str_key);
        if (iterator_endpoint != map_sessions_.end()) {
            auto& list_sessions = iterator_endpoint->second;
            for (auto iterator_session = list_sessions.begin(); iterator_session != list_sessions.end();) {
                const PooledSessionPtr& session = *iterator_session;
                if (session->flag_in_use_.load()) {
                    ++iterator_session;
                    continue;
                }
                if (!is_reusable(*session, now)) {
                    session->flag_retired_ = true;
                    list_stale.push_back(session);
                    iterator_session = list_sessions.erase(iterator_session);
                    ++sessions_evicted_;
                    continue;
                }
                if (!reused) {
                    reused = session;
                    reused->flag_in_use_.store(true);
                    reused->last_used_at_.store(now);
                    ++reused->use_count_;
                }
                ++iterator_session;
            }
            if (list_sessions.empty()) {
                map_sessions_.erase(iterator_endpoint);
            }
        }
    }

    close_sessions(list_stale, "stale_on_acquire");
    if (reused) {
        logger_->debug("Reusing session {} for {}", reused->id(), str_key);
        return reused;
    }

    TransportPtr transport;
    try {
        transport = transport_factory_(target);
    } catch (const std::exception& exc) {
        throw ConnectionError(fmt::format("failed to create transport for {}: {}", str_key, exc.what()));
    }
    if (!transport) {
        throw ConnectionError(fmt::format("no transport available for {}", str_key));
    }

    try {
        transport->connect(target.connect_timeout);
    } catch (const ConnectionError&) {
        throw;
    } catch (const std::exception& exc) {
        throw ConnectionError(fmt::format("failed to connect to {}: {}", str_key, exc.what()));
    }

    std::scoped_lock lock(mutex_);
    auto session = std::make_shared<PooledSession>(next_session_id_++, str_key, std::move(transport), SteadyClock::now());
    session->flag_in_use_.store(true);
    session->use_count_.store(1);
    map_sessions_[str_key].push_back(session);
    ++sessions_created_;
    logger_->debug(R"({{"component":"pool","action":"open","session":{},"endpoint":"{}"}})", session->id(), str_key);
    return session;
}

bool ConnectionPool::release(const PooledSessionPtr& session) {
    if (!session) {
        return false;
    }
    bool close_now = false;
    {
        std::scoped_lock lock(mutex_);
        if (!session->flag_in_use_.load()) {
            logger_->debug("Ignoring release of session {} that is not checked out", session->id());
            return false;
        }
        session->flag_in_use_.store(false);
        session->last_used_at_.store(SteadyClock::now());
        close_now = session->flag_retired_;
    }
    if (close_now) {
        close_sessions({session}, "retired");
    }
    return true;
}

void ConnectionPool::discard(const PooledSessionPtr& session) {
    if (!session) {
        return;
    }
    {
        std::scoped_lock lock(mutex_);
        session->flag_in_use_.store(false);
        if (!session->flag_retired_) {
            session->flag_retired_ = true;
            const auto iterator_endpoint = map_sessions_.find(session->endpoint());
            if (iterator_endpoint != map_sessions_.end()) {
                auto& list_sessions = iterator_endpoint->second;
                list_sessions.erase(std::remove(list_sessions.begin(), list_sessions.end(), session), list_sessions.end());
                if (list_sessions.empty()) {
                    map_sessions_.erase(iterator_endpoint);
                }
            }
            ++sessions_evicted_;
        }
    }
    close_sessions({session}, "discarded");
}

std::size_t ConnectionPool::sweep() {
    return sweep(SteadyClock::now());
}

std::size_t ConnectionPool::sweep(TimePoint now) {
    std::vector<PooledSessionPtr> list_evicted;
    {
        std::scoped_lock lock(mutex_);
        for (auto iterator_endpoint = map_sessions_.begin(); iterator_endpoint != map_sessions_.end();) {
            auto& list_sessions = iterator_endpoint->second;
            for (auto iterator_session = list_sessions.begin(); iterator_session != list_sessions.end();) {
                const PooledSessionPtr& session = *iterator_session;
                if (session->flag_in_use_.load() || is_reusable(*session, now)) {
                    ++iterator_session;
                    continue;
                }
                session->flag_retired_ = true;
                list_evicted.push_back(session);
                iterator_session = list_sessions.erase(iterator_session);
            }
            if (list_sessions.empty()) {
                iterator_endpoint = map_sessions_.erase(iterator_endpoint);
            } else {
                ++iterator_endpoint;
            }
        }
        sessions_evicted_ += list_evicted.size();
    }
    close_sessions(list_evicted, "sweep");
    return list_evicted.size();
}

void ConnectionPool::start_sweeper() {
    if (flag_sweeper_running_.exchange(true)) {
        return;
    }
    {
        std::scoped_lock lock(sweeper_mutex_);
        flag_sweeper_stop_ = false;
    }
    logger_->info("Starting pool sweeper every {}s", config_.sweep_interval.count());
    sweeper_thread_ = std::thread(&ConnectionPool::sweeper_loop, this);
}

void ConnectionPool::stop_sweeper() {
    if (!flag_sweeper_running_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(sweeper_mutex_);
        flag_sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
}

void ConnectionPool::close_all() {
    std::vector<PooledSessionPtr> list_closed;
    {
        std::scoped_lock lock(mutex_);
        for (auto& [endpoint, list_sessions] : map_sessions_) {
            for (const PooledSessionPtr& session : list_sessions) {
                session->flag_retired_ = true;
                list_closed.push_back(session);
            }
        }
        map_sessions_.clear();
    }
    close_sessions(list_closed, "close_all");
}

std::size_t ConnectionPool::retire_endpoint(const TargetConfig& target) {
    const std::string str_key = endpoint_key(target);
    std::vector<PooledSessionPtr> list_closed;
    std::size_t retired_count = 0;
    {
        std::scoped_lock lock(mutex_);
        const auto iterator_endpoint = map_sessions_.find(str_key);
        if (iterator_endpoint == map_sessions_.end()) {
            return 0;
        }
        for (const PooledSessionPtr& session : iterator_endpoint->second) {
            session->flag_retired_ = true;
            if (!session->flag_in_use_.load()) {
                list_closed.push_back(session);
            }
            ++retired_count;
        }
        map_sessions_.erase(iterator_endpoint);
        sessions_evicted_ += retired_count;
    }
    close_sessions(list_closed, "retired");
    return retired_count;
}

bool ConnectionPool::has_live_session(const TargetConfig& target) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_endpoint = map_sessions_.find(endpoint_key(target));
    if (iterator_endpoint == map_sessions_.end()) {
        return false;
    }
    return std::any_of(iterator_endpoint->second.begin(), iterator_endpoint->second.end(), [](const PooledSessionPtr& session) {
        return session->transport_->is_connected();
    });
}

std::optional<TimePoint> ConnectionPool::last_activity(const TargetConfig& target) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_endpoint = map_sessions_.find(endpoint_key(target));
    if (iterator_endpoint == map_sessions_.end()) {
        return std::nullopt;
    }
    std::optional<TimePoint> optional_latest;
    for (const PooledSessionPtr& session : iterator_endpoint->second) {
        const TimePoint activity = session->transport_->last_activity();
        if (!optional_latest.has_value() || activity > optional_latest.value()) {
            optional_latest = activity;
        }
    }
    return optional_latest;
}

PoolStatistics ConnectionPool::statistics() const {
    PoolStatistics stats{};
    stats.max_idle = config_.max_idle;
    stats.max_life = config_.max_life;

    std::scoped_lock lock(mutex_);
    stats.endpoints = map_sessions_.size();
    stats.sessions_created = sessions_created_;
    stats.sessions_evicted = sessions_evicted_;
    for (const auto& [endpoint, list_sessions] : map_sessions_) {
        for (const PooledSessionPtr& session : list_sessions) {
            ++stats.total_sessions;
            if (session->flag_in_use_.load()) {
                ++stats.active_sessions;
            } else {
                ++stats.idle_sessions;
            }
        }
    }
    return stats;
}

const PoolConfig& ConnectionPool::config() const noexcept {
    return config_;
}

bool ConnectionPool::is_reusable(const PooledSession& session, TimePoint now) const {
    if (session.flag_retired_) {
        return false;
    }
    if (now - session.created_at_ > to_steady_duration(config_.max_life)) {
        return false;
    }
    if (now - session.last_used_at_.load() > to_steady_duration(config_.max_idle)) {
        return false;
    }
    return session.transport_->is_connected();
}

void ConnectionPool::close_sessions(const std::vector<PooledSessionPtr>& list_sessions, const char* reason) {
    for (const PooledSessionPtr& session : list_sessions) {
        try {
            session->transport_->close();
            logger_->debug(R"({{"component":"pool","action":"close","session":{},"endpoint":"{}","reason":"{}"}})",
                           session->id(),
                           session->endpoint(),
                           reason);
        } catch (const std::exception& exc) {
            logger_->warn(R"({{"component":"pool","action":"close","session":{},"endpoint":"{}","error":"{}"}})",
                          session->id(),
                          session->endpoint(),
                          json_escape(exc.what()));
        }
    }
}

void ConnectionPool::sweeper_loop() {
    std::unique_lock lock(sweeper_mutex_);
    while (!flag_sweeper_stop_) {
        const bool stop_requested = sweeper_cv_.wait_for(lock, to_steady_duration(config_.sweep_interval), [this]() {
            return flag_sweeper_stop_;
        });
        if (stop_requested) {
            break;
        }
        lock.unlock();
        try {
            const std::size_t evicted_count = sweep();
            if (evicted_count > 0) {
                logger_->info(R"({{"component":"pool","action":"sweep","evicted":{}}})", evicted_count);
            }
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"pool","action":"sweep","error":"{}"}})", json_escape(exc.what()));
        }
        lock.lock();
    }
}

SessionLease::SessionLease(ConnectionPool& pool, const TargetConfig& target)
    : pool_(pool),
      session_(pool.acquire(target)) {}

SessionLease::~SessionLease() {
    if (session_) {
        pool_.release(session_);
    }
}

Transport& SessionLease::transport() noexcept {
    return session_->transport();
}

const PooledSessionPtr& SessionLease::session() const noexcept {
    return session_;
}

void SessionLease::discard() {
    if (session_) {
        pool_.discard(session_);
        session_.reset();
    }
}

}  // namespace remote_fleet
