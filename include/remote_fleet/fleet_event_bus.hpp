// === Fleet Event Bus =========================================================
//
// Provides a bounded thread-safe queue recording target and cluster lifecycle
// events for whoever wants to observe the fleet. When nobody drains it the
// oldest events are dropped once the capacity is reached.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

#include "remote_fleet/types.hpp"

namespace remote_fleet {

enum class FleetEventType {
    TargetAdded,
    TargetRemoved,
    TargetUpdated,
    ClusterCreated,
    ClusterDeleted,
    MemberAdded,
    MemberRemoved,
    HealthChanged
};

/** @brief Wrapper representing a single lifecycle publication. */
struct FleetEvent final {
    FleetEventType type{FleetEventType::TargetAdded};
    std::string subject{};    /**< Target or cluster name. */
    std::string message{};
    WallTime timestamp{};
};

/** @brief Thread-safe bounded FIFO used to exchange fleet events. */
class FleetEventBus final {
  public:
    /** @brief @p capacity of zero is treated as one. */
    explicit FleetEventBus(std::size_t capacity = 1000);

    /** @brief Publish an event; stamps the timestamp when unset. */
    void publish(FleetEvent event);
    /** @brief Convenience overload building the event in place. */
    void publish(FleetEventType type, std::string subject, std::string message);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<FleetEvent> try_consume();
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept;
    /** @brief Events discarded because the queue was full. */
    [[nodiscard]] std::size_t dropped_count() const;

  private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::queue<FleetEvent> queue_events_;
    std::size_t dropped_{0};
};

[[nodiscard]] std::string_view to_string(FleetEventType type) noexcept;

}  // namespace remote_fleet
