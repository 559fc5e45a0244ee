#include "remote_fleet/fleet_event_bus.hpp"

#include <algorithm>
#include <utility>

namespace remote_fleet {

FleetEventBus::FleetEventBus(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

void FleetEventBus::publish(FleetEvent event) {
    if (event.timestamp == WallTime{}) {
        event.timestamp = SystemClock::now();
    }
    std::scoped_lock lock(mutex_);
    while (queue_events_.size() >= capacity_) {
        queue_events_.pop();
        ++dropped_;
    }
    queue_events_.push(std::move(event));
}

void FleetEventBus::publish(FleetEventType type, std::string subject, std::string message) {
    publish(FleetEvent{type, std::move(subject), std::move(message), SystemClock::now()});
}

std::optional<FleetEvent> FleetEventBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    FleetEvent event = std::move(queue_events_.front());
    queue_events_.pop();
    return event;
}

std::size_t FleetEventBus::size() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

std::size_t FleetEventBus::capacity() const noexcept {
    return capacity_;
}

std::size_t FleetEventBus::dropped_count() const {
    std::scoped_lock lock(mutex_);
    return dropped_;
}

std::string_view to_string(FleetEventType type) noexcept {
    switch (type) {
        case FleetEventType::TargetAdded:
            return "target_added";
        case FleetEventType::TargetRemoved:
            return "target_removed";
        case FleetEventType::TargetUpdated:
            return "target_updated";
        case FleetEventType::ClusterCreated:
            return "cluster_created";
        case FleetEventType::ClusterDeleted:
            return "cluster_deleted";
        case FleetEventType::MemberAdded:
            return "member_added";
        case FleetEventType::MemberRemoved:
            return "member_removed";
        case FleetEventType::HealthChanged:
            return "health_changed";
    }
    return "unknown";
}

}  // namespace remote_fleet
