#include "remote_fleet/admission_gate.hpp"

#include <algorithm>

namespace remote_fleet {

AdmissionGate::AdmissionGate(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

void AdmissionGate::acquire() {
    std::unique_lock lock(mutex_);
    cv_slot_free_.wait(lock, [this]() { return in_flight_ < capacity_; });
    ++in_flight_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
}

bool AdmissionGate::acquire_until(TimePoint deadline) {
    std::unique_lock lock(mutex_);
    if (!cv_slot_free_.wait_until(lock, deadline, [this]() { return in_flight_ < capacity_; })) {
        return false;
    }
    ++in_flight_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
    return true;
}

void AdmissionGate::release() {
    {
        std::scoped_lock lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    cv_slot_free_.notify_one();
}

std::size_t AdmissionGate::capacity() const noexcept {
    return capacity_;
}

std::size_t AdmissionGate::in_flight() const {
    std::scoped_lock lock(mutex_);
    return in_flight_;
}

std::size_t AdmissionGate::peak_in_flight() const {
    std::scoped_lock lock(mutex_);
    return peak_in_flight_;
}

}  // namespace remote_fleet
