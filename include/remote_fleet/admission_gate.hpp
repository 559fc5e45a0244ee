// === Admission Gate ==========================================================
//
// Counting gate bounding how many executions run at once. Instrumented with the
// current and peak number of holders so the concurrency ceiling can be
// observed.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "remote_fleet/types.hpp"

namespace remote_fleet {

/** @brief Bounded counting semaphore with in-flight instrumentation. */
class AdmissionGate final {
  public:
    /** @brief Gate admitting at most @p capacity holders; a capacity of 0 is treated as 1. */
    explicit AdmissionGate(std::size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    /** @brief Block until a slot is free, then take it. */
    void acquire();
    /** @brief Take a slot, giving up at @p deadline. Returns whether a slot was taken. */
    [[nodiscard]] bool acquire_until(TimePoint deadline);
    /** @brief Hand a slot back. */
    void release();

    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] std::size_t in_flight() const;
    /** @brief Highest number of simultaneous holders observed. */
    [[nodiscard]] std::size_t peak_in_flight() const;

  private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_slot_free_;
    std::size_t in_flight_{0};
    std::size_t peak_in_flight_{0};
};

}  // namespace remote_fleet
