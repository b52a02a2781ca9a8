#include <gigdispatch/core/clock.hpp>

#include <chrono>

namespace gigdispatch::core {

TimePoint SystemClock::now() const {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return time_from_nanoseconds(
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count());
}

ManualClock::ManualClock(TimePoint start) noexcept
    : ns_(start.time_since_epoch().nanoseconds()) {}

TimePoint ManualClock::now() const {
    return time_from_nanoseconds(ns_.load(std::memory_order_acquire));
}

void ManualClock::advance(Duration d) noexcept {
    ns_.fetch_add(d.nanoseconds(), std::memory_order_acq_rel);
}

void ManualClock::set(TimePoint t) noexcept {
    ns_.store(t.time_since_epoch().nanoseconds(), std::memory_order_release);
}

} // namespace gigdispatch::core
