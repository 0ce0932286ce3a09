// src/system/Timer.cpp
#include "Timer.hpp"

const SteadyClock& SteadyClock::instance() {
    static const SteadyClock clock;
    return clock;
}

Timer::Timer(const Clock& clock, double tick_hz, double speed)
    : clock_(clock),
      start_(clock.now()),
      last_set_(start_),
      tick_hz_(tick_hz),
      speed_(speed) {}

void Timer::set(uint8_t value) {
    last_set_   = clock_.now();
    last_value_ = value;
}

uint64_t Timer::steps_at(Clock::time_point t) const {
    std::chrono::duration<double> since_start = t - start_;
    double steps = since_start.count() * tick_hz_ * speed_;
    return steps > 0.0 ? static_cast<uint64_t>(steps) : 0;
}

uint8_t Timer::get() const {
    if (last_value_ == 0) return 0;

    // Truncate both step counts before subtracting; subtracting first and
    // truncating after would let two reads disagree about the same step.
    uint64_t now_steps = steps_at(clock_.now());
    uint64_t set_steps = steps_at(last_set_);
    uint64_t elapsed   = now_steps > set_steps ? now_steps - set_steps : 0;

    if (elapsed >= last_value_) return 0;
    return static_cast<uint8_t>(last_value_ - elapsed);
}

std::optional<std::chrono::nanoseconds> Timer::time_remaining() const {
    uint8_t value = get();
    if (value == 0) return std::nullopt;

    std::chrono::duration<double> secs(value / (tick_hz_ * speed_));
    return std::chrono::duration_cast<std::chrono::nanoseconds>(secs);
}
