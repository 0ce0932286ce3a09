// src/system/Timer.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

// Monotonic time source.  The engine reads the steady clock; tests swap in
// a clock they can advance by hand.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration   = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }

    // Process-wide instance used when no clock is injected.
    static const SteadyClock& instance();
};

// 8-bit countdown register that decays at tick_hz × speed steps per second.
//
// The current value is never stored.  get() derives it from the time of the
// last set() and the step count elapsed since then, both measured from a
// fixed origin and truncated to whole steps, so reads taken at different
// instants never double count a step and the value cannot skip or underflow
// no matter how rarely the register is polled.
class Timer {
public:
    static constexpr double DEFAULT_HZ = 60.0;

    explicit Timer(const Clock& clock = SteadyClock::instance(),
                   double tick_hz = DEFAULT_HZ, double speed = 1.0);

    void    set(uint8_t value);
    uint8_t get() const;

    // Countdown left until the register reaches zero, or nullopt at rest.
    std::optional<std::chrono::nanoseconds> time_remaining() const;

    void   set_speed(double speed) { speed_ = speed; }
    double speed() const { return speed_; }
    double tick_hz() const { return tick_hz_; }

private:
    const Clock&      clock_;
    Clock::time_point start_;
    Clock::time_point last_set_;
    uint8_t           last_value_ = 0;
    double            tick_hz_;
    double            speed_;

    uint64_t steps_at(Clock::time_point t) const;
};
