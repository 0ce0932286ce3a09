// src/PerfLimiter.hpp
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

// Sleep-until-next-slot rate limiter with an achieved-rate readout.
//
// Used three ways: to cap instructions per second on the engine thread, to
// cap frames per second on the frontend, and (with a 1/s rate and
// wait_nonblocking) as a once-per-second ticker for diagnostics.
class PerfLimiter {
public:
    // Above this rate the clock is only read every rate/100 calls.
    static constexpr double BATCH_THRESHOLD = 100.0;

    // No limit, or a limit of 0, never sleeps.
    explicit PerfLimiter(std::optional<double> limit);

    // Count one event; sleep until its slot if we are ahead of schedule.
    void wait();

    // True while the current slot is still running.  Once it has elapsed,
    // starts the next one, counts an event and returns false.
    bool wait_nonblocking();

    // Events per second since the previous call.
    double rate();

    uint64_t count() const { return counter_; }
    double   limit() const { return limit_; }

private:
    using clock = std::chrono::steady_clock;

    double            limit_;
    uint64_t          every_nth_;
    uint64_t          nth_counter_ = 0;
    uint64_t          counter_      = 0;
    uint64_t          last_counter_ = 0;
    clock::time_point last_check_;
    clock::time_point last_rate_check_;
};
