// src/PerfLimiter.cpp
#include "PerfLimiter.hpp"
#include <thread>

PerfLimiter::PerfLimiter(std::optional<double> limit)
    : limit_(limit.value_or(0.0)),
      every_nth_(limit_ >= BATCH_THRESHOLD
                 ? static_cast<uint64_t>(limit_ / BATCH_THRESHOLD) : 1),
      last_check_(clock::now()),
      last_rate_check_(last_check_) {}

void PerfLimiter::wait() {
    counter_++;

    if (every_nth_ > 1) {
        if (nth_counter_ < every_nth_ - 1) {
            nth_counter_++;
            return;
        }
        nth_counter_ = 0;
    }

    auto now = clock::now();
    if (limit_ <= 0.0) {
        last_check_ = now;
        return;
    }

    // The batch of every_nth_ events owns every_nth_ slots of 1/limit each.
    std::chrono::duration<double> slot(static_cast<double>(every_nth_) / limit_);
    auto due = last_check_ + std::chrono::duration_cast<clock::duration>(slot);
    if (now >= due) {
        last_check_ = now;
        return;
    }
    std::this_thread::sleep_until(due);
    last_check_ = clock::now();
}

bool PerfLimiter::wait_nonblocking() {
    auto now = clock::now();
    if (limit_ > 0.0) {
        std::chrono::duration<double> slot(1.0 / limit_);
        if (now - last_check_ < slot) return true;
    }
    last_check_ = now;
    counter_++;
    return false;
}

double PerfLimiter::rate() {
    auto now = clock::now();
    std::chrono::duration<double> elapsed = now - last_rate_check_;
    double r = elapsed.count() > 0.0
             ? static_cast<double>(counter_ - last_counter_) / elapsed.count()
             : 0.0;
    last_rate_check_ = now;
    last_counter_    = counter_;
    return r;
}
