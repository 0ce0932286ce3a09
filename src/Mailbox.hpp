// src/Mailbox.hpp
#pragma once
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

enum class SendResult { OK, FULL, CLOSED };
enum class RecvResult { OK, EMPTY, CLOSED };

// Single-slot handoff between two threads.  Holds at most one value; values
// are moved in and out, never shared.
//
// try_put() drops the value if the slot is occupied (latest state wins on the
// next attempt).  put() waits until the slot is free.  Either side calling
// close() wakes every waiter and fails all later operations, which is how
// the two threads tell each other to stop.
template <typename T>
class Mailbox {
public:
    SendResult try_put(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return SendResult::CLOSED;
        if (slot_)   return SendResult::FULL;
        slot_ = std::move(value);
        cond_.notify_all();
        return SendResult::OK;
    }

    // Blocks until the slot is free.  Returns false if the mailbox closed.
    bool put(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return closed_ || !slot_; });
        if (closed_) return false;
        slot_ = std::move(value);
        cond_.notify_all();
        return true;
    }

    RecvResult try_take(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slot_) {
            out = std::move(*slot_);
            slot_.reset();
            cond_.notify_all();
            return RecvResult::OK;
        }
        return closed_ ? RecvResult::CLOSED : RecvResult::EMPTY;
    }

    // Blocks until a value arrives.  Returns nullopt once closed and empty.
    std::optional<T> take() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return closed_ || slot_.has_value(); });
        if (!slot_) return std::nullopt;
        std::optional<T> out = std::move(slot_);
        slot_.reset();
        cond_.notify_all();
        return out;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cond_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex      mutex_;
    std::condition_variable cond_;
    std::optional<T>        slot_;
    bool                    closed_ = false;
};
