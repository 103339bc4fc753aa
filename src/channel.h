#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

enum class PopStatus {
    Item,
    Timeout,
    Closed,
};

// Unbounded multi-producer, single-consumer FIFO with a close marker.
// Items pushed before close() are still delivered; pop reports Closed only
// once the queue is both closed and empty. push() after close() is dropped.
//
// The consumer calls task_done() after handling each item so that producers
// can wait_drained() for every item to be fully processed.
template <typename T>
class Channel {
public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return false;
            items_.push_back(std::move(item));
            ++unfinished_;
        }
        cv_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Blocks until an item is available or the channel is closed and empty.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !items_.empty() || closed_; });
        return take_locked(out);
    }

    template <typename Clock, typename Duration>
    PopStatus pop_until(T& out, const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_until(lk, deadline, [this] { return !items_.empty() || closed_; })) {
            return PopStatus::Timeout;
        }
        return take_locked(out) ? PopStatus::Item : PopStatus::Closed;
    }

    void task_done() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (unfinished_ > 0) --unfinished_;
        }
        drained_cv_.notify_all();
    }

    // Blocks until every pushed item has been popped and marked done.
    void wait_drained() {
        std::unique_lock<std::mutex> lk(mtx_);
        drained_cv_.wait(lk, [this] { return unfinished_ == 0; });
    }

    // As wait_drained(), but gives up at the deadline. True once drained.
    template <typename Clock, typename Duration>
    bool wait_drained_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lk(mtx_);
        return drained_cv_.wait_until(lk, deadline, [this] { return unfinished_ == 0; });
    }

    // Closes the channel and throws away everything not yet popped.
    // Returns how many items were dropped.
    std::size_t discard() {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
            dropped = items_.size();
            items_.clear();
            unfinished_ -= std::min(unfinished_, dropped);
        }
        cv_.notify_all();
        drained_cv_.notify_all();
        return dropped;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

private:
    bool take_locked(T& out) {
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::deque<T> items_;
    std::size_t unfinished_ = 0;
    bool closed_ = false;
};
