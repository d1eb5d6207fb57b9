#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace hazard {

// Thread-safe bounded queue. A full buffer drops its oldest item so that
// producers of live data never block.
template <typename T>
class FrameBuffer {
public:
    explicit FrameBuffer(size_t max_items = 4) : max_items_(max_items == 0 ? 1 : max_items) {}

    // Returns true when an older item was dropped to make room.
    bool push(T item) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (stopped_) return false;
            if (queue_.size() >= max_items_) {
                queue_.pop_front();
                dropped = true;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return dropped;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [&] { return !queue_.empty() || stopped_; });
        return take(out);
    }

    bool pop_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || stopped_; });
        return take(out);
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mu_);
        queue_.clear();
        stopped_ = false;
    }

    bool stopped() const {
        std::lock_guard<std::mutex> lock(mu_);
        return stopped_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

private:
    // Caller holds mu_. Items still queued after stop() are drained.
    bool take(T& out) {
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    size_t max_items_;
    std::deque<T> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool stopped_{false};
};

}  // namespace hazard
