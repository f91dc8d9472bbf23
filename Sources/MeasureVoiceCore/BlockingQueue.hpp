#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace mv {

/// Bounded multi-producer queue handing work to a single consumer thread.
///
/// push() never blocks: when the queue is full the oldest item is dropped
/// and counted.  close() wakes the consumer; pop() returns false once the
/// queue is closed and empty.
template <typename T>
class BlockingQueue {
public:
    /// A capacity of 0 means unbounded.
    explicit BlockingQueue(size_t capacity = 0) : capacity_(capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /// Returns false, queueing nothing, once the queue is closed.
    /// `dropped` receives how many items were evicted to make room.
    bool push(T item, size_t* dropped = nullptr) {
        size_t evicted = 0;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            if (capacity_ > 0 && items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
                evicted = 1;
            }
            items_.push_back(std::move(item));
        }
        if (dropped) *dropped = evicted;
        cv_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [&] { return closed_ || !items_.empty(); });
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Drop everything still queued.  Returns how many items went.
    size_t clear() {
        std::lock_guard<std::mutex> lock(mu_);
        size_t n = items_.size();
        items_.clear();
        return n;
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return items_.size();
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mu_);
        return dropped_;
    }

private:
    const size_t            capacity_;
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<T>           items_;
    size_t                  dropped_ = 0;
    bool                    closed_  = false;
};

} // namespace mv
