#pragma once

/**
 * @file frame_queue.h
 * @brief Bounded lock-free queue between audio capture and the listener
 */

#include "common.h"
#include <atomic>
#include <vector>

namespace voxgate {

/**
 * @brief Fixed-capacity queue of whole items
 *
 * Thread-safe for single-producer single-consumer usage. push() never
 * blocks: when the queue is full it returns false and the caller decides
 * what to do with the item (the listener drops and counts it).
 */
template<typename T>
class SpscQueue {
public:
    explicit SpscQueue(size_t capacity)
        : buffer_(capacity > 0 ? capacity : 1)
        , capacity_(capacity > 0 ? capacity : 1)
        , write_pos_(0)
        , read_pos_(0)
        , size_(0) {}

    size_t capacity() const { return capacity_; }

    size_t size() const { return size_.load(std::memory_order_acquire); }

    bool empty() const { return size() == 0; }

    bool full() const { return size() == capacity_; }

    /// Producer side. False when full; item is left untouched.
    bool push(T&& item) {
        if (full()) return false;

        size_t write_idx = write_pos_.load(std::memory_order_relaxed);
        buffer_[write_idx] = std::move(item);
        write_pos_.store((write_idx + 1) % capacity_, std::memory_order_relaxed);
        size_.fetch_add(1, std::memory_order_release);
        return true;
    }

    /// Consumer side. False when empty.
    bool pop(T& out) {
        if (empty()) return false;

        size_t read_idx = read_pos_.load(std::memory_order_relaxed);
        out = std::move(buffer_[read_idx]);
        buffer_[read_idx] = T{};
        read_pos_.store((read_idx + 1) % capacity_, std::memory_order_relaxed);
        size_.fetch_sub(1, std::memory_order_release);
        return true;
    }

    /// Consumer side only
    void clear() {
        T discard;
        while (pop(discard)) {}
    }

private:
    std::vector<T> buffer_;
    size_t capacity_;
    std::atomic<size_t> write_pos_;
    std::atomic<size_t> read_pos_;
    std::atomic<size_t> size_;
};

using FrameQueue = SpscQueue<AudioFrame>;

} // namespace voxgate
