#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace spacepkt {

// Result of attempting to push to the channel
enum class PushResult : std::uint8_t {
    Ok,
    Full,    // try_push only: no free slot
    Closed   // Channel was closed, item not delivered
};

// A bounded, fixed-capacity FIFO channel between one producer and any
// number of consumers. Each item is delivered to exactly one consumer.
//
// Backpressure: push() blocks while the channel is full, so no item is
// ever dropped. close() wakes every waiter; consumers then drain what is
// left and observe end-of-stream (nullopt).
//
// Thread safety: safe for concurrent push/pop/close.
//
// Template parameter T must be movable.
template <typename T>
class BoundedChannel {
public:
    // A capacity of 0 is treated as 1.
    explicit BoundedChannel(std::size_t capacity)
        : buffer_(capacity == 0 ? 1 : capacity)
        , capacity_(buffer_.size()) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Push an item, waiting for room. Returns Closed if the channel is
    // (or becomes) closed before the item could be queued.
    PushResult push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || size_ < capacity_; });
        if (closed_) {
            return PushResult::Closed;
        }
        emplace_locked(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return PushResult::Ok;
    }

    // Push without waiting. Returns Full if no slot is free.
    PushResult try_push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return PushResult::Closed;
        }
        if (size_ >= capacity_) {
            return PushResult::Full;
        }
        emplace_locked(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return PushResult::Ok;
    }

    // Pop the oldest item, waiting while empty.
    // Returns nullopt once the channel is closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || size_ > 0; });
        if (size_ == 0) {
            return std::nullopt;
        }
        T item = take_locked();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    // Pop without waiting. Returns nullopt if empty.
    std::optional<T> try_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (size_ == 0) {
            return std::nullopt;
        }
        T item = take_locked();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    // Close the channel. Idempotent. Items already queued stay poppable.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Current number of items in the channel
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    // Maximum capacity
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    // Number of items ever accepted (cumulative)
    [[nodiscard]] std::uint64_t total_pushed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_pushed_;
    }

private:
    void emplace_locked(T&& item) {
        buffer_[tail_].emplace(std::move(item));
        tail_ = (tail_ + 1) % capacity_;
        ++size_;
        ++total_pushed_;
    }

    T take_locked() {
        T item = std::move(*buffer_[head_]);
        buffer_[head_].reset();
        head_ = (head_ + 1) % capacity_;
        --size_;
        return item;
    }

    // Slots hold optional<T> so T need not be default-constructible
    std::vector<std::optional<T>> buffer_;
    std::size_t capacity_;
    std::size_t head_ = 0;  // index of next item to pop
    std::size_t tail_ = 0;  // index of next slot to push
    std::size_t size_ = 0;  // current number of items
    std::uint64_t total_pushed_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

}  // namespace spacepkt
