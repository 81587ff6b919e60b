// SpscQueue.hpp - Bounded single-producer / single-consumer channel
//
// Carries Chunk values from the generator thread and TransformResult values
// from the analysis thread to whoever displays them (the monitoring loop in
// main.cpp here). Lock-free: the producer owns mTail, the consumer owns
// mHead, and each publishes its index with a release store.
//
// A full queue rejects the push; the producer counts the drop and moves on.
// Slots are pre-constructed, so T must be default-constructible and
// move-assignable.

#pragma once

#include <atomic>
#include <cstddef>
#include <utility>
#include <vector>

template <typename T>
class SpscQueue {
public:
    /// Holds up to `capacity` items.
    explicit SpscQueue(size_t capacity)
        : mSlots(capacity + 1) {}

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    // ── Producer side ────────────────────────────────────────────────────

    bool tryPush(T value) {
        const size_t tail = mTail.load(std::memory_order_relaxed);
        const size_t next = increment(tail);
        if (next == mHead.load(std::memory_order_acquire)) {
            return false;   // full
        }
        mSlots[tail] = std::move(value);
        mTail.store(next, std::memory_order_release);
        return true;
    }

    // ── Consumer side ────────────────────────────────────────────────────

    bool tryPop(T& out) {
        const size_t head = mHead.load(std::memory_order_relaxed);
        if (head == mTail.load(std::memory_order_acquire)) {
            return false;   // empty
        }
        out = std::move(mSlots[head]);
        mSlots[head] = T{};
        mHead.store(increment(head), std::memory_order_release);
        return true;
    }

    bool empty() const {
        return mHead.load(std::memory_order_acquire) == mTail.load(std::memory_order_acquire);
    }

    size_t capacity() const { return mSlots.size() - 1; }

private:
    size_t increment(size_t i) const { return (i + 1) % mSlots.size(); }

    std::vector<T> mSlots;
    std::atomic<size_t> mHead{0};
    std::atomic<size_t> mTail{0};
};
